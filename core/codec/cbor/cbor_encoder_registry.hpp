/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include "codec/cbor/cbor_encoder.hpp"
#include "codec/cbor/cbor_errors.hpp"
#include "common/logger.hpp"

namespace ic::codec::cbor {
  /**
   * Ordered set of encoders. Encoder for a value is the matching one with
   * the lowest priority number, on equal priority the one added first wins.
   * Registry is assembled once and then shared read-only.
   */
  class EncoderRegistry {
   public:
    using EncoderPtr = std::shared_ptr<const ValueEncoder>;

    EncoderRegistry();

    /**
     * Creates registry with encoders of null, undefined, bool, integers,
     * double, string, list, map and tagged values
     */
    static EncoderRegistry withDefaultEncoders();

    void addEncoder(EncoderPtr encoder);

    /**
     * Removes all encoders with given name
     * @return true if any encoder was removed
     */
    bool removeEncoder(std::string_view name);

    /**
     * Selects encoder for value
     * @return encoder or CborEncodeError::kNoEncoderForType
     */
    outcome::result<EncoderPtr> encoderFor(const Value &value) const;

    /** Encodes one item, errors are raised */
    CborEncodeStream encodeItem(const Value &value) const;

    /**
     * Encodes value as single CBOR item
     * @param value - value tree
     * @return CBOR bytes
     */
    outcome::result<Bytes> encode(const Value &value) const;

    /**
     * Encodes value prefixed by self-describe tag 55799
     * @param value - value tree
     * @return CBOR bytes
     */
    outcome::result<Bytes> serialize(const Value &value) const;

    const std::vector<EncoderPtr> &encoders() const;

   private:
    std::vector<EncoderPtr> encoders_;
    common::Logger logger_;
  };
}  // namespace ic::codec::cbor
