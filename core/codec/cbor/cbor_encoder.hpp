/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "codec/cbor/cbor_encode_stream.hpp"
#include "codec/cbor/cbor_value.hpp"

namespace ic::codec::cbor {
  class EncoderRegistry;

  /// Priority of base encoders, custom encoders with lower number override
  constexpr int kDefaultEncoderPriority{2};

  /**
   * Encoding rule for one kind of value
   */
  class ValueEncoder {
   public:
    virtual ~ValueEncoder() = default;

    /** Unique name, used to remove encoder from registry */
    virtual std::string_view name() const = 0;

    /** Lower number wins when several encoders match same value */
    virtual int priority() const = 0;

    /**
     * Checks if encoder is applicable, by held type only
     * @param value - value to check
     * @return true if value can be encoded
     */
    virtual bool match(const Value &value) const = 0;

    /**
     * Encodes value as single CBOR item
     * @param value - value accepted by `match`
     * @param registry - registry to encode nested values with
     * @return stream with one item, errors are raised
     */
    virtual CborEncodeStream encode(const Value &value,
                                    const EncoderRegistry &registry) const = 0;
  };

  /**
   * Encoder matching values of exactly type T
   * @tparam T - held value type
   */
  template <typename T>
  class TypedValueEncoder : public ValueEncoder {
   public:
    bool match(const Value &value) const override {
      return value.is<T>();
    }

    CborEncodeStream encode(const Value &value,
                            const EncoderRegistry &registry) const override {
      return encodeTyped(*value.get<T>(), registry);
    }

   protected:
    virtual CborEncodeStream encodeTyped(
        const T &value, const EncoderRegistry &registry) const = 0;
  };
}  // namespace ic::codec::cbor
