/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/cbor_encoder_registry.hpp"
#include "codec/cbor/cbor_value.hpp"

namespace ic::codec::cbor {
  /// Name of the field decoded into principal
  constexpr std::string_view kCanisterIdField{"canister_id"};

  /// Deepest nesting of lists, maps and tags accepted by `decode`
  constexpr size_t kMaxNesting{1024};

  /**
   * @brief Encodes value tree with self-describe tag prefix
   * @param registry - encoders to select from
   * @param value - value to encode
   * @return CBOR bytes or CborEncodeError
   */
  outcome::result<Bytes> encode(const EncoderRegistry &registry,
                                const Value &value);

  /**
   * @brief Encodes value tree with agent registry built on first use
   * @param value - value to encode
   * @return CBOR bytes or CborEncodeError
   */
  outcome::result<Bytes> encode(const Value &value);

  /**
   * @brief Decodes first CBOR item of input, trailing bytes are ignored.
   * Self-describe tag is skipped at any depth. Integer `canister_id` field of
   * top-level map is replaced by principal parsed from its hex text.
   * @param input - CBOR bytes
   * @return value tree or CborDecodeError
   */
  outcome::result<Value> decode(BytesIn input);
}  // namespace ic::codec::cbor
