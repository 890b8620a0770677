/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <type_traits>

/// Declares `operator<<` of type for CBOR encode stream
#define CBOR_ENCODE(type, var)                                            \
  template <class Stream,                                                 \
            typename = std::enable_if_t<                                  \
                std::remove_reference_t<Stream>::is_cbor_encoder_stream>> \
  Stream &operator<<(Stream &&s,                                          \
                     const type &var)  // NOLINT(bugprone-macro-parentheses)

/// Declares `operator>>` of type for CBOR decode stream
#define CBOR_DECODE(type, var)                                            \
  template <class Stream,                                                 \
            typename = std::enable_if_t<                                  \
                std::remove_reference_t<Stream>::is_cbor_decoder_stream>> \
  Stream &operator>>(Stream &&s,                                          \
                     type &var)  // NOLINT(bugprone-macro-parentheses)

namespace ic::codec::cbor {
  class CborDecodeStream;
  class CborEncodeStream;

  /// Tag of unsigned bignum, byte string with big-endian magnitude
  constexpr uint64_t kTagPositiveBignum{2};
  /// Tag of negative bignum, byte string with big-endian magnitude
  constexpr uint64_t kTagNegativeBignum{3};
  /// Reserved by the protocol, not produced by encoder
  constexpr uint64_t kTagUint64LittleEndian{71};
  /// Self-describe CBOR tag prefixing every serialized message
  constexpr uint64_t kTagSelfDescribe{55799};

  /// CBOR `undefined` simple value
  struct CborUndefined {};
  inline bool operator==(const CborUndefined &, const CborUndefined &) {
    return true;
  }
}  // namespace ic::codec::cbor
