/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/cbor_encoder_registry.hpp"
#include "primitives/big_int.hpp"
#include "primitives/principal/principal.hpp"

namespace ic::codec::cbor {
  /// Encodes principal as byte string of its canonical bytes
  class PrincipalEncoder
      : public TypedValueEncoder<primitives::principal::Principal> {
   public:
    std::string_view name() const override;
    int priority() const override;

   protected:
    CborEncodeStream encodeTyped(
        const primitives::principal::Principal &principal,
        const EncoderRegistry &registry) const override;
  };

  /// Encodes opaque buffer verbatim as byte string
  class BufferEncoder : public TypedValueEncoder<Bytes> {
   public:
    std::string_view name() const override;
    int priority() const override;

   protected:
    CborEncodeStream encodeTyped(
        const Bytes &bytes, const EncoderRegistry &registry) const override;
  };

  /// Encodes arbitrary precision integer as bignum, see big_int.hpp
  class BigIntEncoder : public TypedValueEncoder<primitives::BigInt> {
   public:
    std::string_view name() const override;
    int priority() const override;

   protected:
    CborEncodeStream encodeTyped(
        const primitives::BigInt &big_int,
        const EncoderRegistry &registry) const override;
  };

  /**
   * Creates registry used by agent: base encoders, then principal (priority
   * 0), buffer (1) and bigint (1) encoders.
   */
  EncoderRegistry makeAgentEncoderRegistry();
}  // namespace ic::codec::cbor
