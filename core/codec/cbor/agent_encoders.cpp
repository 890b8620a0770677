/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/agent_encoders.hpp"

namespace ic::codec::cbor {
  using primitives::BigInt;
  using primitives::principal::Principal;

  std::string_view PrincipalEncoder::name() const {
    return "Principal";
  }

  int PrincipalEncoder::priority() const {
    return 0;
  }

  CborEncodeStream PrincipalEncoder::encodeTyped(
      const Principal &principal, const EncoderRegistry &) const {
    CborEncodeStream s;
    s << principal;
    return s;
  }

  std::string_view BufferEncoder::name() const {
    return "Buffer";
  }

  int BufferEncoder::priority() const {
    return 1;
  }

  CborEncodeStream BufferEncoder::encodeTyped(const Bytes &bytes,
                                              const EncoderRegistry &) const {
    CborEncodeStream s;
    s << bytes;
    return s;
  }

  std::string_view BigIntEncoder::name() const {
    return "BigNumber";
  }

  int BigIntEncoder::priority() const {
    return 1;
  }

  CborEncodeStream BigIntEncoder::encodeTyped(const BigInt &big_int,
                                              const EncoderRegistry &) const {
    CborEncodeStream s;
    s << big_int;
    return s;
  }

  EncoderRegistry makeAgentEncoderRegistry() {
    auto registry{EncoderRegistry::withDefaultEncoders()};
    registry.addEncoder(std::make_shared<PrincipalEncoder>());
    registry.addEncoder(std::make_shared<BufferEncoder>());
    registry.addEncoder(std::make_shared<BigIntEncoder>());
    return registry;
  }
}  // namespace ic::codec::cbor
