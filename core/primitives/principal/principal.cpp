/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/principal/principal.hpp"

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ic::primitives::principal, PrincipalError, e) {
  using ic::primitives::principal::PrincipalError;
  switch (e) {
    case (PrincipalError::kInvalidText):
      return "Failed to create principal: text is not a hex string";
  }
  return "Failed to create principal: unknown error";
}

namespace ic::primitives::principal {
  Principal::Principal(Bytes bytes) : bytes_{std::move(bytes)} {}

  Principal Principal::fromBytes(BytesIn bytes) {
    return Principal{copy(bytes)};
  }

  outcome::result<Principal> Principal::fromText(std::string_view text) {
    if (text.empty()) {
      return PrincipalError::kInvalidText;
    }
    std::string padded;
    if (text.size() % 2 != 0) {
      padded.reserve(text.size() + 1);
      padded += '0';
      padded += text;
      text = padded;
    }
    auto bytes{common::unhex(text)};
    if (!bytes) {
      return PrincipalError::kInvalidText;
    }
    return Principal{std::move(bytes.value())};
  }

  const Bytes &Principal::toBytes() const {
    return bytes_;
  }

  std::string Principal::toText() const {
    return common::hex_lower(bytes_);
  }

  bool Principal::operator==(const Principal &other) const {
    return bytes_ == other.bytes_;
  }

  bool Principal::operator!=(const Principal &other) const {
    return !(*this == other);
  }

  bool Principal::operator<(const Principal &other) const {
    return bytes_ < other.bytes_;
  }
}  // namespace ic::primitives::principal
