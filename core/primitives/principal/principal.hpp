/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "codec/cbor/cbor_common.hpp"
#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace ic::primitives::principal {
  /**
   * @brief Potential errors creating principals
   */
  enum class PrincipalError {
    kInvalidText = 1, /**< Text is not a hex principal representation */
  };

  /**
   * @brief Principal identifies protocol participant, canister or user.
   * Opaque bytes on the wire, lower-case hex in text form.
   */
  class Principal {
   public:
    Principal() = default;

    static Principal fromBytes(BytesIn bytes);

    /**
     * @brief Parses hex text, odd number of digits is padded with leading
     * zero nibble
     * @param text - hex digits without prefix
     * @return principal or PrincipalError::kInvalidText
     */
    static outcome::result<Principal> fromText(std::string_view text);

    const Bytes &toBytes() const;

    std::string toText() const;

    bool operator==(const Principal &other) const;
    bool operator!=(const Principal &other) const;
    bool operator<(const Principal &other) const;

   private:
    explicit Principal(Bytes bytes);

    Bytes bytes_;
  };

  CBOR_ENCODE(Principal, principal) {
    return s << principal.toBytes();
  }

  CBOR_DECODE(Principal, principal) {
    principal = Principal::fromBytes(s.template get<Bytes>());
    return s;
  }
}  // namespace ic::primitives::principal

OUTCOME_HPP_DECLARE_ERROR(ic::primitives::principal, PrincipalError);
