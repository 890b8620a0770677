/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace ic::crypto::hmac {
  using Hmac512 = BytesN<64>;

  enum class HmacError {
    kHmacFailed = 1,
  };

  /**
   * Keyed message authentication codes
   */
  class HmacProvider {
   public:
    virtual ~HmacProvider() = default;

    /**
     * @brief Computes HMAC-SHA-512
     * @param key - secret key
     * @param message - authenticated data
     * @return 64 bytes code or HmacError::kHmacFailed
     */
    virtual outcome::result<Hmac512> hmacSha512(BytesIn key,
                                                BytesIn message) const = 0;
  };
}  // namespace ic::crypto::hmac

OUTCOME_HPP_DECLARE_ERROR(ic::crypto::hmac, HmacError);
