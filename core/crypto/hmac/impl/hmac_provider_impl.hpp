/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hmac/hmac_provider.hpp"

namespace ic::crypto::hmac {
  /**
   * OpenSSL implementation of HMAC provider
   */
  class HmacProviderImpl : public HmacProvider {
   public:
    outcome::result<Hmac512> hmacSha512(BytesIn key,
                                        BytesIn message) const override;
  };
}  // namespace ic::crypto::hmac
