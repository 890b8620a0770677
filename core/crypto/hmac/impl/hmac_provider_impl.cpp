/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hmac/impl/hmac_provider_impl.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace ic::crypto::hmac {
  outcome::result<Hmac512> HmacProviderImpl::hmacSha512(
      BytesIn key, BytesIn message) const {
    Hmac512 code{};
    unsigned int length{};
    if (HMAC(EVP_sha512(),
             key.data(),
             static_cast<int>(key.size()),
             message.data(),
             message.size(),
             code.data(),
             &length)
            == nullptr
        || length != code.size()) {
      return HmacError::kHmacFailed;
    }
    return code;
  }
}  // namespace ic::crypto::hmac

OUTCOME_CPP_DEFINE_CATEGORY(ic::crypto::hmac, HmacError, e) {
  using ic::crypto::hmac::HmacError;
  switch (e) {
    case HmacError::kHmacFailed:
      return "HmacError: HMAC computation failed";
  }
  return "HmacError: unknown error";
}
