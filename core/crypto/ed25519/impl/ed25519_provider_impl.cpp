/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ed25519/impl/ed25519_provider_impl.hpp"

#include <algorithm>
#include <memory>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "crypto/ed25519/ed25519_error.hpp"

namespace ic::crypto::ed25519 {
  namespace {
    /// Seed part of secret key, bare seed is accepted too
    outcome::result<BytesIn> seedOf(BytesIn secret_key) {
      if (secret_key.size() != kSecretKeyLength
          && secret_key.size() != kSeedLength) {
        return Ed25519Error::kInvalidKeyLength;
      }
      return secret_key.first(kSeedLength);
    }

    std::shared_ptr<EVP_PKEY> privateKey(BytesIn seed) {
      return {EVP_PKEY_new_raw_private_key(
                  EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()),
              EVP_PKEY_free};
    }
  }  // namespace

  outcome::result<KeyPair> Ed25519ProviderImpl::generate() const {
    Seed seed{};
    if (RAND_bytes(seed.data(), seed.size()) != 1) {
      return Ed25519Error::kKeyGenerationFailed;
    }
    auto key_pair{generateFromSeed(seed)};
    OPENSSL_cleanse(seed.data(), seed.size());
    return key_pair;
  }

  outcome::result<KeyPair> Ed25519ProviderImpl::generateFromSeed(
      BytesIn seed) const {
    if (seed.size() != kSeedLength) {
      return Ed25519Error::kInvalidSeedLength;
    }
    KeyPair key_pair{};
    OUTCOME_TRY(public_key, derive(seed));
    key_pair.public_key = public_key;
    std::copy(seed.begin(), seed.end(), key_pair.secret_key.begin());
    std::copy(public_key.begin(),
              public_key.end(),
              key_pair.secret_key.begin() + kSeedLength);
    return key_pair;
  }

  outcome::result<PublicKey> Ed25519ProviderImpl::derive(
      BytesIn secret_key) const {
    OUTCOME_TRY(seed, seedOf(secret_key));
    auto key{privateKey(seed)};
    if (!key) {
      return Ed25519Error::kKeyGenerationFailed;
    }
    PublicKey public_key{};
    size_t length{public_key.size()};
    if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &length) != 1
        || length != public_key.size()) {
      return Ed25519Error::kKeyGenerationFailed;
    }
    return public_key;
  }

  outcome::result<Signature> Ed25519ProviderImpl::sign(
      BytesIn message, BytesIn secret_key) const {
    OUTCOME_TRY(seed, seedOf(secret_key));
    auto key{privateKey(seed)};
    std::shared_ptr<EVP_MD_CTX> context{EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (!key || !context) {
      return Ed25519Error::kSignFailed;
    }
    if (EVP_DigestSignInit(context.get(), nullptr, nullptr, nullptr, key.get())
        != 1) {
      return Ed25519Error::kSignFailed;
    }
    Signature signature{};
    size_t length{signature.size()};
    if (EVP_DigestSign(context.get(),
                       signature.data(),
                       &length,
                       message.data(),
                       message.size())
            != 1
        || length != signature.size()) {
      return Ed25519Error::kSignFailed;
    }
    return signature;
  }

  outcome::result<bool> Ed25519ProviderImpl::verify(BytesIn message,
                                                    BytesIn signature,
                                                    BytesIn public_key) const {
    if (public_key.size() != kPublicKeyLength) {
      return Ed25519Error::kInvalidKeyLength;
    }
    if (signature.size() != kSignatureLength) {
      return false;
    }
    std::shared_ptr<EVP_PKEY> key{
        EVP_PKEY_new_raw_public_key(
            EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()),
        EVP_PKEY_free};
    std::shared_ptr<EVP_MD_CTX> context{EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (!key || !context) {
      return Ed25519Error::kVerifyFailed;
    }
    if (EVP_DigestVerifyInit(
            context.get(), nullptr, nullptr, nullptr, key.get())
        != 1) {
      return Ed25519Error::kVerifyFailed;
    }
    return EVP_DigestVerify(context.get(),
                            signature.data(),
                            signature.size(),
                            message.data(),
                            message.size())
           == 1;
  }

}  // namespace ic::crypto::ed25519
