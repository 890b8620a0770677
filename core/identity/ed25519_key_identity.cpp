/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/ed25519_key_identity.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "codec/json/json.hpp"
#include "common/hexutil.hpp"
#include "common/span.hpp"
#include "crypto/ed25519/impl/ed25519_provider_impl.hpp"
#include "crypto/hmac/impl/hmac_provider_impl.hpp"

namespace ic::identity {
  using codec::json::JIn;
  using codec::json::jByteArray;
  using codec::json::jGet;
  using codec::json::jUnhex;
  using crypto::ed25519::Ed25519ProviderImpl;
  using crypto::ed25519::kSeedLength;
  using crypto::hmac::HmacProviderImpl;

  namespace {
    common::Logger logger() {
      static common::Logger logger{common::createLogger("identity")};
      return logger;
    }

    std::shared_ptr<const Ed25519Provider> defaultEd25519() {
      static std::shared_ptr<const Ed25519Provider> provider{
          std::make_shared<Ed25519ProviderImpl>()};
      return provider;
    }

    /// Reads `j[key].data` byte array
    outcome::result<Bytes> jDataOf(JIn j, std::string_view key) {
      OUTCOME_TRY(field, jGet(j, key));
      OUTCOME_TRY(data, jGet(field, "data"));
      return jByteArray(data);
    }

    /// Keys of one of accepted JSON shapes, public key is raw or DER
    struct JsonKeys {
      Bytes public_key;
      bool public_key_der;
      Bytes secret_key;
    };

    outcome::result<JsonKeys> jKeys(JIn j) {
      if (j->IsArray()) {
        const auto array{j->GetArray()};
        if (array.Size() < 2) {
          return codec::json::JsonError::kWrongType;
        }
        OUTCOME_TRY(public_key, jUnhex(&array[0]));
        OUTCOME_TRY(secret_key, jUnhex(&array[1]));
        return JsonKeys{std::move(public_key), true, std::move(secret_key)};
      }
      if (auto public_key{jDataOf(j, "publicKey")}) {
        OUTCOME_TRY(secret_key, jDataOf(j, "secretKey"));
        return JsonKeys{
            std::move(public_key.value()), false, std::move(secret_key)};
      }
      OUTCOME_TRY(public_key, jDataOf(j, "_publicKey"));
      OUTCOME_TRY(secret_key, jDataOf(j, "_privateKey"));
      return JsonKeys{std::move(public_key), true, std::move(secret_key)};
    }
  }  // namespace

  outcome::result<Ed25519KeyIdentity> Ed25519KeyIdentity::generate(
      std::shared_ptr<const Ed25519Provider> ed25519,
      boost::optional<BytesIn> seed) {
    crypto::ed25519::KeyPair key_pair;
    if (seed) {
      logger()->debug("generate key from seed");
      OUTCOME_TRYA(key_pair, ed25519->generateFromSeed(*seed));
    } else {
      logger()->debug("generate random key");
      OUTCOME_TRYA(key_pair, ed25519->generate());
    }
    OUTCOME_TRY(public_key, Ed25519PublicKey::fromRaw(key_pair.public_key));
    return Ed25519KeyIdentity{
        std::move(public_key), copy(key_pair.secret_key), std::move(ed25519)};
  }

  outcome::result<Ed25519KeyIdentity> Ed25519KeyIdentity::generate(
      boost::optional<BytesIn> seed) {
    return generate(defaultEd25519(), seed);
  }

  outcome::result<Ed25519KeyIdentity> Ed25519KeyIdentity::fromSeedWithSlip0010(
      BytesIn seed,
      const HmacProvider &hmac,
      std::shared_ptr<const Ed25519Provider> ed25519) {
    auto code{hmac.hmacSha512(common::span::cbytes(kSlip0010Key), seed)};
    if (!code) {
      logger()->debug("key derivation failed: {}", code.error().message());
      return IdentityError::kKeyDerivationFailure;
    }
    return generate(std::move(ed25519),
                    BytesIn{code.value()}.first(kSeedLength));
  }

  outcome::result<Ed25519KeyIdentity> Ed25519KeyIdentity::fromSeedWithSlip0010(
      BytesIn seed) {
    return fromSeedWithSlip0010(seed, HmacProviderImpl{}, defaultEd25519());
  }

  outcome::result<Ed25519KeyIdentity> Ed25519KeyIdentity::fromKeyPair(
      BytesIn public_key, BytesIn secret_key) {
    OUTCOME_TRY(key, Ed25519PublicKey::fromRaw(public_key));
    return Ed25519KeyIdentity{std::move(key), copy(secret_key), defaultEd25519()};
  }

  outcome::result<Ed25519KeyIdentity> Ed25519KeyIdentity::fromJSON(
      std::string_view json) {
    auto doc{codec::json::parse(json)};
    if (!doc) {
      logger()->debug("identity JSON is not valid JSON");
      return IdentityError::kDeserializationError;
    }
    auto keys{jKeys(&doc.value())};
    if (!keys) {
      logger()->debug("invalid identity JSON shape: {}",
                      keys.error().message());
      return IdentityError::kDeserializationError;
    }
    auto &[public_key, public_key_der, secret_key]{keys.value()};
    OUTCOME_TRY(key,
                public_key_der ? Ed25519PublicKey::fromDer(public_key)
                               : Ed25519PublicKey::fromRaw(public_key));
    return Ed25519KeyIdentity{
        std::move(key), std::move(secret_key), defaultEd25519()};
  }

  std::string Ed25519KeyIdentity::toJSON() const {
    const auto der_hex{common::hex_lower(public_key_.toDer())};
    const auto secret_hex{common::hex_lower(secret_key_)};
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};
    writer.StartArray();
    writer.String(der_hex.data(),
                  static_cast<rapidjson::SizeType>(der_hex.size()));
    writer.String(secret_hex.data(),
                  static_cast<rapidjson::SizeType>(secret_hex.size()));
    writer.EndArray();
    return {buffer.GetString(), buffer.GetSize()};
  }

  const PublicKey &Ed25519KeyIdentity::getPublicKey() const {
    return public_key_;
  }

  Ed25519KeyPair Ed25519KeyIdentity::getKeyPair() const {
    return {public_key_, secret_key_};
  }

  outcome::result<Bytes> Ed25519KeyIdentity::sign(BytesIn blob) const {
    OUTCOME_TRY(signature, ed25519_->sign(blob, secret_key_));
    return copy(signature);
  }

  outcome::result<bool> Ed25519KeyIdentity::verify(BytesIn blob,
                                                   BytesIn signature) const {
    return ed25519_->verify(blob, signature, public_key_.toRaw());
  }

  Ed25519KeyIdentity::Ed25519KeyIdentity(
      Ed25519PublicKey public_key,
      Bytes secret_key,
      std::shared_ptr<const Ed25519Provider> ed25519)
      : public_key_{std::move(public_key)},
        secret_key_{std::move(secret_key)},
        ed25519_{std::move(ed25519)} {}
}  // namespace ic::identity
