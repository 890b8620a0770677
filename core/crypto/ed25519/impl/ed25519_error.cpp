/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ed25519/ed25519_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ic::crypto::ed25519, Ed25519Error, e) {
  using ic::crypto::ed25519::Ed25519Error;
  switch (e) {
    case Ed25519Error::kInvalidKeyLength:
      return "Ed25519Error: invalid key length";
    case Ed25519Error::kInvalidSeedLength:
      return "Ed25519Error: seed must be 32 bytes long";
    case Ed25519Error::kInvalidCertificateLength:
      return "Ed25519Error: DER-encoded public key must be 44 bytes long";
    case Ed25519Error::kCertificatePrefixMismatch:
      return "Ed25519Error: DER-encoded public key has invalid prefix";
    case Ed25519Error::kKeyGenerationFailed:
      return "Ed25519Error: key generation failed";
    case Ed25519Error::kSignFailed:
      return "Ed25519Error: error when signing";
    case Ed25519Error::kVerifyFailed:
      return "Ed25519Error: error when verifying";

    default:
      return "Ed25519Error: unknown error";
  }
}
