/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/identity_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ic::identity, IdentityError, e) {
  using E = ic::identity::IdentityError;
  switch (e) {
    case E::kDeserializationError:
      return "Deserialization error: invalid JSON identity";
    case E::kKeyDerivationFailure:
      return "Key derivation from seed failed";
  }
  return "unknown IdentityError error code";
}
