/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ic::identity {
  enum class IdentityError {
    kDeserializationError = 1,
    kKeyDerivationFailure,
  };
}  // namespace ic::identity

OUTCOME_HPP_DECLARE_ERROR(ic::identity, IdentityError);
