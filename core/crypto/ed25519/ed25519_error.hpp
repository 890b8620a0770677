/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ic::crypto::ed25519 {

  enum class Ed25519Error {
    kInvalidKeyLength = 1,
    kInvalidSeedLength,
    kInvalidCertificateLength,
    kCertificatePrefixMismatch,
    kKeyGenerationFailed,
    kSignFailed,
    kVerifyFailed,
  };

}

OUTCOME_HPP_DECLARE_ERROR(ic::crypto::ed25519, Ed25519Error);
