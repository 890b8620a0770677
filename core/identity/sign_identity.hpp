/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace ic::identity {
  /**
   * Public key of any signature scheme
   */
  class PublicKey {
   public:
    virtual ~PublicKey() = default;

    /** DER-encoded key, as sent to replicas */
    virtual Bytes toDer() const = 0;
  };

  /**
   * Identity able to sign requests
   */
  class SignIdentity {
   public:
    virtual ~SignIdentity() = default;

    virtual const PublicKey &getPublicKey() const = 0;

    /**
     * @brief Creates detached signature
     * @param blob - data to sign
     * @return signature bytes
     */
    virtual outcome::result<Bytes> sign(BytesIn blob) const = 0;
  };
}  // namespace ic::identity
