/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <gsl/span>
#include <vector>

#include "common/cmp.hpp"

namespace ic {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;
  using BytesOut = gsl::span<uint8_t>;

  template <size_t N>
  using BytesN = std::array<uint8_t, N>;

  inline Bytes copy(BytesIn r) {
    return {r.begin(), r.end()};
  }
  void copy(Bytes &&) = delete;

  inline void copy(Bytes &l, BytesIn r) {
    l.assign(r.begin(), r.end());
  }

  inline void append(Bytes &l, BytesIn r) {
    l.insert(l.end(), r.begin(), r.end());
  }
}  // namespace ic

namespace gsl {
  inline bool operator==(const ic::Bytes &l, const ic::BytesIn &r) {
    return ic::BytesIn{l} == r;
  }
  inline bool operator==(const ic::BytesIn &l, const ic::Bytes &r) {
    return l == ic::BytesIn{r};
  }
  IC_OPERATOR_NOT_EQUAL_2(ic::Bytes, ic::BytesIn)
  IC_OPERATOR_NOT_EQUAL_2(ic::BytesIn, ic::Bytes)
}  // namespace gsl
