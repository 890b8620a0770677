/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/bytes.hpp"

namespace ic::common::span {
  /// Views characters as bytes
  inline BytesIn cbytes(std::string_view str) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto data{reinterpret_cast<const uint8_t *>(str.data())};
    return gsl::make_span(data, data + str.size());
  }

  /// Views bytes as characters
  inline std::string_view bytestr(BytesIn bytes) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const char *>(bytes.data()),
            static_cast<size_t>(bytes.size())};
  }
}  // namespace ic::common::span
