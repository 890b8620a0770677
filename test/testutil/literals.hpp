/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/hexutil.hpp"

inline ic::Bytes operator""_unhex(const char *c, size_t s) {
  return ic::common::unhex(std::string_view(c, s)).value();
}
