/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include "codec/json/json_errors.hpp"
#include "common/bytes.hpp"

namespace ic::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;
  using JIn = const Value *;

  outcome::result<Document> parse(std::string_view input);

  outcome::result<Document> parse(BytesIn input);

  outcome::result<std::string> format(JIn j);
  outcome::result<std::string> format(Document &&doc);

  /// Returns own member of object
  outcome::result<JIn> jGet(JIn j, std::string_view key);

  outcome::result<std::string_view> jStr(JIn j);

  /// Decodes hex string
  outcome::result<Bytes> jUnhex(JIn j);

  /// Decodes array of integers 0..255
  outcome::result<Bytes> jByteArray(JIn j);

  /// Decodes array items with `f`
  template <typename F,
            typename T = typename std::invoke_result_t<F, JIn>::value_type>
  inline outcome::result<std::vector<T>> jList(JIn j, const F &f) {
    if (!j->IsArray()) {
      return JsonError::kWrongType;
    }
    std::vector<T> list;
    list.reserve(j->Size());
    for (const auto &it : j->GetArray()) {
      OUTCOME_TRY(item, f(&it));
      list.push_back(std::move(item));
    }
    return list;
  }

  outcome::result<int64_t> jInt(JIn j);

  outcome::result<uint64_t> jUint(JIn j);
}  // namespace ic::codec::json
