/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "common/hexutil.hpp"
#include "common/span.hpp"

namespace ic::codec::json {
  using rapidjson::StringBuffer;

  outcome::result<Document> parse(std::string_view input) {
    Document doc;
    doc.Parse(input.data(), input.size());
    if (doc.HasParseError()) {
      return JsonError::kParseError;
    }
    return std::move(doc);
  }

  outcome::result<Document> parse(BytesIn input) {
    return parse(common::span::bytestr(input));
  }

  outcome::result<std::string> format(JIn j) {
    StringBuffer buffer;
    rapidjson::Writer<StringBuffer> writer{buffer};
    if (j->Accept(writer)) {
      return std::string{buffer.GetString(), buffer.GetSize()};
    }
    return JsonError::kFormatError;
  }

  outcome::result<std::string> format(Document &&doc) {
    return format(&doc);
  }

  outcome::result<JIn> jGet(JIn j, std::string_view key) {
    if (!j->IsObject()) {
      return JsonError::kWrongType;
    }
    const Value name{rapidjson::StringRef(
        key.data(), static_cast<rapidjson::SizeType>(key.size()))};
    auto it{j->FindMember(name)};
    if (it == j->MemberEnd()) {
      return JsonError::kKeyNotFound;
    }
    return &it->value;
  }

  outcome::result<std::string_view> jStr(JIn j) {
    if (j->IsString()) {
      return std::string_view{j->GetString(), j->GetStringLength()};
    }
    return JsonError::kWrongType;
  }

  outcome::result<Bytes> jUnhex(JIn j) {
    OUTCOME_TRY(str, jStr(j));
    return common::unhex(str);
  }

  outcome::result<Bytes> jByteArray(JIn j) {
    return jList(j, [](JIn item) -> outcome::result<uint8_t> {
      OUTCOME_TRY(byte, jUint(item));
      if (byte > 0xFF) {
        return JsonError::kOutOfRange;
      }
      return static_cast<uint8_t>(byte);
    });
  }

  outcome::result<int64_t> jInt(JIn j) {
    if (j->IsInt64()) {
      return j->GetInt64();
    }
    return j->IsNumber() ? JsonError::kOutOfRange : JsonError::kWrongType;
  }

  outcome::result<uint64_t> jUint(JIn j) {
    if (j->IsUint64()) {
      return j->GetUint64();
    }
    return j->IsNumber() ? JsonError::kOutOfRange : JsonError::kWrongType;
  }
}  // namespace ic::codec::json
