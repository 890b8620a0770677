/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_value.hpp"

#include <boost/lexical_cast.hpp>

#include "codec/cbor/cbor_common.hpp"
#include "common/hexutil.hpp"
#include "primitives/big_int.hpp"
#include "primitives/principal/principal.hpp"

namespace ic::codec::cbor {
  using primitives::BigInt;
  using primitives::principal::Principal;

  const Value *ValueMap::find(std::string_view key) const {
    for (const auto &pair : *this) {
      if (pair.first == key) {
        return &pair.second;
      }
    }
    return nullptr;
  }

  Value *ValueMap::find(std::string_view key) {
    for (auto &pair : *this) {
      if (pair.first == key) {
        return &pair.second;
      }
    }
    return nullptr;
  }

  Value &ValueMap::operator[](std::string_view key) {
    if (auto value{find(key)}) {
      return *value;
    }
    emplace_back(std::string{key}, Value{});
    return back().second;
  }

  namespace {
    // NOLINTNEXTLINE(readability-function-cognitive-complexity,misc-no-recursion)
    void dumpValue(std::string &o, const Value &value) {
      if (value.empty()) {
        o += "(empty)";
      } else if (value.is<std::nullptr_t>()) {
        o += "N";
      } else if (value.is<CborUndefined>()) {
        o += "U";
      } else if (auto b{value.get<bool>()}) {
        o += *b ? "T" : "F";
      } else if (auto u{value.get<uint64_t>()}) {
        o += "+" + std::to_string(*u);
      } else if (auto i{value.get<int64_t>()}) {
        if (*i >= 0) {
          o += "+";
        }
        o += std::to_string(*i);
      } else if (auto d{value.get<double>()}) {
        o += boost::lexical_cast<std::string>(*d);
      } else if (auto str{value.get<std::string>()}) {
        o += "^" + *str;
      } else if (auto bytes{value.get<Bytes>()}) {
        o += bytes->empty() ? "~" : common::hex_lower(*bytes);
      } else if (auto big{value.get<BigInt>()}) {
        o += "big:" + boost::lexical_cast<std::string>(*big);
      } else if (auto principal{value.get<Principal>()}) {
        o += "principal:" + principal->toText();
      } else if (auto tagged{value.get<CborTagged>()}) {
        o += "tag" + std::to_string(tagged->tag) + "(";
        dumpValue(o, tagged->value);
        o += ")";
      } else if (auto list{value.get<ValueList>()}) {
        o += "[";
        auto comma{false};
        for (const auto &item : *list) {
          if (comma) {
            o += ",";
          } else {
            comma = true;
          }
          dumpValue(o, item);
        }
        o += "]";
      } else if (auto map{value.get<ValueMap>()}) {
        o += "{";
        auto comma{false};
        for (const auto &[key, item] : *map) {
          if (comma) {
            o += ",";
          } else {
            comma = true;
          }
          o += "^" + key + ":";
          dumpValue(o, item);
        }
        o += "}";
      } else {
        o += "<";
        o += value.type().name();
        o += ">";
      }
    }
  }  // namespace

  std::string dumpValue(const Value &value) {
    std::string o;
    dumpValue(o, value);
    return o;
  }
}  // namespace ic::codec::cbor
