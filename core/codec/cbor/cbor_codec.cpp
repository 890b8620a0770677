/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_codec.hpp"

#include <sstream>

#include "codec/cbor/agent_encoders.hpp"
#include "codec/cbor/cbor_decode_stream.hpp"

namespace ic::codec::cbor {
  using primitives::BigInt;
  using primitives::principal::Principal;

  namespace {
    common::Logger logger() {
      static common::Logger logger{common::createLogger("cbor")};
      return logger;
    }

    // NOLINTNEXTLINE(misc-no-recursion)
    Value decodeItem(CborDecodeStream &s, size_t depth) {
      if (depth > kMaxNesting) {
        outcome::raise(CborDecodeError::kInvalidCbor);
      }
      if (s.empty()) {
        outcome::raise(CborDecodeError::kInvalidCbor);
      }
      if (s.isTag()) {
        auto tagged{s};
        const auto tag{tagged.tag()};
        if (tag == kTagPositiveBignum || tag == kTagNegativeBignum) {
          return s.get<BigInt>();
        }
        s = tagged;
        if (tag == kTagSelfDescribe) {
          return decodeItem(s, depth + 1);
        }
        return CborTagged{tag, decodeItem(s, depth + 1)};
      }
      if (s.isList()) {
        const auto n{s.listLength()};
        auto l{s.list()};
        ValueList list;
        list.reserve(n);
        for (size_t i{}; i < n; ++i) {
          list.push_back(decodeItem(l, depth + 1));
        }
        return std::move(list);
      }
      if (s.isMap()) {
        ValueMap map;
        for (auto &[key, nested] : s.orderedMap()) {
          map[key] = decodeItem(nested, depth + 1);
        }
        return std::move(map);
      }
      if (s.isNull()) {
        s.next();
        return nullptr;
      }
      if (s.isUndefined()) {
        s.next();
        return CborUndefined{};
      }
      if (s.isBool()) {
        return s.get<bool>();
      }
      if (s.isInt()) {
        const auto [negative, argument]{s.intArgument()};
        if (!negative) {
          return argument;
        }
        if (argument <= static_cast<uint64_t>(INT64_MAX)) {
          return -1 - static_cast<int64_t>(argument);
        }
        return BigInt{-1 - BigInt{argument}};
      }
      if (s.isFloat()) {
        return s.get<double>();
      }
      if (s.isStr()) {
        return s.get<std::string>();
      }
      if (s.isBytes()) {
        return s.get<Bytes>();
      }
      // unassigned simple value
      outcome::raise(CborDecodeError::kInvalidCbor);
    }

    std::string hexText(const Value &value) {
      BigInt number;
      if (auto u{value.get<uint64_t>()}) {
        number = *u;
      } else if (auto i{value.get<int64_t>()}) {
        number = *i;
      } else if (auto big{value.get<BigInt>()}) {
        number = *big;
      } else {
        outcome::raise(CborDecodeError::kWrongType);
      }
      if (number < 0) {
        outcome::raise(CborDecodeError::kWrongType);
      }
      std::stringstream ss;
      ss << std::hex << number;
      return ss.str();
    }
  }  // namespace

  outcome::result<Bytes> encode(const EncoderRegistry &registry,
                                const Value &value) {
    auto bytes{registry.serialize(value)};
    if (!bytes) {
      logger()->debug("encode {} failed: {}",
                      dumpValue(value),
                      bytes.error().message());
    }
    return bytes;
  }

  outcome::result<Bytes> encode(const Value &value) {
    static const auto registry{makeAgentEncoderRegistry()};
    return encode(registry, value);
  }

  outcome::result<Value> decode(BytesIn input) {
    auto value{outcome::catchRaised([&] {
      CborDecodeStream s{input};
      auto value{decodeItem(s, 0)};
      if (auto map{value.get<ValueMap>()}) {
        if (auto canister_id{map->find(kCanisterIdField)}) {
          const auto text{hexText(*canister_id)};
          auto principal{Principal::fromText(text)};
          if (!principal) {
            outcome::raise(principal.error());
          }
          logger()->trace("canister_id {} decoded as principal", text);
          *canister_id = principal.value();
        }
      }
      return value;
    })};
    if (!value) {
      logger()->debug("decode failed: {}", value.error().message());
    }
    return value;
  }
}  // namespace ic::codec::cbor
