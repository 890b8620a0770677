/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_decode_stream.hpp"

#include "common/span.hpp"

namespace ic::codec::cbor {
  CborDecodeStream::CborDecodeStream(BytesIn data) {
    moveTo(data);
  }

  CborDecodeStream &CborDecodeStream::operator>>(double &num) {
    if (!head_) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    const auto value{head_->asFloat()};
    if (!value) {
      outcome::raise(CborDecodeError::kWrongType);
    }
    num = *value;
    moveTo(after_head_);
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(Bytes &bytes) {
    bytes = copy(payload(MajorType::kBytes));
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(std::string &str) {
    str = common::span::bytestr(payload(MajorType::kStr));
    return *this;
  }

  std::pair<bool, uint64_t> CborDecodeStream::intArgument() {
    if (!head_) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    if (!head_->isInt()) {
      outcome::raise(CborDecodeError::kWrongType);
    }
    std::pair<bool, uint64_t> result{head_->type == MajorType::kNegativeInt,
                                     head_->argument};
    moveTo(after_head_);
    return result;
  }

  uint64_t CborDecodeStream::tag() {
    const auto tag{expect(MajorType::kTag).argument};
    moveTo(after_head_);
    if (!head_) {
      // tag header without content
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    return tag;
  }

  CborDecodeStream CborDecodeStream::list() {
    expect(MajorType::kList);
    const auto whole{item()};
    const auto head_size{input_.size() - after_head_.size()};
    CborDecodeStream items{after_head_.first(whole.size() - head_size)};
    moveTo(input_.subspan(whole.size()));
    return items;
  }

  std::vector<std::pair<std::string, CborDecodeStream>>
  CborDecodeStream::orderedMap() {
    const auto n{expect(MajorType::kMap).argument};
    const auto whole{item()};
    const auto rest{input_.subspan(whole.size())};
    moveTo(after_head_);
    std::vector<std::pair<std::string, CborDecodeStream>> map;
    map.reserve(n);
    for (uint64_t i{}; i < n; ++i) {
      if (!head_) {
        outcome::raise(CborDecodeError::kInvalidCbor);
      }
      auto key{get<std::string>()};
      map.emplace_back(std::move(key), CborDecodeStream{item()});
      next();
    }
    moveTo(rest);
    return map;
  }

  void CborDecodeStream::next() {
    moveTo(input_.subspan(item().size()));
  }

  Bytes CborDecodeStream::raw() {
    auto bytes{copy(item())};
    next();
    return bytes;
  }

  size_t CborDecodeStream::listLength() const {
    return expect(MajorType::kList).argument;
  }

  size_t CborDecodeStream::mapLength() const {
    return expect(MajorType::kMap).argument;
  }

  const CborHead &CborDecodeStream::expect(MajorType type) const {
    if (!head_) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    if (head_->type != type) {
      outcome::raise(CborDecodeError::kWrongType);
    }
    return *head_;
  }

  bool CborDecodeStream::getBool() {
    if (!head_) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    if (!isBool()) {
      outcome::raise(CborDecodeError::kWrongType);
    }
    const auto value{head_->isSimple(kSimpleTrue)};
    moveTo(after_head_);
    return value;
  }

  BytesIn CborDecodeStream::payload(MajorType type) {
    const auto size{expect(type).argument};
    if (size > static_cast<uint64_t>(after_head_.size())) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    const auto bytes{after_head_.first(static_cast<ptrdiff_t>(size))};
    moveTo(after_head_.subspan(static_cast<ptrdiff_t>(size)));
    return bytes;
  }

  void CborDecodeStream::moveTo(BytesIn input) {
    input_ = input;
    after_head_ = input;
    head_ = boost::none;
    if (input.empty()) {
      return;
    }
    CborHead head;
    if (!readHead(head, after_head_)) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    head_ = head;
  }

  BytesIn CborDecodeStream::item() const {
    if (!head_) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    auto rest{input_};
    if (!skipItem(rest)) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    return input_.first(input_.size() - rest.size());
  }
}  // namespace ic::codec::cbor
