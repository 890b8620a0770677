/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_encode_stream.hpp"

#include "codec/cbor/cbor_errors.hpp"
#include "common/span.hpp"

namespace ic::codec::cbor {
  CborEncodeStream &CborOrderedMap::operator[](std::string_view key) {
    for (auto &pair : *this) {
      if (pair.first == key) {
        return pair.second;
      }
    }
    emplace_back(std::string{key}, CborEncodeStream{});
    return back().second;
  }

  CborEncodeStream &CborEncodeStream::operator<<(double num) {
    ++count_;
    writeDouble(data_, num);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(const Bytes &bytes) {
    return *this << BytesIn{bytes};
  }

  CborEncodeStream &CborEncodeStream::operator<<(BytesIn bytes) {
    ++count_;
    writeHead(data_, MajorType::kBytes, bytes.size());
    append(data_, bytes);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(std::string_view str) {
    ++count_;
    writeHead(data_, MajorType::kStr, str.size());
    append(data_, common::span::cbytes(str));
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(const std::string &str) {
    return *this << std::string_view{str};
  }

  CborEncodeStream &CborEncodeStream::operator<<(const char *str) {
    return *this << std::string_view{str};
  }

  CborEncodeStream &CborEncodeStream::operator<<(
      const CborEncodeStream &other) {
    if (other.is_list_) {
      ++count_;
      writeHead(data_, MajorType::kList, other.count_);
    } else {
      count_ += other.count_;
    }
    append(data_, other.data_);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(const CborOrderedMap &map) {
    for (const auto &pair : map) {
      if (pair.second.count() != 1) {
        outcome::raise(CborEncodeError::kExpectedMapValueSingle);
      }
    }
    ++count_;
    writeHead(data_, MajorType::kMap, map.size());
    for (const auto &[key, value] : map) {
      writeHead(data_, MajorType::kStr, key.size());
      append(data_, common::span::cbytes(key));
      append(data_, value.data());
    }
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(std::nullptr_t) {
    ++count_;
    writeHead(data_, MajorType::kSimple, kSimpleNull);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(CborUndefined) {
    ++count_;
    writeHead(data_, MajorType::kSimple, kSimpleUndefined);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::tag(uint64_t tag) {
    writeHead(data_, MajorType::kTag, tag);
    return *this;
  }

  Bytes CborEncodeStream::data() const {
    if (!is_list_) {
      return data_;
    }
    Bytes result;
    writeHead(result, MajorType::kList, count_);
    append(result, data_);
    return result;
  }

  size_t CborEncodeStream::count() const {
    return count_;
  }

  CborEncodeStream CborEncodeStream::list() {
    CborEncodeStream stream;
    stream.is_list_ = true;
    return stream;
  }

  CborOrderedMap CborEncodeStream::orderedMap() {
    return {};
  }
}  // namespace ic::codec::cbor
