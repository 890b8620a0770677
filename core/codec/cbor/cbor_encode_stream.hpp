/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "codec/cbor/cbor_common.hpp"
#include "codec/cbor/cbor_head.hpp"

namespace ic::codec::cbor {
  /** Map of encoded values, keys keep insertion order */
  struct CborOrderedMap
      : public std::vector<std::pair<std::string, CborEncodeStream>> {
    /** Returns value of existing key or appends new key */
    CborEncodeStream &operator[](std::string_view key);
  };

  /**
   * Encodes CBOR items one after another. List stream counts its items and
   * is written as single list item.
   */
  class CborEncodeStream {
   public:
    static constexpr auto is_cbor_encoder_stream = true;

    /** Encodes integer or bool */
    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T>>>
    CborEncodeStream &operator<<(T num) {
      ++count_;
      if constexpr (std::is_same_v<T, bool>) {
        writeHead(data_, MajorType::kSimple, num ? kSimpleTrue : kSimpleFalse);
      } else if constexpr (std::is_unsigned_v<T>) {
        writeHead(data_, MajorType::kUint, num);
      } else if (num < 0) {
        writeHead(data_,
                  MajorType::kNegativeInt,
                  static_cast<uint64_t>(-1 - static_cast<int64_t>(num)));
      } else {
        writeHead(data_, MajorType::kUint, static_cast<uint64_t>(num));
      }
      return *this;
    }

    /// Encodes elements into list
    template <typename T>
    CborEncodeStream &operator<<(const std::vector<T> &values) {
      auto l{list()};
      for (const auto &value : values) {
        l << value;
      }
      return *this << l;
    }

    /** Encodes floating point number as double precision */
    CborEncodeStream &operator<<(double num);
    CborEncodeStream &operator<<(const Bytes &bytes);
    CborEncodeStream &operator<<(BytesIn bytes);
    CborEncodeStream &operator<<(std::string_view str);
    CborEncodeStream &operator<<(const std::string &str);
    CborEncodeStream &operator<<(const char *str);
    /** Appends items of other stream, list stream is appended as one list */
    CborEncodeStream &operator<<(const CborEncodeStream &other);
    /**
     * Encodes map in key insertion order
     * @throws CborEncodeError::kExpectedMapValueSingle if value stream does
     * not hold exactly one item
     */
    CborEncodeStream &operator<<(const CborOrderedMap &map);
    CborEncodeStream &operator<<(std::nullptr_t);
    CborEncodeStream &operator<<(CborUndefined);
    /**
     * Writes tag header, next encoded item becomes its content.
     * Tag header alone is not counted as item.
     */
    CborEncodeStream &tag(uint64_t tag);
    /** Returns CBOR bytes of encoded items */
    Bytes data() const;
    /** Returns count of encoded items */
    size_t count() const;
    /** Creates list stream */
    static CborEncodeStream list();
    static CborOrderedMap orderedMap();

   private:
    bool is_list_{false};
    Bytes data_{};
    size_t count_{0};
  };
}  // namespace ic::codec::cbor
