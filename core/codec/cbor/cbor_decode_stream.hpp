/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "codec/cbor/cbor_common.hpp"
#include "codec/cbor/cbor_errors.hpp"
#include "codec/cbor/cbor_head.hpp"

namespace ic::codec::cbor {
  /**
   * Decodes CBOR items one after another.
   * Errors are raised as `CborDecodeError`: `kInvalidCbor` for malformed or
   * missing item, `kWrongType` for item of other type.
   */
  class CborDecodeStream {
   public:
    static constexpr auto is_cbor_decoder_stream = true;

    explicit CborDecodeStream(BytesIn data);

    /** Decodes integer or bool */
    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T>>>
    CborDecodeStream &operator>>(T &num) {
      if constexpr (std::is_same_v<T, bool>) {
        num = getBool();
      } else {
        const auto [negative, argument]{intArgument()};
        if constexpr (std::is_unsigned_v<T>) {
          if (negative || argument > std::numeric_limits<T>::max()) {
            outcome::raise(CborDecodeError::kIntOverflow);
          }
          num = static_cast<T>(argument);
        } else {
          if (argument > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            outcome::raise(CborDecodeError::kIntOverflow);
          }
          const auto value{static_cast<int64_t>(argument)};
          num = static_cast<T>(negative ? -1 - value : value);
        }
      }
      return *this;
    }

    /// Decodes list items into vector
    template <typename T>
    CborDecodeStream &operator>>(std::vector<T> &values) {
      const auto n{listLength()};
      auto l{list()};
      values.clear();
      values.reserve(n);
      for (size_t i{}; i < n; ++i) {
        values.push_back(l.template get<T>());
      }
      return *this;
    }

    /// Decodes floating point number of any precision
    CborDecodeStream &operator>>(double &num);
    CborDecodeStream &operator>>(Bytes &bytes);
    CborDecodeStream &operator>>(std::string &str);

    /**
     * Reads integer of any sign without range check
     * @return negative flag and argument, negative value is `-1 - argument`
     */
    std::pair<bool, uint64_t> intArgument();

    /**
     * Reads tag number of current item and advances to the tagged item
     * @return tag number
     */
    uint64_t tag();

    /** Creates stream of current list items and advances past the list */
    CborDecodeStream list();

    /**
     * Creates streams of current map values in wire order and advances past
     * the map. Keys must be text strings.
     */
    std::vector<std::pair<std::string, CborDecodeStream>> orderedMap();

    /** Skips current item */
    void next();

    /** Returns CBOR bytes of current item and advances past it */
    Bytes raw();

    size_t listLength() const;
    size_t mapLength() const;

    bool isList() const {
      return is(MajorType::kList);
    }
    bool isMap() const {
      return is(MajorType::kMap);
    }
    bool isNull() const {
      return head_ && head_->isSimple(kSimpleNull);
    }
    bool isUndefined() const {
      return head_ && head_->isSimple(kSimpleUndefined);
    }
    bool isBool() const {
      return head_
             && (head_->isSimple(kSimpleFalse) || head_->isSimple(kSimpleTrue));
    }
    bool isInt() const {
      return head_ && head_->isInt();
    }
    bool isFloat() const {
      return head_ && head_->asFloat();
    }
    bool isStr() const {
      return is(MajorType::kStr);
    }
    bool isBytes() const {
      return is(MajorType::kBytes);
    }
    bool isTag() const {
      return is(MajorType::kTag);
    }
    /** Checks if no item is left */
    bool empty() const {
      return !head_;
    }

    template <typename T>
    T get() {
      T value{};
      *this >> value;
      return value;
    }

   private:
    bool is(MajorType type) const {
      return head_ && head_->type == type;
    }
    const CborHead &expect(MajorType type) const;
    bool getBool();
    /// Reads payload of current string item
    BytesIn payload(MajorType type);
    /// Moves to item starting at `input`
    void moveTo(BytesIn input);
    /// Returns bytes of current item
    BytesIn item() const;

    /// Bytes from current item head to the end
    BytesIn input_;
    /// Bytes after current item head
    BytesIn after_head_;
    boost::optional<CborHead> head_;
  };
}  // namespace ic::codec::cbor
