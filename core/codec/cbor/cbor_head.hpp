/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "common/bytes.hpp"

namespace ic::codec::cbor {
  /// Major type, three high bits of initial byte
  enum class MajorType : uint8_t {
    kUint = 0,
    kNegativeInt,
    kBytes,
    kStr,
    kList,
    kMap,
    kTag,
    kSimple,
  };

  /// Additional information values following inline argument range
  constexpr uint8_t kArgumentUint8{24};
  constexpr uint8_t kArgumentUint16{25};
  constexpr uint8_t kArgumentUint32{26};
  constexpr uint8_t kArgumentUint64{27};

  constexpr uint8_t kSimpleFalse{20};
  constexpr uint8_t kSimpleTrue{21};
  constexpr uint8_t kSimpleNull{22};
  constexpr uint8_t kSimpleUndefined{23};

  /**
   * Head of data item: major type and argument. Argument is value of
   * integer, payload size of strings, item count of containers, tag number,
   * simple value or raw bits of float.
   */
  struct CborHead {
    MajorType type{MajorType::kUint};
    uint64_t argument{};
    /// Count of argument bytes after initial byte, zero for inline argument
    uint8_t width{};

    bool isSimple(uint8_t value) const {
      return type == MajorType::kSimple && width == 0 && argument == value;
    }

    bool isInt() const {
      return type == MajorType::kUint || type == MajorType::kNegativeInt;
    }

    /// Half, single or double precision float value
    boost::optional<double> asFloat() const;

    /// Size of byte or text string payload, zero for other types
    uint64_t payloadSize() const;

    /// Count of data items nested directly in list, map or tag
    uint64_t nestedCount() const;
  };

  /**
   * Reads head and advances input past it.
   * Indefinite length and reserved additional information are rejected.
   * @return false if input is truncated or head is not supported
   */
  bool readHead(CborHead &head, BytesIn &input);

  /**
   * Advances input past one complete data item including nested items
   * @return false if item is truncated or malformed
   */
  bool skipItem(BytesIn &input);

  /// Writes head with shortest argument encoding
  void writeHead(Bytes &out, MajorType type, uint64_t argument);

  /// Writes float as double precision
  void writeDouble(Bytes &out, double value);
}  // namespace ic::codec::cbor
