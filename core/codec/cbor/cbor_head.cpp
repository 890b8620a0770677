/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_head.hpp"

#include <cmath>
#include <cstring>
#include <limits>

namespace ic::codec::cbor {
  namespace {
    constexpr uint8_t initialByte(MajorType type, uint8_t info) {
      return static_cast<uint8_t>(static_cast<uint8_t>(type) << 5) | info;
    }

    /// IEEE 754 half precision, RFC 8949 Appendix D
    double halfToDouble(uint16_t half) {
      const int exponent{(half >> 10) & 0x1F};
      const int mantissa{half & 0x3FF};
      double value;
      if (exponent == 0) {
        value = std::ldexp(mantissa, -24);
      } else if (exponent != 31) {
        value = std::ldexp(mantissa + 1024, exponent - 25);
      } else {
        value = mantissa == 0 ? INFINITY : NAN;
      }
      return (half & 0x8000) != 0 ? -value : value;
    }

    void writeBigEndian(Bytes &out, uint64_t value, size_t width) {
      for (auto i{width}; i != 0; --i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * (i - 1))));
      }
    }
  }  // namespace

  boost::optional<double> CborHead::asFloat() const {
    if (type != MajorType::kSimple) {
      return boost::none;
    }
    switch (width) {
      case sizeof(uint16_t):
        return halfToDouble(static_cast<uint16_t>(argument));
      case sizeof(uint32_t): {
        const auto bits{static_cast<uint32_t>(argument)};
        float value;
        memcpy(&value, &bits, sizeof(value));
        return static_cast<double>(value);
      }
      case sizeof(uint64_t): {
        double value;
        memcpy(&value, &argument, sizeof(value));
        return value;
      }
      default:
        return boost::none;
    }
  }

  uint64_t CborHead::payloadSize() const {
    return type == MajorType::kBytes || type == MajorType::kStr ? argument : 0;
  }

  uint64_t CborHead::nestedCount() const {
    switch (type) {
      case MajorType::kList:
        return argument;
      case MajorType::kMap:
        // saturate, caller rejects counts larger than input
        return argument > std::numeric_limits<uint64_t>::max() / 2
                   ? std::numeric_limits<uint64_t>::max()
                   : 2 * argument;
      case MajorType::kTag:
        return 1;
      default:
        return 0;
    }
  }

  bool readHead(CborHead &head, BytesIn &input) {
    if (input.empty()) {
      return false;
    }
    const auto initial{input[0]};
    const uint8_t info = initial & 0x1F;
    head.type = static_cast<MajorType>(initial >> 5);
    head.argument = 0;
    head.width = 0;
    if (info < kArgumentUint8) {
      head.argument = info;
    } else if (info <= kArgumentUint64) {
      head.width = static_cast<uint8_t>(1 << (info - kArgumentUint8));
    } else {
      // reserved or indefinite length
      return false;
    }
    if (static_cast<size_t>(input.size()) < 1 + head.width) {
      return false;
    }
    for (size_t i{1}; i <= head.width; ++i) {
      head.argument = (head.argument << 8) | input[i];
    }
    input = input.subspan(1 + head.width);
    return true;
  }

  bool skipItem(BytesIn &input) {
    uint64_t pending{1};
    while (pending != 0) {
      --pending;
      CborHead head;
      if (!readHead(head, input)) {
        return false;
      }
      const auto size{head.payloadSize()};
      if (size > static_cast<uint64_t>(input.size())) {
        return false;
      }
      input = input.subspan(static_cast<ptrdiff_t>(size));
      const auto nested{head.nestedCount()};
      // every nested item takes at least one byte
      if (nested > static_cast<uint64_t>(input.size())) {
        return false;
      }
      pending += nested;
    }
    return true;
  }

  void writeHead(Bytes &out, MajorType type, uint64_t argument) {
    if (argument < kArgumentUint8) {
      out.push_back(initialByte(type, static_cast<uint8_t>(argument)));
    } else if (argument <= 0xFF) {
      out.push_back(initialByte(type, kArgumentUint8));
      writeBigEndian(out, argument, sizeof(uint8_t));
    } else if (argument <= 0xFFFF) {
      out.push_back(initialByte(type, kArgumentUint16));
      writeBigEndian(out, argument, sizeof(uint16_t));
    } else if (argument <= 0xFFFFFFFF) {
      out.push_back(initialByte(type, kArgumentUint32));
      writeBigEndian(out, argument, sizeof(uint32_t));
    } else {
      out.push_back(initialByte(type, kArgumentUint64));
      writeBigEndian(out, argument, sizeof(uint64_t));
    }
  }

  void writeDouble(Bytes &out, double value) {
    uint64_t bits;
    memcpy(&bits, &value, sizeof(bits));
    out.push_back(initialByte(MajorType::kSimple, kArgumentUint64));
    writeBigEndian(out, bits, sizeof(bits));
  }
}  // namespace ic::codec::cbor
