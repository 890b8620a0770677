/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_decode_stream.hpp"
#include "codec/cbor/cbor_encode_stream.hpp"
#include "primitives/big_int.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using ic::Bytes;
using ic::codec::cbor::CborDecodeError;
using ic::codec::cbor::CborDecodeStream;
using ic::codec::cbor::CborEncodeError;
using ic::codec::cbor::CborEncodeStream;
using ic::codec::cbor::CborUndefined;
using ic::primitives::BigInt;

template <typename T>
Bytes encodeOne(const T &value) {
  CborEncodeStream s;
  s << value;
  return s.data();
}

template <typename T>
void expectDecodeOne(const Bytes &encoded, const T &expected) {
  CborDecodeStream s{encoded};
  EXPECT_EQ(s.get<T>(), expected);
  EXPECT_TRUE(s.empty());
}

/**
 * @given Integers and bool
 * @when Encode
 * @then Encoded as expected
 */
TEST(CborEncoder, Integral) {
  EXPECT_EQ(encodeOne(0ull), "00"_unhex);
  EXPECT_EQ(encodeOne(0ll), "00"_unhex);
  EXPECT_EQ(encodeOne(1), "01"_unhex);
  EXPECT_EQ(encodeOne(23), "17"_unhex);
  EXPECT_EQ(encodeOne(24), "1818"_unhex);
  EXPECT_EQ(encodeOne(500), "1901F4"_unhex);
  EXPECT_EQ(encodeOne(-1), "20"_unhex);
  EXPECT_EQ(encodeOne(-500), "3901F3"_unhex);
  EXPECT_EQ(encodeOne(UINT64_MAX), "1BFFFFFFFFFFFFFFFF"_unhex);
  EXPECT_EQ(encodeOne(false), "F4"_unhex);
  EXPECT_EQ(encodeOne(true), "F5"_unhex);
}

/**
 * @given Simple values and double
 * @when Encode
 * @then Double is always written with double precision
 */
TEST(CborEncoder, Special) {
  EXPECT_EQ(encodeOne(nullptr), "F6"_unhex);
  EXPECT_EQ(encodeOne(CborUndefined{}), "F7"_unhex);
  EXPECT_EQ(encodeOne(1.5), "FB3FF8000000000000"_unhex);
}

/**
 * @given Sequence
 * @when Encode
 * @then Encoded as expected
 */
TEST(CborEncoder, Flat) {
  CborEncodeStream s;
  EXPECT_EQ(s.data(), ""_unhex);
  s << 1;
  EXPECT_EQ(s.data(), "01"_unhex);
  s << 2;
  EXPECT_EQ(s.data(), "0102"_unhex);
  EXPECT_EQ(s.count(), 2u);
}

/**
 * @given Nested list and sequence containers
 * @when Encode
 * @then Encoded as expected
 */
TEST(CborEncoder, ListNest) {
  auto s = CborEncodeStream::list();
  EXPECT_EQ(s.data(), "80"_unhex);
  s << (CborEncodeStream::list() << 1 << 2);
  EXPECT_EQ(s.data(), "81820102"_unhex);
  s << (CborEncodeStream() << 3 << 4 << 5);
  EXPECT_EQ(s.data(), "84820102030405"_unhex);
}

/**
 * @given String and bytes
 * @when Encode
 * @then Encoded as expected
 */
TEST(CborEncoder, StringBytes) {
  EXPECT_EQ(encodeOne(std::string("foo")), "63666F6F"_unhex);
  EXPECT_EQ(encodeOne("foo"), "63666F6F"_unhex);
  EXPECT_EQ(encodeOne("CAFE"_unhex), "42CAFE"_unhex);
  EXPECT_EQ(encodeOne(Bytes{}), "40"_unhex);
}

/**
 * @given Ordered map container
 * @when Encode
 * @then Keys keep insertion order, repeated key refers to same value
 */
TEST(CborEncoder, OrderedMap) {
  CborEncodeStream s;
  auto map = CborEncodeStream::orderedMap();
  map["b"] << 1;
  map["a"] << 2;
  map["b"] = CborEncodeStream{} << 3;
  s << map;
  EXPECT_EQ(s.data(), "A2616203616102"_unhex);
}

/**
 * @given Tag header followed by item
 * @when Encode
 * @then Tag header is not counted as separate item
 */
TEST(CborEncoder, Tag) {
  CborEncodeStream s;
  s.tag(55799);
  s << 1;
  EXPECT_EQ(s.data(), "D9D9F701"_unhex);
  EXPECT_EQ(s.count(), 1u);
}

/**
 * @given Invalid map container
 * @when Encode
 * @then Error
 */
TEST(CborEncoder, MapErrors) {
  auto map1 = CborEncodeStream::orderedMap();
  map1["a"] << 1 << 2;
  EXPECT_OUTCOME_RAISE(CborEncodeError::kExpectedMapValueSingle,
                       CborEncodeStream() << map1);
  auto map2 = CborEncodeStream::orderedMap();
  map2["a"];
  EXPECT_OUTCOME_RAISE(CborEncodeError::kExpectedMapValueSingle,
                       CborEncodeStream() << map2);
}

/**
 * @given Integer and bool CBOR
 * @when Decode integer and bool
 * @then Decoded as expected
 */
TEST(CborDecoder, Integral) {
  expectDecodeOne("00"_unhex, 0ull);
  expectDecodeOne("00"_unhex, 0ll);
  expectDecodeOne("01"_unhex, 1);
  expectDecodeOne("17"_unhex, 23);
  expectDecodeOne("1818"_unhex, 24);
  expectDecodeOne("20"_unhex, -1);
  expectDecodeOne("3901F3"_unhex, -500);
  expectDecodeOne("F4"_unhex, false);
  expectDecodeOne("F5"_unhex, true);
}

/**
 * @given Half, single and double precision floats
 * @when Decode double
 * @then Decoded as expected
 */
TEST(CborDecoder, Float) {
  expectDecodeOne("F93E00"_unhex, 1.5);
  expectDecodeOne("FA3FC00000"_unhex, 1.5);
  expectDecodeOne("FB3FF8000000000000"_unhex, 1.5);
  expectDecodeOne("F9C400"_unhex, -4.0);
}

/**
 * @given Sequence CBOR
 * @when Decode sequence
 * @then Decoded as expected
 */
TEST(CborDecoder, Flat) {
  CborDecodeStream s("0504"_unhex);
  int a, b;
  s >> a >> b;
  EXPECT_EQ(a, 5);
  EXPECT_EQ(b, 4);
  EXPECT_TRUE(s.empty());
}

/**
 * @given List CBOR
 * @when Decode list container
 * @then Decoded as expected
 */
TEST(CborDecoder, List) {
  CborDecodeStream s1("82050403"_unhex);
  auto s2 = s1.list();
  int a, b;
  s2 >> a >> b;
  EXPECT_EQ(a, 5);
  EXPECT_EQ(b, 4);
  int c;
  s1 >> c;
  EXPECT_EQ(c, 3);
}

/**
 * @given String CBOR
 * @when Decode string
 * @then Decoded as expected
 */
TEST(CborDecoder, String) {
  std::string s;
  CborDecodeStream("63666F6F"_unhex) >> s;
  EXPECT_EQ(s, "foo");
}

/**
 * @given Map CBOR with keys in non sorted order
 * @when Decode ordered map
 * @then Wire order is kept
 */
TEST(CborDecoder, OrderedMap) {
  auto m = CborDecodeStream("A2616202616101"_unhex).orderedMap();
  ASSERT_EQ(m.size(), 2u);
  EXPECT_EQ(m[0].first, "b");
  EXPECT_EQ(m[1].first, "a");
  EXPECT_EQ(m[0].second.get<int>(), 2);
  EXPECT_EQ(m[1].second.get<int>(), 1);
}

/**
 * @given Map CBOR with list value followed by integer
 * @when Decode ordered map
 * @then Stream is after the map
 */
TEST(CborDecoder, OrderedMapNested) {
  CborDecodeStream s("A161628201020A"_unhex);
  auto m = s.orderedMap();
  ASSERT_EQ(m.size(), 1u);
  EXPECT_EQ(m[0].second.get<std::vector<int>>(), (std::vector<int>{1, 2}));
  EXPECT_EQ(s.get<int>(), 10);
  EXPECT_TRUE(s.empty());
}

/**
 * @given Map CBOR with integer key
 * @when Decode map container
 * @then Error
 */
TEST(CborDecoder, MapKeyErrors) {
  EXPECT_OUTCOME_RAISE(CborDecodeError::kWrongType,
                       CborDecodeStream("A10102"_unhex).orderedMap());
}

/**
 * @given Tagged CBOR
 * @when Read tag
 * @then Tag number is returned and stream is at tagged item
 */
TEST(CborDecoder, Tag) {
  CborDecodeStream s("D9D9F7C240"_unhex);
  EXPECT_TRUE(s.isTag());
  EXPECT_EQ(s.tag(), 55799u);
  EXPECT_TRUE(s.isTag());
  EXPECT_EQ(s.tag(), 2u);
  EXPECT_TRUE(s.isBytes());
  EXPECT_EQ(s.get<Bytes>(), Bytes{});
  EXPECT_TRUE(s.empty());
}

/**
 * @given Tagged item followed by integer
 * @when Skip tagged item
 * @then Whole tagged item is skipped
 */
TEST(CborDecoder, TagNext) {
  CborDecodeStream s("D84782010203"_unhex);
  s.next();
  EXPECT_EQ(s.get<int>(), 3);
}

/**
 * @given Tag without content
 * @when Read tag
 * @then Error
 */
TEST(CborDecoder, TagErrors) {
  EXPECT_OUTCOME_RAISE(CborDecodeError::kInvalidCbor,
                       CborDecodeStream("C2"_unhex).tag());
  EXPECT_OUTCOME_RAISE(CborDecodeError::kWrongType,
                       CborDecodeStream("01"_unhex).tag());
}

/**
 * @given Invalid or indefinite length CBOR
 * @when Init decoder
 * @then Error
 */
TEST(CborDecoder, InitErrors) {
  EXPECT_OUTCOME_RAISE(CborDecodeError::kInvalidCbor,
                       CborDecodeStream("FF"_unhex));
  EXPECT_OUTCOME_RAISE(CborDecodeError::kInvalidCbor,
                       CborDecodeStream("18"_unhex));
  EXPECT_OUTCOME_RAISE(CborDecodeError::kInvalidCbor,
                       CborDecodeStream("9F01FF"_unhex));
  EXPECT_OUTCOME_RAISE(CborDecodeError::kInvalidCbor,
                       CborDecodeStream("5F4101FF"_unhex));
}

/**
 * @given Invalid CBOR or wrong type
 * @when Decode integer and bool
 * @then Error
 */
TEST(CborDecoder, IntErrors) {
  bool b;
  uint8_t u8;
  int8_t i8;
  int64_t i64;
  EXPECT_OUTCOME_RAISE(CborDecodeError::kWrongType,
                       CborDecodeStream("01"_unhex) >> b);
  EXPECT_OUTCOME_RAISE(CborDecodeError::kWrongType,
                       CborDecodeStream("80"_unhex) >> u8);
  EXPECT_OUTCOME_RAISE(CborDecodeError::kIntOverflow,
                       CborDecodeStream("21"_unhex) >> u8);
  EXPECT_OUTCOME_RAISE(CborDecodeError::kIntOverflow,
                       CborDecodeStream("190100"_unhex) >> u8);
  EXPECT_OUTCOME_RAISE(CborDecodeError::kIntOverflow,
                       CborDecodeStream("1880"_unhex) >> i8);
  EXPECT_OUTCOME_RAISE(CborDecodeError::kIntOverflow,
                       CborDecodeStream("1BFFFFFFFFFFFFFFFF"_unhex) >> i64);
}

/**
 * @given Sequence and list CBOR
 * @when Decode after end of sequence or list
 * @then Error
 */
TEST(CborDecoder, FlatErrors) {
  int i;
  EXPECT_OUTCOME_RAISE(CborDecodeError::kInvalidCbor,
                       CborDecodeStream("01"_unhex) >> i >> i);
  EXPECT_OUTCOME_RAISE(CborDecodeError::kInvalidCbor,
                       CborDecodeStream("80"_unhex).list() >> i);
}

/**
 * @given Invalid list CBOR
 * @when Decode list container
 * @then Error
 */
TEST(CborDecoder, ListErrors) {
  EXPECT_OUTCOME_RAISE(CborDecodeError::kWrongType,
                       CborDecodeStream("01"_unhex).list());
  EXPECT_OUTCOME_RAISE(CborDecodeError::kInvalidCbor,
                       CborDecodeStream("81"_unhex).list());
  EXPECT_OUTCOME_RAISE(CborDecodeError::kInvalidCbor,
                       CborDecodeStream("8018"_unhex).list());
}

/**
 * @given CBOR
 * @when isList, listLength, isMap, raw, intArgument
 * @then As expected
 */
TEST(CborDecoder, Misc) {
  EXPECT_TRUE(CborDecodeStream("80"_unhex).isList());
  EXPECT_EQ(CborDecodeStream("820101"_unhex).listLength(), 2u);
  EXPECT_FALSE(CborDecodeStream("80"_unhex).isMap());
  EXPECT_TRUE(CborDecodeStream("A0"_unhex).isMap());
  EXPECT_TRUE(CborDecodeStream("F7"_unhex).isUndefined());
  EXPECT_TRUE(CborDecodeStream("F6"_unhex).isNull());
  EXPECT_EQ(CborDecodeStream("810201"_unhex).raw(), "8102"_unhex);
  EXPECT_EQ(CborDecodeStream("3863"_unhex).intArgument(),
            std::make_pair(true, uint64_t{99}));
}

/**
 * @given Big integers
 * @when Encode
 * @then Encoded as bignum with plain magnitude
 */
TEST(CborBigInt, Encode) {
  EXPECT_EQ(encodeOne(BigInt(0xCAFE)), "C242CAFE"_unhex);
  EXPECT_EQ(encodeOne(BigInt(-0xCAFE)), "C342CAFE"_unhex);
  EXPECT_EQ(encodeOne(BigInt(0)), "C240"_unhex);
  EXPECT_EQ(encodeOne(BigInt("0x10000000000000000")),
            "C249010000000000000000"_unhex);
}

/**
 * @given Bignums and plain integers
 * @when Decode big integer
 * @then Decoded as expected
 */
TEST(CborBigInt, Decode) {
  expectDecodeOne("C242CAFE"_unhex, BigInt(0xCAFE));
  expectDecodeOne("C342CAFE"_unhex, BigInt(-0xCAFE));
  expectDecodeOne("C240"_unhex, BigInt(0));
  expectDecodeOne("01"_unhex, BigInt(1));
  expectDecodeOne("20"_unhex, BigInt(-1));
  expectDecodeOne("1BFFFFFFFFFFFFFFFF"_unhex, BigInt("0xFFFFFFFFFFFFFFFF"));
  expectDecodeOne("3BFFFFFFFFFFFFFFFF"_unhex, -BigInt("0x10000000000000000"));
}

/**
 * @given Other tag or other type
 * @when Decode big integer
 * @then Error
 */
TEST(CborBigInt, DecodeErrors) {
  EXPECT_OUTCOME_RAISE(CborDecodeError::kWrongType,
                       CborDecodeStream("C440"_unhex).get<BigInt>());
  EXPECT_OUTCOME_RAISE(CborDecodeError::kWrongType,
                       CborDecodeStream("C201"_unhex).get<BigInt>());
  EXPECT_OUTCOME_RAISE(CborDecodeError::kWrongType,
                       CborDecodeStream("40"_unhex).get<BigInt>());
}
