/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_encoder.hpp"

#include <gtest/gtest.h>
#include <limits>

#include "codec/cbor/cbor_codec.hpp"
#include "testutil/cbor.hpp"

namespace tc::codec::cbor {
  struct CborEncoderTest : testing::Test {
    Bytes out;
    BytesSink sink{out};
    CborEncoder encoder{sink};
  };

  /**
   * @given Integers
   * @when Encode
   * @then Shortest argument form is used
   */
  TEST(CborEncode, Integral) {
    EXPECT_OUTCOME_EQ(encode(0), "00"_unhex);
    EXPECT_OUTCOME_EQ(encode(0ull), "00"_unhex);
    EXPECT_OUTCOME_EQ(encode(23), "17"_unhex);
    EXPECT_OUTCOME_EQ(encode(24), "1818"_unhex);
    EXPECT_OUTCOME_EQ(encode(255), "18FF"_unhex);
    EXPECT_OUTCOME_EQ(encode(256), "190100"_unhex);
    EXPECT_OUTCOME_EQ(encode(1000), "1903E8"_unhex);
    EXPECT_OUTCOME_EQ(encode(65535), "19FFFF"_unhex);
    EXPECT_OUTCOME_EQ(encode(65536), "1A00010000"_unhex);
    EXPECT_OUTCOME_EQ(encode(0xFFFFFFFFu), "1AFFFFFFFF"_unhex);
    EXPECT_OUTCOME_EQ(encode(0x100000000ull), "1B0000000100000000"_unhex);
    EXPECT_OUTCOME_EQ(encode(std::numeric_limits<uint64_t>::max()),
                      "1BFFFFFFFFFFFFFFFF"_unhex);
  }

  /**
   * @given Negative integers
   * @when Encode
   * @then Major type 1 with argument -1-n
   */
  TEST(CborEncode, Negative) {
    EXPECT_OUTCOME_EQ(encode(-1), "20"_unhex);
    EXPECT_OUTCOME_EQ(encode(-10), "29"_unhex);
    EXPECT_OUTCOME_EQ(encode(-24), "37"_unhex);
    EXPECT_OUTCOME_EQ(encode(-25), "3818"_unhex);
    EXPECT_OUTCOME_EQ(encode(-1000), "3903E7"_unhex);
    EXPECT_OUTCOME_EQ(encode(std::numeric_limits<int64_t>::min()),
                      "3B7FFFFFFFFFFFFFFF"_unhex);
  }

  /// Simple values and floats
  TEST(CborEncode, Special) {
    EXPECT_OUTCOME_EQ(encode(false), "F4"_unhex);
    EXPECT_OUTCOME_EQ(encode(true), "F5"_unhex);
    EXPECT_OUTCOME_EQ(encode(nullptr), "F6"_unhex);
    EXPECT_OUTCOME_EQ(encode(1.5f), "FA3FC00000"_unhex);
    EXPECT_OUTCOME_EQ(encode(1.5), "FB3FF8000000000000"_unhex);
    EXPECT_OUTCOME_EQ(encode(-4.1), "FBC010666666666666"_unhex);
  }

  /**
   * @given Text and byte strings
   * @when Encode
   * @then Header followed by raw bytes
   */
  TEST(CborEncode, Strings) {
    EXPECT_OUTCOME_EQ(encode(std::string("foo")), "63666F6F"_unhex);
    EXPECT_OUTCOME_EQ(encode("foo"), "63666F6F"_unhex);
    EXPECT_OUTCOME_EQ(encode(std::string_view{}), "60"_unhex);
    EXPECT_OUTCOME_EQ(encode("CAFE"_unhex), "42CAFE"_unhex);
    EXPECT_OUTCOME_EQ(encode(Bytes{}), "40"_unhex);
    EXPECT_OUTCOME_EQ(encode(Bytes(24, 0)),
                      "5818000000000000000000000000000000000000000000000000"_unhex);
  }

  /// Containers of known size are written without buffering
  TEST(CborEncode, Containers) {
    EXPECT_OUTCOME_EQ(encode(std::vector<int>{2, 5, 9}), "83020509"_unhex);
    EXPECT_OUTCOME_EQ(encode(std::vector<int>{}), "80"_unhex);
    std::map<std::string, int> m;
    m["three"] = 3;
    m["one"] = 1;
    m["two"] = 2;
    EXPECT_OUTCOME_EQ(encode(m),
                      "A3636F6E6501657468726565036374776F02"_unhex);
  }

  /**
   * @given Map with keys of different length
   * @when Encode with sorted keys
   * @then Keys are in bytewise order of their encoding
   */
  TEST(CborEncode, SortedMapKeys) {
    std::map<std::string, int> m{{"three", 3}, {"one", 1}, {"two", 2}};
    EXPECT_OUTCOME_EQ(encode(m, CborEncoderConfig{true}),
                      "A3636F6E65016374776F0265746872656503"_unhex);
    std::map<int, int> ints{{-1, 0}, {10, 0}, {100, 0}};
    EXPECT_OUTCOME_EQ(encode(ints, CborEncoderConfig{true}),
                      "A30A001864002000"_unhex);
  }

  /**
   * @given Encoder
   * @when Write indefinite list of three integers
   * @then Break terminates list
   */
  TEST_F(CborEncoderTest, IndefiniteList) {
    EXPECT_OUTCOME_TRUE_1(encoder.writeListIndefinite());
    for (auto i : {1, 2, 3}) {
      EXPECT_OUTCOME_TRUE_1(encoder.encode(i));
    }
    EXPECT_OUTCOME_TRUE_1(encoder.writeBreak());
    EXPECT_EQ(out, "9F010203FF"_unhex);
    EXPECT_OUTCOME_EQ(decode<std::vector<int>>(out), (std::vector<int>{1, 2, 3}));
  }

  /**
   * @given Encoder
   * @when Write indefinite byte string of two chunks
   * @then Chunks are definite byte strings
   */
  TEST_F(CborEncoderTest, IndefiniteBytes) {
    EXPECT_OUTCOME_TRUE_1(encoder.writeBytesIndefinite());
    EXPECT_OUTCOME_TRUE_1(encoder.writeBytes("010203"_unhex));
    EXPECT_OUTCOME_TRUE_1(encoder.writeBytes("0405"_unhex));
    EXPECT_OUTCOME_TRUE_1(encoder.writeBreak());
    EXPECT_EQ(out, "5F43010203420405FF"_unhex);
    EXPECT_OUTCOME_EQ(decode<Bytes>(out), "0102030405"_unhex);
  }

  /// Indefinite map and text
  TEST_F(CborEncoderTest, IndefiniteMapStr) {
    EXPECT_OUTCOME_TRUE_1(encoder.writeMapIndefinite());
    EXPECT_OUTCOME_TRUE_1(encoder.writeStrIndefinite());
    EXPECT_OUTCOME_TRUE_1(encoder.writeStr("a"));
    EXPECT_OUTCOME_TRUE_1(encoder.writeStr("b"));
    EXPECT_OUTCOME_TRUE_1(encoder.writeBreak());
    EXPECT_OUTCOME_TRUE_1(encoder.writeInt(-2));
    EXPECT_OUTCOME_TRUE_1(encoder.writeBreak());
    EXPECT_EQ(out, "BF7F61616162FF21FF"_unhex);
    std::map<std::string, int> expected{{"ab", -2}};
    EXPECT_OUTCOME_EQ((decode<std::map<std::string, int>>(out)), expected);
  }

  /**
   * @given Encoder
   * @when Write headers directly
   * @then Headers as expected
   */
  TEST_F(CborEncoderTest, Headers) {
    EXPECT_OUTCOME_TRUE_1(encoder.writeTag(1));
    EXPECT_OUTCOME_TRUE_1(encoder.writeTag(32));
    EXPECT_OUTCOME_TRUE_1(encoder.writeTag(0x100));
    EXPECT_OUTCOME_TRUE_1(encoder.writeList(2));
    EXPECT_OUTCOME_TRUE_1(encoder.writeMap(24));
    EXPECT_OUTCOME_TRUE_1(encoder.writeHeader(CborToken::BYTES, 1));
    EXPECT_OUTCOME_TRUE_1(encoder.writeRaw("AB"_unhex));
    EXPECT_EQ(out, "C1D820D9010082B81841AB"_unhex);
  }
}  // namespace tc::codec::cbor
