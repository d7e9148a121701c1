/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "codec/cbor/cbor_dump.hpp"
#include "codec/cbor/cbor_value.hpp"
#include "testutil/cbor.hpp"

namespace tc::codec::cbor {
  /// RFC 8949 Appendix A example
  struct RfcExample {
    const char *hex;
    const char *diagnostic;
    /// Value encodes back to same bytes
    bool canonical;
  };

  const RfcExample kExamples[]{
      {"00", "0", true},
      {"01", "1", true},
      {"0a", "10", true},
      {"17", "23", true},
      {"1818", "24", true},
      {"1819", "25", true},
      {"1864", "100", true},
      {"1903e8", "1000", true},
      {"1a000f4240", "1000000", true},
      {"1b000000e8d4a51000", "1000000000000", true},
      {"1bffffffffffffffff", "18446744073709551615", false},
      {"c249010000000000000000", "2(h'010000000000000000')", true},
      {"c349010000000000000000", "3(h'010000000000000000')", true},
      {"20", "-1", true},
      {"29", "-10", true},
      {"3863", "-100", true},
      {"3903e7", "-1000", true},
      {"f90000", "0.0", false},
      {"f98000", "-0.0", false},
      {"f93c00", "1.0", false},
      {"fb3ff199999999999a", "1.1", false},
      {"f93e00", "1.5", false},
      {"f97bff", "65504.0", false},
      {"fa47c35000", "100000.0", false},
      {"fa7f7fffff", "3.4028234663852886e+38", false},
      {"fb7e37e43c8800759c", "1e+300", false},
      {"f90001", "5.960464477539063e-08", false},
      {"f90400", "6.103515625e-05", false},
      {"f9c400", "-4.0", false},
      {"fbc010666666666666", "-4.1", false},
      {"f97c00", "Infinity", false},
      {"f97e00", "NaN", false},
      {"f9fc00", "-Infinity", false},
      {"fa7f800000", "Infinity", false},
      {"fa7fc00000", "NaN", false},
      {"faff800000", "-Infinity", false},
      {"fb7ff0000000000000", "Infinity", false},
      {"fb7ff8000000000000", "NaN", false},
      {"fbfff0000000000000", "-Infinity", false},
      {"f4", "false", true},
      {"f5", "true", true},
      {"f6", "null", true},
      {"c074323031332d30332d32315432303a30343a30305a",
       "0(\"2013-03-21T20:04:00Z\")",
       true},
      {"c11a514b67b0", "1(1363896240)", true},
      {"c1fb41d452d9ec200000", "1(1363896240.5)", true},
      {"d74401020304", "23(h'01020304')", true},
      {"d818456449455446", "24(h'6449455446')", true},
      {"d82076687474703a2f2f7777772e6578616d706c652e636f6d",
       "32(\"http://www.example.com\")",
       true},
      {"40", "h''", true},
      {"4401020304", "h'01020304'", true},
      {"60", "\"\"", true},
      {"6161", "\"a\"", true},
      {"6449455446", "\"IETF\"", true},
      {"62225c", "\"\\\"\\\\\"", true},
      {"62c3bc", "\"\xc3\xbc\"", true},
      {"63e6b0b4", "\"\xe6\xb0\xb4\"", true},
      {"64f0908591", "\"\xf0\x90\x85\x91\"", true},
      {"80", "[]", true},
      {"83010203", "[1, 2, 3]", true},
      {"8301820203820405", "[1, [2, 3], [4, 5]]", true},
      {"98190102030405060708090a0b0c0d0e0f101112131415161718181819",
       "[1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19, "
       "20, 21, 22, 23, 24, 25]",
       true},
      {"a0", "{}", true},
      {"a201020304", "{1: 2, 3: 4}", true},
      {"a26161016162820203", "{\"a\": 1, \"b\": [2, 3]}", true},
      {"826161a161626163", "[\"a\", {\"b\": \"c\"}]", true},
      {"a56161614161626142616361436164614461656145",
       "{\"a\": \"A\", \"b\": \"B\", \"c\": \"C\", \"d\": \"D\", \"e\": "
       "\"E\"}",
       true},
      {"5f42010243030405ff", "h'0102030405'", false},
      {"7f657374726561646d696e67ff", "\"streaming\"", false},
      {"9fff", "[_ ]", false},
      {"9f018202039f0405ffff", "[_ 1, [2, 3], [_ 4, 5]]", false},
      {"9f01820203820405ff", "[_ 1, [2, 3], [4, 5]]", false},
      {"83018202039f0405ff", "[1, [2, 3], [_ 4, 5]]", false},
      {"83019f0203ff820405", "[1, [_ 2, 3], [4, 5]]", false},
      {"9f0102030405060708090a0b0c0d0e0f101112131415161718181819ff",
       "[_ 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, "
       "19, 20, 21, 22, 23, 24, 25]",
       false},
      {"bf61610161629f0203ffff", "{_ \"a\": 1, \"b\": [_ 2, 3]}", false},
      {"826161bf61626163ff", "[\"a\", {_ \"b\": \"c\"}]", false},
      {"bf6346756ef563416d7421ff", "{_ \"Fun\": true, \"Amt\": -2}", false},
  };

  /**
   * @given RFC 8949 examples
   * @when Dump each
   * @then Diagnostic notation matches
   */
  TEST(CborRfc, Diagnostic) {
    for (const auto &example : kExamples) {
      SCOPED_TRACE(example.hex);
      auto bytes{common::unhex(example.hex).value()};
      EXPECT_EQ(dumpCbor(bytes), example.diagnostic);
    }
  }

  /**
   * @given RFC 8949 examples in preferred serialization
   * @when Decode to value and encode back
   * @then Same bytes
   */
  TEST(CborRfc, Reencode) {
    for (const auto &example : kExamples) {
      if (!example.canonical) {
        continue;
      }
      SCOPED_TRACE(example.hex);
      auto bytes{common::unhex(example.hex).value()};
      EXPECT_OUTCOME_TRUE(value, decode<Value>(bytes));
      EXPECT_OUTCOME_EQ(encode(value), bytes);
    }
  }

  /// Every example is valid CBOR
  TEST(CborRfc, Skip) {
    for (const auto &example : kExamples) {
      SCOPED_TRACE(example.hex);
      auto bytes{common::unhex(example.hex).value()};
      BytesSource source{bytes};
      CborDecoder decoder{source};
      EXPECT_OUTCOME_TRUE_1(decoder.skip());
      EXPECT_OUTCOME_EQ(decoder.atEnd(), true);
    }
  }

  /// Negative integers below int64 minimum are rejected
  TEST(CborRfc, NegativeOverflow) {
    EXPECT_EQ(dumpCbor("3bffffffffffffffff"_unhex),
              "(error:3bffffffffffffffff)");
    EXPECT_OUTCOME_ERROR(CborDecodeError::kIntOverflow,
                         decode<Value>("3bffffffffffffffff"_unhex));
    EXPECT_OUTCOME_ERROR(CborDecodeError::kIntOverflow,
                         decode<Value>("1bffffffffffffffff"_unhex));
  }
}  // namespace tc::codec::cbor
