/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string>
#include <string_view>

#include "codec/cbor/cbor_shape.hpp"

#define CBOR_ENCODE(type, var)                       \
  inline ::tc::outcome::result<void> cborEncode(     \
      ::tc::codec::cbor::CborEncoder &e,             \
      const type &var)  // NOLINT(bugprone-macro-parentheses)

#define CBOR_DECODE(type, var)                       \
  inline ::tc::outcome::result<void> cborDecode(     \
      ::tc::codec::cbor::CborDecoder &d,             \
      type &var)  // NOLINT(bugprone-macro-parentheses)

#define CBOR2_DECODE(...)                          \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */ \
  ::tc::outcome::result<void> cborDecode(          \
      ::tc::codec::cbor::CborDecoder &d, __VA_ARGS__ &v)
#define CBOR2_ENCODE(...)                 \
  ::tc::outcome::result<void> cborEncode( \
      ::tc::codec::cbor::CborEncoder &e, const __VA_ARGS__ &v)
#define CBOR2_DECODE_ENCODE(...) \
  CBOR2_DECODE(__VA_ARGS__);     \
  CBOR2_ENCODE(__VA_ARGS__);

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_1(op, m) op(m)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_2(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_1(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_3(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_2(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_4(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_3(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_5(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_4(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_6(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_5(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_7(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_6(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_8(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_7(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_9(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_8(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_10(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_9(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_11(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_10(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_12(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_11(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_13(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_12(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_14(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_13(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_15(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_14(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_16(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_15(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_17(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_16(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_18(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_17(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_19(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_18(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_20(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_19(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_21(op, m, ...) \
  _CBOR_FIELDS_1(op, m) _CBOR_FIELDS_20(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_V(_1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, \
                       _12, _13, _14, _15, _16, _17, _18, _19, _20, \
                       _21, f, ...)                                  \
  f
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS(op, ...) \
  _CBOR_FIELDS_V(__VA_ARGS__,    \
                 _CBOR_FIELDS_21, \
                 _CBOR_FIELDS_20, \
                 _CBOR_FIELDS_19, \
                 _CBOR_FIELDS_18, \
                 _CBOR_FIELDS_17, \
                 _CBOR_FIELDS_16, \
                 _CBOR_FIELDS_15, \
                 _CBOR_FIELDS_14, \
                 _CBOR_FIELDS_13, \
                 _CBOR_FIELDS_12, \
                 _CBOR_FIELDS_11, \
                 _CBOR_FIELDS_10, \
                 _CBOR_FIELDS_9, \
                 _CBOR_FIELDS_8, \
                 _CBOR_FIELDS_7, \
                 _CBOR_FIELDS_6, \
                 _CBOR_FIELDS_5, \
                 _CBOR_FIELDS_4, \
                 _CBOR_FIELDS_3, \
                 _CBOR_FIELDS_2, \
                 _CBOR_FIELDS_1) \
  (op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_COUNT(...)                                                \
  _CBOR_FIELDS_V(                                                        \
      __VA_ARGS__, 21, 20, 19, 18, 17, 16, 15, 14, 13, 12, 11, 10, 9, 8, \
      7, 6, 5, 4, 3, 2, 1)

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_ENCODE_ELEMENT(m) OUTCOME_TRY(e.encode(t.m));
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_DECODE_ELEMENT(m) \
  OUTCOME_TRY(::tc::codec::cbor::cborDecodeElement(cbor_list, t.m));
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_COUNT_PRESENT(m)                        \
  if (::tc::codec::cbor::cborIsPresent(t.m)) {        \
    ++cbor_count;                                     \
  }
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_ENCODE_ENTRY(m)                         \
  if (::tc::codec::cbor::cborIsPresent(t.m)) {        \
    OUTCOME_TRY(cbor_map.entry(#m, t.m));             \
  }
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_DECODE_ENTRY(m)                           \
  if (!cbor_matched && cbor_key == #m) {                \
    OUTCOME_TRY(cbor_map.decoder().decode(t.m));        \
    cbor_found[cbor_index] = cbor_matched = true;       \
  }                                                     \
  ++cbor_index;
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_CHECK_ENTRY(m)                                             \
  if (!cbor_found[cbor_index]                                            \
      && !::tc::codec::cbor::cborResetMissing(t.m)) {                    \
    return ::tc::codec::cbor::CborDecodeError::kKeyNotFound;             \
  }                                                                      \
  ++cbor_index;

/**
 * Defines encoding of struct as fixed size list of fields in given order.
 * Decoding requires exactly that many elements.
 */
#define CBOR_TUPLE(T, ...)                                                 \
  CBOR_ENCODE(T, t) {                                                      \
    OUTCOME_TRY(e.writeList(_CBOR_COUNT(__VA_ARGS__)));                    \
    _CBOR_FIELDS(_CBOR_ENCODE_ELEMENT, __VA_ARGS__)                        \
    return ::tc::outcome::success();                                       \
  }                                                                        \
  CBOR_DECODE(T, t) {                                                      \
    return d.readList(                                                     \
        [&](::tc::codec::cbor::CborSeqAccess &cbor_list)                   \
            -> ::tc::outcome::result<void> {                               \
          OUTCOME_TRY(::tc::codec::cbor::cborExpectCount(                  \
              cbor_list, _CBOR_COUNT(__VA_ARGS__)));                       \
          _CBOR_FIELDS(_CBOR_DECODE_ELEMENT, __VA_ARGS__)                  \
          return ::tc::codec::cbor::cborDecodeEnd(cbor_list);              \
        });                                                                \
  }

/**
 * Defines encoding of struct as map from field names to values.
 * Empty optional fields are omitted on encode and may be missing on decode,
 * unknown keys are skipped.
 */
#define CBOR_RECORD(T, ...)                                                \
  CBOR_ENCODE(T, t) {                                                      \
    size_t cbor_count{0};                                                  \
    _CBOR_FIELDS(_CBOR_COUNT_PRESENT, __VA_ARGS__)                         \
    ::tc::codec::cbor::CborMapEncoder cbor_map{e};                         \
    OUTCOME_TRY(cbor_map.begin(cbor_count));                               \
    _CBOR_FIELDS(_CBOR_ENCODE_ENTRY, __VA_ARGS__)                          \
    return cbor_map.end();                                                 \
  }                                                                        \
  CBOR_DECODE(T, t) {                                                      \
    return d.readMap(                                                      \
        [&](::tc::codec::cbor::CborSeqAccess &cbor_map)                    \
            -> ::tc::outcome::result<void> {                               \
          std::array<bool, _CBOR_COUNT(__VA_ARGS__)> cbor_found{};         \
          while (true) {                                                   \
            OUTCOME_TRY(cbor_more, cbor_map.next());                       \
            if (!cbor_more) {                                              \
              break;                                                       \
            }                                                              \
            std::string cbor_key;                                          \
            OUTCOME_TRY(cbor_map.decoder().decode(cbor_key));              \
            size_t cbor_index{0};                                          \
            bool cbor_matched{false};                                      \
            _CBOR_FIELDS(_CBOR_DECODE_ENTRY, __VA_ARGS__)                  \
            if (!cbor_matched) {                                           \
              OUTCOME_TRY(cbor_map.decoder().skip());                      \
            }                                                              \
          }                                                                \
          size_t cbor_index{0};                                            \
          _CBOR_FIELDS(_CBOR_CHECK_ENTRY, __VA_ARGS__)                     \
          return ::tc::outcome::success();                                 \
        });                                                                \
  }

/**
 * Defines encoding of single field wrapper as single element list.
 * Bare inner value is accepted on decode.
 */
#define CBOR_NEWTYPE(T, m)                                       \
  CBOR_ENCODE(T, t) {                                            \
    return ::tc::codec::cbor::cborEncodeNewtype(e, t.m);         \
  }                                                              \
  CBOR_DECODE(T, t) {                                            \
    return ::tc::codec::cbor::cborDecodeNewtype(d, t.m);         \
  }

/// Names data alternative of std::variant
#define CBOR_VARIANT_NAME(T, name)                      \
  inline std::string_view cborVariantName(const T *) { \
    return name;                                        \
  }

/// Names payload-free alternative of std::variant, written as name only
#define CBOR_UNIT(T, name)                    \
  CBOR_VARIANT_NAME(T, name)                  \
  constexpr bool cborIsUnit(const T *) {      \
    return true;                              \
  }
