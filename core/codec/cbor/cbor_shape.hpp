/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <iterator>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>

#include <boost/optional.hpp>

#include "codec/cbor/cbor_decoder.hpp"
#include "codec/cbor/cbor_encode_buffer.hpp"
#include "codec/cbor/cbor_errors.hpp"
#include "common/enum.hpp"

namespace tc::codec::cbor {
  /** Encodes integer, bool or enum */
  template <
      typename T,
      typename = std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>>>
  outcome::result<void> cborEncode(CborEncoder &e, T value) {
    if constexpr (std::is_enum_v<T>) {
      return cborEncode(e, common::to_int(value));
    } else if constexpr (std::is_same_v<T, bool>) {
      return e.writeBool(value);
    } else if constexpr (std::is_unsigned_v<T>) {
      return e.writeUint(value);
    } else {
      return e.writeInt(value);
    }
  }

  /** Decodes integer, bool or enum, checks integer range */
  template <
      typename T,
      typename = std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>>>
  outcome::result<void> cborDecode(CborDecoder &d, T &value) {
    if constexpr (std::is_enum_v<T>) {
      std::underlying_type_t<T> raw{};
      OUTCOME_TRY(cborDecode(d, raw));
      value = common::from_int<T>(raw);
    } else if constexpr (std::is_same_v<T, bool>) {
      OUTCOME_TRYA(value, d.readBool());
    } else if constexpr (std::is_unsigned_v<T>) {
      OUTCOME_TRY(raw, d.readUint());
      if (raw > std::numeric_limits<T>::max()) {
        return CborDecodeError::kIntOverflow;
      }
      value = static_cast<T>(raw);
    } else {
      OUTCOME_TRY(raw, d.readInt());
      if (raw < std::numeric_limits<T>::min()
          || raw > std::numeric_limits<T>::max()) {
        return CborDecodeError::kIntOverflow;
      }
      value = static_cast<T>(raw);
    }
    return outcome::success();
  }

  inline outcome::result<void> cborEncode(CborEncoder &e, float value) {
    return e.writeFloat32(value);
  }

  inline outcome::result<void> cborEncode(CborEncoder &e, double value) {
    return e.writeFloat64(value);
  }

  inline outcome::result<void> cborDecode(CborDecoder &d, double &value) {
    OUTCOME_TRYA(value, d.readFloat());
    return outcome::success();
  }

  inline outcome::result<void> cborDecode(CborDecoder &d, float &value) {
    OUTCOME_TRY(raw, d.readFloat());
    value = static_cast<float>(raw);
    return outcome::success();
  }

  inline outcome::result<void> cborEncode(CborEncoder &e, std::nullptr_t) {
    return e.writeNull();
  }

  inline outcome::result<void> cborDecode(CborDecoder &d, std::nullptr_t &) {
    return d.readNull();
  }

  inline outcome::result<void> cborEncode(CborEncoder &e,
                                          std::string_view str) {
    return e.writeStr(str);
  }

  inline outcome::result<void> cborEncode(CborEncoder &e,
                                          const std::string &str) {
    return e.writeStr(str);
  }

  inline outcome::result<void> cborEncode(CborEncoder &e, const char *str) {
    return e.writeStr(str);
  }

  inline outcome::result<void> cborDecode(CborDecoder &d, std::string &str) {
    OUTCOME_TRYA(str, d.readStr());
    return outcome::success();
  }

  /** Byte vector is byte string, not list */
  inline outcome::result<void> cborEncode(CborEncoder &e, const Bytes &bytes) {
    return e.writeBytes(bytes);
  }

  inline outcome::result<void> cborEncode(CborEncoder &e, BytesIn bytes) {
    return e.writeBytes(bytes);
  }

  inline outcome::result<void> cborDecode(CborDecoder &d, Bytes &bytes) {
    OUTCOME_TRYA(bytes, d.readBytes());
    return outcome::success();
  }

  /** Fixed size byte array is byte string of exactly that size */
  template <size_t N>
  outcome::result<void> cborEncode(CborEncoder &e, const BytesN<N> &bytes) {
    return e.writeBytes(bytes);
  }

  template <size_t N>
  outcome::result<void> cborDecode(CborDecoder &d, BytesN<N> &bytes) {
    OUTCOME_TRY(raw, d.readBytes());
    if (raw.size() != N) {
      return CborDecodeError::kWrongSize;
    }
    std::copy(raw.begin(), raw.end(), bytes.begin());
    return outcome::success();
  }

  /** Advances to next element and decodes it, fails if none left */
  template <typename T>
  outcome::result<void> cborDecodeElement(CborSeqAccess &seq, T &value) {
    OUTCOME_TRY(more, seq.next());
    if (!more) {
      return CborDecodeError::kWrongSize;
    }
    return seq.decoder().decode(value);
  }

  /** Checks that sequence has no elements left */
  inline outcome::result<void> cborDecodeEnd(CborSeqAccess &seq) {
    OUTCOME_TRY(more, seq.next());
    if (more) {
      return CborDecodeError::kWrongSize;
    }
    return outcome::success();
  }

  /** Checks declared count of fixed size list */
  inline outcome::result<void> cborExpectCount(const CborSeqAccess &seq,
                                               uint64_t count) {
    if (seq.count() && *seq.count() != count) {
      return CborDecodeError::kWrongSize;
    }
    return outcome::success();
  }

  /** Encodes values as list of known size */
  template <typename... Ts>
  outcome::result<void> cborEncodeElements(CborEncoder &e,
                                           const Ts &...values) {
    OUTCOME_TRY(e.writeList(sizeof...(Ts)));
    outcome::result<void> result{outcome::success()};
    (void)((result = e.encode(values), result.has_value()) && ...);
    return result;
  }

  /** Decodes list of exactly as many elements as values */
  template <typename... Ts>
  outcome::result<void> cborDecodeElements(CborDecoder &d, Ts &...values) {
    return d.readList([&](CborSeqAccess &list) -> outcome::result<void> {
      OUTCOME_TRY(cborExpectCount(list, sizeof...(Ts)));
      outcome::result<void> result{outcome::success()};
      (void)((result = cborDecodeElement(list, values), result.has_value())
             && ...);
      if (!result) {
        return result;
      }
      return cborDecodeEnd(list);
    });
  }

  /**
   * Encodes elements of range as list.
   * Single pass ranges have unknown size, so they are buffered first.
   */
  template <typename It>
  outcome::result<void> cborEncodeRange(CborEncoder &e, It begin, It end) {
    using Category = typename std::iterator_traits<It>::iterator_category;
    if constexpr (std::is_base_of_v<std::forward_iterator_tag, Category>) {
      OUTCOME_TRY(e.writeList(std::distance(begin, end)));
      for (auto it{begin}; it != end; ++it) {
        OUTCOME_TRY(e.encode(*it));
      }
      return outcome::success();
    } else {
      auto buffer{CborEncodeBuffer::list(e.config())};
      for (auto it{begin}; it != end; ++it) {
        OUTCOME_TRY(buffer.add(*it));
      }
      return buffer.flush(e);
    }
  }

  template <typename T>
  outcome::result<void> cborEncode(CborEncoder &e,
                                   const std::vector<T> &values) {
    return cborEncodeRange(e, values.begin(), values.end());
  }

  template <typename T>
  outcome::result<void> cborDecode(CborDecoder &d, std::vector<T> &values) {
    values.clear();
    return d.readList([&](CborSeqAccess &list) -> outcome::result<void> {
      if (auto count{list.count()}) {
        // count is untrusted until elements are actually read
        values.reserve(std::min<uint64_t>(*count, kMaxReserve));
      }
      while (true) {
        OUTCOME_TRY(more, list.next());
        if (!more) {
          return outcome::success();
        }
        T value{};
        OUTCOME_TRY(list.decoder().decode(value));
        values.push_back(std::move(value));
      }
    });
  }

  template <typename T, size_t N>
  outcome::result<void> cborEncode(CborEncoder &e,
                                   const std::array<T, N> &values) {
    return cborEncodeRange(e, values.begin(), values.end());
  }

  template <typename T, size_t N>
  outcome::result<void> cborDecode(CborDecoder &d, std::array<T, N> &values) {
    return d.readList([&](CborSeqAccess &list) -> outcome::result<void> {
      OUTCOME_TRY(cborExpectCount(list, N));
      for (auto &value : values) {
        OUTCOME_TRY(cborDecodeElement(list, value));
      }
      return cborDecodeEnd(list);
    });
  }

  template <typename K, typename V>
  outcome::result<void> cborEncode(CborEncoder &e,
                                   const std::map<K, V> &items) {
    CborMapEncoder m{e};
    OUTCOME_TRY(m.begin(items.size()));
    for (const auto &item : items) {
      OUTCOME_TRY(m.entry(item.first, item.second));
    }
    return m.end();
  }

  /** Later duplicate key replaces earlier */
  template <typename K, typename V>
  outcome::result<void> cborDecode(CborDecoder &d, std::map<K, V> &items) {
    items.clear();
    return d.readMap([&](CborSeqAccess &map) -> outcome::result<void> {
      while (true) {
        OUTCOME_TRY(more, map.next());
        if (!more) {
          return outcome::success();
        }
        K key{};
        OUTCOME_TRY(map.decoder().decode(key));
        V value{};
        OUTCOME_TRY(map.decoder().decode(value));
        items.insert_or_assign(std::move(key), std::move(value));
      }
    });
  }

  template <typename A, typename B>
  outcome::result<void> cborEncode(CborEncoder &e, const std::pair<A, B> &p) {
    return cborEncodeElements(e, p.first, p.second);
  }

  template <typename A, typename B>
  outcome::result<void> cborDecode(CborDecoder &d, std::pair<A, B> &p) {
    return cborDecodeElements(d, p.first, p.second);
  }

  template <typename... Ts>
  outcome::result<void> cborEncode(CborEncoder &e, const std::tuple<Ts...> &t) {
    return std::apply(
        [&](const auto &...values) { return cborEncodeElements(e, values...); },
        t);
  }

  template <typename... Ts>
  outcome::result<void> cborDecode(CborDecoder &d, std::tuple<Ts...> &t) {
    return std::apply(
        [&](auto &...values) { return cborDecodeElements(d, values...); }, t);
  }

  /// Encodes nullable optional value
  /// Types which read tag header themselves instead of skipping it
  template <typename T>
  struct CborKeepsTag : std::false_type {};

  /**
   * Consumes null or undefined of optional value, tagged null too.
   * @return false if value is absent
   */
  template <typename T>
  outcome::result<bool> cborDecodePresent(CborDecoder &d) {
    if constexpr (!CborKeepsTag<T>::value) {
      OUTCOME_TRY(d.skipTags());
    }
    OUTCOME_TRY(null, d.isNull());
    if (null) {
      OUTCOME_TRY(d.readNull());
      return false;
    }
    return true;
  }

  template <typename T>
  outcome::result<void> cborEncode(CborEncoder &e,
                                   const boost::optional<T> &optional) {
    if (optional) {
      return e.encode(*optional);
    }
    return e.writeNull();
  }

  template <typename T>
  outcome::result<void> cborDecode(CborDecoder &d,
                                   boost::optional<T> &optional) {
    OUTCOME_TRY(present, cborDecodePresent<T>(d));
    if (!present) {
      optional = boost::none;
      return outcome::success();
    }
    T value{};
    OUTCOME_TRY(d.decode(value));
    optional = std::move(value);
    return outcome::success();
  }

  template <typename T>
  outcome::result<void> cborEncode(CborEncoder &e,
                                   const std::optional<T> &optional) {
    if (optional) {
      return e.encode(*optional);
    }
    return e.writeNull();
  }

  template <typename T>
  outcome::result<void> cborDecode(CborDecoder &d, std::optional<T> &optional) {
    OUTCOME_TRY(present, cborDecodePresent<T>(d));
    if (!present) {
      optional.reset();
      return outcome::success();
    }
    T value{};
    OUTCOME_TRY(d.decode(value));
    optional = std::move(value);
    return outcome::success();
  }

  /// Whether record field is written, empty optional fields are omitted
  template <typename T>
  bool cborIsPresent(const T &) {
    return true;
  }
  template <typename T>
  bool cborIsPresent(const boost::optional<T> &optional) {
    return optional.has_value();
  }
  template <typename T>
  bool cborIsPresent(const std::optional<T> &optional) {
    return optional.has_value();
  }

  /// Resets missing record field, false if field is required
  template <typename T>
  bool cborResetMissing(T &) {
    return false;
  }
  template <typename T>
  bool cborResetMissing(boost::optional<T> &optional) {
    optional = boost::none;
    return true;
  }
  template <typename T>
  bool cborResetMissing(std::optional<T> &optional) {
    optional.reset();
    return true;
  }

  /** Newtype wrapper is written as single element list */
  template <typename T>
  outcome::result<void> cborEncodeNewtype(CborEncoder &e, const T &inner) {
    return cborEncodeElements(e, inner);
  }

  /**
   * Decodes newtype wrapper.
   * Tags in front of wrapper are skipped, unless inner value keeps them.
   * Any item except list is bare legacy form of inner value.
   * List must have single element.
   */
  template <typename T>
  outcome::result<void> cborDecodeNewtype(CborDecoder &d, T &inner) {
    if constexpr (!CborKeepsTag<T>::value) {
      OUTCOME_TRY(d.skipTags());
    }
    OUTCOME_TRY(token, d.peekHeader());
    if (token.type != CborToken::LIST) {
      return d.decode(inner);
    }
    return cborDecodeElements(d, inner);
  }

  /// Types are not unit variants unless marked with CBOR_UNIT
  constexpr bool cborIsUnit(const void *) {
    return false;
  }

  namespace detail {
    template <typename T>
    constexpr bool isUnit() {
      return cborIsUnit(static_cast<const T *>(nullptr));
    }

    template <typename T>
    std::string_view variantName() {
      return cborVariantName(static_cast<const T *>(nullptr));
    }

    template <size_t I = 0, typename V>
    outcome::result<void> decodeAlternative(CborDecoder *d,
                                            V &variant,
                                            std::string_view name) {
      if constexpr (I == std::variant_size_v<V>) {
        return CborDecodeError::kUnknownVariant;
      } else {
        using T = std::variant_alternative_t<I, V>;
        if (variantName<T>() != name) {
          return decodeAlternative<I + 1>(d, variant, name);
        }
        if constexpr (isUnit<T>()) {
          // unit variant is written as name only
          if (d) {
            return CborDecodeError::kWrongType;
          }
          variant.template emplace<I>();
        } else {
          if (!d) {
            return CborDecodeError::kWrongType;
          }
          T value{};
          OUTCOME_TRY(d->decode(value));
          variant.template emplace<I>(std::move(value));
        }
        return outcome::success();
      }
    }

    template <typename V>
    struct VariantVisitor : CborVisitor {
      V &variant;

      explicit VariantVisitor(V &variant) : variant{variant} {}

      outcome::result<void> visitStr(std::string name) override {
        return decodeAlternative(nullptr, variant, name);
      }

      outcome::result<void> visitMap(CborSeqAccess &map) override {
        OUTCOME_TRY(cborExpectCount(map, 1));
        std::string name;
        OUTCOME_TRY(cborDecodeElement(map, name));
        OUTCOME_TRY(decodeAlternative(&map.decoder(), variant, name));
        return cborDecodeEnd(map);
      }
    };
  }  // namespace detail

  /**
   * Encodes enumerated variant.
   * Unit alternative is text name, data alternative is single entry map from
   * name to payload.
   */
  template <typename... Ts>
  outcome::result<void> cborEncode(CborEncoder &e,
                                   const std::variant<Ts...> &variant) {
    if (variant.valueless_by_exception()) {
      return CborEncodeError::kUnrepresentable;
    }
    return std::visit(
        [&](const auto &value) -> outcome::result<void> {
          using T = std::decay_t<decltype(value)>;
          if constexpr (detail::isUnit<T>()) {
            return e.writeStr(detail::variantName<T>());
          } else {
            OUTCOME_TRY(e.writeMap(1));
            OUTCOME_TRY(e.writeStr(detail::variantName<T>()));
            return e.encode(value);
          }
        },
        variant);
  }

  template <typename... Ts>
  outcome::result<void> cborDecode(CborDecoder &d,
                                   std::variant<Ts...> &variant) {
    detail::VariantVisitor<std::variant<Ts...>> visitor{variant};
    return d.decodeAny(visitor);
  }
}  // namespace tc::codec::cbor
