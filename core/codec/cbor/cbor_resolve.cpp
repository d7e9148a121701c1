/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_resolve.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

OUTCOME_CPP_DEFINE_CATEGORY(tc::codec::cbor, CborResolveError, e) {
  using tc::codec::cbor::CborResolveError;
  switch (e) {
    case CborResolveError::kIntKeyExpected:
      return "Int key expected";
    case CborResolveError::kKeyNotFound:
      return "Key not found";
    case CborResolveError::kContainerExpected:
      return "Container expected";
    case CborResolveError::kIntKeyTooBig:
      return "Int key too big";
    default:
      return "Unknown error";
  }
}

namespace tc::codec::cbor {
  outcome::result<uint64_t> parseIndex(const std::string &str) {
    if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
      return CborResolveError::kIntKeyExpected;
    }
    uint64_t value{};
    size_t chars{};
    try {
      value = std::stoull(str, &chars);
    } catch (std::invalid_argument &) {
      return CborResolveError::kIntKeyExpected;
    } catch (std::out_of_range &) {
      return CborResolveError::kIntKeyTooBig;
    }
    if (chars != str.size()) {
      return CborResolveError::kIntKeyExpected;
    }
    return value;
  }

  outcome::result<const Value *> resolve(const Value &value,
                                         const std::string &part) {
    const auto *current{&value};
    while (const auto *tag{current->asTag()}) {
      current = &tag->value;
    }
    if (const auto *array{current->asArray()}) {
      OUTCOME_TRY(index, parseIndex(part));
      if (index >= array->size()) {
        return CborResolveError::kKeyNotFound;
      }
      return &(*array)[index];
    }
    if (const auto *map{current->asMap()}) {
      auto it{map->find(Value{part})};
      if (it == map->end()) {
        auto index{parseIndex(part)};
        if (!index) {
          return CborResolveError::kKeyNotFound;
        }
        if (index.value()
            > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
          return CborResolveError::kIntKeyTooBig;
        }
        it = map->find(Value{static_cast<int64_t>(index.value())});
        if (it == map->end()) {
          return CborResolveError::kKeyNotFound;
        }
      }
      return &it->second;
    }
    return CborResolveError::kContainerExpected;
  }

  outcome::result<const Value *> resolve(const Value &value, Path path) {
    const auto *current{&value};
    for (const auto &part : path) {
      OUTCOME_TRYA(current, resolve(*current, part));
    }
    return current;
  }
}  // namespace tc::codec::cbor
