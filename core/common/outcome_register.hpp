/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>

/**
 * Registers error enum as std::error_code source.
 * Usage:
 * @code
 * // header
 * namespace my { enum class MyError { kFirst = 1 }; }
 * OUTCOME_HPP_DECLARE_ERROR(my, MyError);
 *
 * // source
 * OUTCOME_CPP_DEFINE_CATEGORY(my, MyError, e) {
 *   switch (e) { case MyError::kFirst: return "first"; }
 *   return "unknown";
 * }
 * @endcode
 */
#define OUTCOME_HPP_DECLARE_ERROR(ns, Enum)                     \
  namespace std {                                               \
    template <>                                                 \
    struct is_error_code_enum<ns::Enum> : std::true_type {};    \
  }                                                             \
  namespace ns {                                                \
    const std::error_category &Enum##__category() noexcept;     \
    inline std::error_code make_error_code(Enum e) noexcept {   \
      return {static_cast<int>(e), Enum##__category()};         \
    }                                                           \
  }

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_CPP_DEFINE_CATEGORY(ns, Enum, e)                         \
  namespace ns {                                                          \
    class Enum##__Category : public std::error_category {                 \
     public:                                                              \
      const char *name() const noexcept override {                       \
        return #Enum;                                                     \
      }                                                                   \
      std::string message(int value) const override {                    \
        return toString(static_cast<Enum>(value));                        \
      }                                                                   \
      static std::string toString(Enum e);                                \
    };                                                                    \
    const std::error_category &Enum##__category() noexcept {              \
      static const Enum##__Category category;                             \
      return category;                                                    \
    }                                                                     \
  }                                                                       \
  std::string ns::Enum##__Category::toString(ns::Enum e)

#define OUTCOME_CPP_DEFINE_CATEGORY(ns, Enum, e) \
  _OUTCOME_CPP_DEFINE_CATEGORY(ns, Enum, e)
