/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace tc::common {
  namespace {
    constexpr auto kPattern{"%Y-%m-%d %H:%M:%S.%e %n %^%L%$ %v"};
  }  // namespace

  Logger createLogger(const std::string &tag) {
    auto logger{spdlog::get(tag)};
    if (!logger) {
      logger = spdlog::stderr_color_mt(tag);
      logger->set_pattern(kPattern);
      logger->set_level(spdlog::get_level());
    }
    return logger;
  }

  void setLogLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
  }
}  // namespace tc::common
