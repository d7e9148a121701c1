/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "codec/cbor/cbor_config.hpp"
#include "common/logger.hpp"

namespace tc::tools::dump {
  struct Config {
    spdlog::level::level_enum log_level{spdlog::level::warn};
    /** Reads stdin if not set */
    boost::optional<boost::filesystem::path> input;
    /** Input is hex text, whitespace is ignored */
    bool hex{false};
    /** Input must be exactly one item */
    bool strict{false};
    codec::cbor::CborDecoderConfig decoder;

    /**
     * Reads command line, then config file if given.
     * Exits on --help, throws boost::program_options::error on bad options.
     */
    static Config read(int argc, char **argv);
  };

  spdlog::level::level_enum getLogLevel(char level);
}  // namespace tc::tools::dump
