/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tools/dump/config.hpp"

#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>

namespace tc::tools::dump {
  spdlog::level::level_enum getLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }

  Config Config::read(int argc, char **argv) {
    Config config;
    struct {
      char log_level;
      boost::optional<boost::filesystem::path> config_file;
      size_t max_depth;
      bool no_indefinite;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc("tagcbor_dump options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("input,i", po::value(&config.input), "input file, stdin if absent");
    option("config", po::value(&raw.config_file), "read options from file");
    option("hex",
           po::bool_switch(&config.hex),
           "input is hex text instead of raw bytes");
    option("strict",
           po::bool_switch(&config.strict),
           "input must be single item without trailing bytes");
    option("log,l",
           po::value(&raw.log_level)->default_value('w'),
           "log level, [e,w,i,d,t]");
    option("max-depth",
           po::value(&raw.max_depth)
               ->default_value(codec::cbor::kDefaultMaxDepth),
           "maximal nesting of lists, maps and tags");
    option("no-indefinite",
           po::bool_switch(&raw.no_indefinite),
           "reject indefinite length items");

    po::positional_options_description positional;
    positional.add("input", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    po::notify(vm);
    if (raw.config_file) {
      std::ifstream config_file{raw.config_file->string()};
      if (!config_file.good()) {
        throw po::error{"cannot open config file "
                        + raw.config_file->string()};
      }
      po::store(po::parse_config_file(config_file, desc), vm);
      po::notify(vm);
    }

    config.log_level = getLogLevel(raw.log_level);
    config.decoder.max_depth = raw.max_depth;
    config.decoder.allow_indefinite = !raw.no_indefinite;
    return config;
  }
}  // namespace tc::tools::dump
