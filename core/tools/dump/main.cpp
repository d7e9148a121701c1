/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <boost/algorithm/string/erase.hpp>
#include <boost/program_options/errors.hpp>
#include <fstream>
#include <iostream>
#include <iterator>

#include "codec/cbor/cbor_codec.hpp"
#include "codec/cbor/cbor_dump.hpp"
#include "common/hexutil.hpp"
#include "common/span.hpp"
#include "tools/dump/config.hpp"

namespace tc::tools::dump {
  using codec::cbor::BytesSource;
  using codec::cbor::CborDecoder;

  auto log() {
    static common::Logger logger{common::createLogger("dump")};
    return logger;
  }

  outcome::result<Bytes> readInput(const Config &config) {
    std::string text;
    if (config.input) {
      std::ifstream file{config.input->string(), std::ios::binary};
      if (!file.good()) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
      }
      text.assign(std::istreambuf_iterator<char>{file}, {});
    } else {
      text.assign(std::istreambuf_iterator<char>{std::cin}, {});
    }
    if (config.hex) {
      boost::algorithm::erase_all(text, " ");
      boost::algorithm::erase_all(text, "\n");
      boost::algorithm::erase_all(text, "\r");
      boost::algorithm::erase_all(text, "\t");
      return common::unhex(text);
    }
    return copy(common::span::cbytes(text));
  }

  outcome::result<void> dumpAll(const Config &config, BytesIn input) {
    if (config.strict) {
      OUTCOME_TRY(codec::cbor::expectInput(input));
    }
    BytesSource source{input};
    CborDecoder decoder{source, config.decoder};
    size_t items{0};
    while (true) {
      OUTCOME_TRY(end, decoder.atEnd());
      if (end) {
        break;
      }
      if (config.strict && items != 0) {
        return codec::cbor::CborDecodeError::kTrailingData;
      }
      std::string o;
      OUTCOME_TRY(dumpCbor(o, decoder));
      std::cout << o << std::endl;
      ++items;
      log()->debug("item {} dumped", items);
    }
    log()->info("{} items dumped", items);
    return outcome::success();
  }

  int main(int argc, char **argv) {
    Config config;
    try {
      config = Config::read(argc, argv);
    } catch (const boost::program_options::error &e) {
      std::cerr << e.what() << std::endl;
      return EXIT_FAILURE;
    }
    common::setLogLevel(config.log_level);

    auto input{readInput(config)};
    if (!input) {
      log()->error("cannot read input: {}", input.error().message());
      return EXIT_FAILURE;
    }
    log()->info("read {} bytes", input.value().size());

    auto dumped{dumpAll(config, input.value())};
    if (!dumped) {
      log()->error("cannot decode input: {}", dumped.error().message());
      return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
  }
}  // namespace tc::tools::dump

int main(int argc, char **argv) {
  return tc::tools::dump::main(argc, argv);
}
