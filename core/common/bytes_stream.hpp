/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/iostreams/categories.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>

#include "common/span.hpp"

namespace tc {
  /// std::istream reading bytes in place
  struct BytesIstream {
    boost::iostreams::array_source device;
    boost::iostreams::stream<boost::iostreams::array_source> s;

    explicit BytesIstream(BytesIn bytes)
        : device{common::span::bytestr(bytes).data(),
                 static_cast<size_t>(bytes.size())},
          s{device} {}
  };

  /// Boost.Iostreams sink appending chars to bytes
  struct BytesAppendDevice {
    using char_type = char;
    using category = boost::iostreams::sink_tag;

    Bytes *bytes;

    std::streamsize write(const char *data, std::streamsize size) {
      append(*bytes, common::span::cbytes({data, static_cast<size_t>(size)}));
      return size;
    }
  };

  /// std::ostream appending to bytes, flush before reading them
  struct BytesOstream {
    boost::iostreams::stream<BytesAppendDevice> s;

    explicit BytesOstream(Bytes &bytes) : s{BytesAppendDevice{&bytes}} {}
  };
}  // namespace tc
