/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_sink.hpp"

#include "common/span.hpp"

namespace tc::codec::cbor {
  BytesSink::BytesSink(Bytes &out) : out_{out} {}

  outcome::result<void> BytesSink::write(BytesIn bytes) {
    append(out_, bytes);
    return outcome::success();
  }

  OstreamSink::OstreamSink(std::ostream &os) : os_{os} {}

  outcome::result<void> OstreamSink::write(BytesIn bytes) {
    const auto str{common::span::bytestr(bytes)};
    if (!os_.write(str.data(), static_cast<std::streamsize>(str.size()))) {
      return std::make_error_code(std::errc::io_error);
    }
    return outcome::success();
  }
}  // namespace tc::codec::cbor
