/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_source.hpp"

#include <cstring>

#include "codec/cbor/cbor_errors.hpp"
#include "common/span.hpp"

namespace tc::codec::cbor {
  boost::optional<size_t> CborSource::remaining() const {
    return boost::none;
  }

  BytesSource::BytesSource(BytesIn input) : input_{input} {}

  outcome::result<void> BytesSource::read(BytesOut out) {
    if (input_.size() < out.size()) {
      return CborDecodeError::kUnexpectedEof;
    }
    if (!out.empty()) {
      std::memcpy(out.data(), input_.data(), out.size());
    }
    input_ = input_.subspan(out.size());
    return outcome::success();
  }

  outcome::result<bool> BytesSource::atEnd() {
    return input_.empty();
  }

  boost::optional<size_t> BytesSource::remaining() const {
    return static_cast<size_t>(input_.size());
  }

  IstreamSource::IstreamSource(std::istream &is) : is_{is} {}

  outcome::result<void> IstreamSource::read(BytesOut out) {
    if (out.empty()) {
      return outcome::success();
    }
    const auto size{static_cast<std::streamsize>(out.size())};
    is_.read(common::span::cast<char>(out.data()), size);
    if (is_.gcount() == size) {
      return outcome::success();
    }
    if (is_.bad()) {
      return std::make_error_code(std::errc::io_error);
    }
    return CborDecodeError::kUnexpectedEof;
  }

  outcome::result<bool> IstreamSource::atEnd() {
    if (is_.peek() == std::istream::traits_type::eof()) {
      if (is_.bad()) {
        return std::make_error_code(std::errc::io_error);
      }
      return true;
    }
    return false;
  }
}  // namespace tc::codec::cbor
