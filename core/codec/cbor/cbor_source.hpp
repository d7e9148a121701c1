/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <istream>

#include <boost/optional.hpp>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace tc::codec::cbor {
  /** Origin of bytes to decode */
  class CborSource {
   public:
    virtual ~CborSource() = default;

    /**
     * Fills whole output or fails
     * @return CborDecodeError::kUnexpectedEof if input ends before,
     * std::errc::io_error category error if underlying read fails
     */
    virtual outcome::result<void> read(BytesOut out) = 0;

    /// Whether no bytes are left
    virtual outcome::result<bool> atEnd() = 0;

    /// Number of bytes left if known
    virtual boost::optional<size_t> remaining() const;
  };

  /** Reads from byte span, knows remaining size */
  class BytesSource : public CborSource {
   public:
    explicit BytesSource(BytesIn input);

    outcome::result<void> read(BytesOut out) override;
    outcome::result<bool> atEnd() override;
    boost::optional<size_t> remaining() const override;

   private:
    BytesIn input_;
  };

  /** Reads from input stream, remaining size unknown */
  class IstreamSource : public CborSource {
   public:
    explicit IstreamSource(std::istream &is);

    outcome::result<void> read(BytesOut out) override;
    outcome::result<bool> atEnd() override;

   private:
    std::istream &is_;
  };
}  // namespace tc::codec::cbor
