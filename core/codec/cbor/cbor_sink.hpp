/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ostream>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace tc::codec::cbor {
  /** Destination of encoded bytes */
  class CborSink {
   public:
    virtual ~CborSink() = default;

    /**
     * Writes all bytes or fails
     * @return std::errc::io_error category error on failure
     */
    virtual outcome::result<void> write(BytesIn bytes) = 0;
  };

  /** Appends to byte buffer, never fails */
  class BytesSink : public CborSink {
   public:
    explicit BytesSink(Bytes &out);

    outcome::result<void> write(BytesIn bytes) override;

   private:
    Bytes &out_;
  };

  /** Writes to output stream */
  class OstreamSink : public CborSink {
   public:
    explicit OstreamSink(std::ostream &os);

    outcome::result<void> write(BytesIn bytes) override;

   private:
    std::ostream &os_;
  };
}  // namespace tc::codec::cbor
