/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "codec/cbor/cbor_decoder.hpp"

namespace tc {
  std::string dumpBytes(BytesIn);

  /**
   * Renders one item in diagnostic notation.
   * Chunks of indefinite strings are shown concatenated.
   */
  outcome::result<void> dumpCbor(std::string &o,
                                 codec::cbor::CborDecoder &decoder);

  /**
   * Renders single item in diagnostic notation
   * @return "(empty)" for empty input, "(error:<hex>)" for malformed input
   */
  std::string dumpCbor(BytesIn);
}  // namespace tc
