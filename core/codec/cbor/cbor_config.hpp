/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>

#include "codec/cbor/cbor_common.hpp"

namespace tc::codec::cbor {
  struct CborEncoderConfig {
    /**
     * Write map entries in RFC 8949 §4.2.1 order (bytewise order of encoded
     * keys). Maps are buffered before write when set.
     */
    bool sort_map_keys{false};
  };

  struct CborDecoderConfig {
    /// Maximal nesting of arrays, maps and tags
    size_t max_depth{kDefaultMaxDepth};
    /// Accept indefinite length strings, arrays and maps
    bool allow_indefinite{true};
    /// Allocation step for strings when remaining input size is unknown
    size_t read_chunk{kDefaultReadChunk};
  };
}  // namespace tc::codec::cbor
