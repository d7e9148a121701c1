/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace tc::codec::cbor {
  constexpr uint8_t kExtraUint8{24};
  constexpr uint8_t kExtraUint16{25};
  constexpr uint8_t kExtraUint32{26};
  constexpr uint8_t kExtraUint64{27};
  constexpr uint8_t kExtraIndefinite{31};

  constexpr uint8_t kExtraFalse{20};
  constexpr uint8_t kExtraTrue{21};
  constexpr uint8_t kExtraNull{22};
  constexpr uint8_t kExtraUndefined{23};
  constexpr uint8_t kExtraSimple{24};
  constexpr uint8_t kExtraFloat16{25};
  constexpr uint8_t kExtraFloat32{26};
  constexpr uint8_t kExtraFloat64{27};

  constexpr uint8_t kBreak{0xFF};

  /// Item nesting limit of default decoder config
  constexpr size_t kDefaultMaxDepth{512};
  /// Largest single allocation made for a string of unknown length
  constexpr size_t kDefaultReadChunk{64 << 10};
  /// Largest number of elements reserved from untrusted count
  constexpr size_t kMaxReserve{1024};
}  // namespace tc::codec::cbor
