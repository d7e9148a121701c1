/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/cbor.hpp"
#include "common/hexutil.hpp"
#include "common/logger.hpp"
