/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#define TC_OPERATOR_NOT_EQUAL_2(L, R)              \
  inline bool operator!=(const L &l, const R &r) { \
    return !(l == r);                              \
  }
#define TC_OPERATOR_NOT_EQUAL(T) TC_OPERATOR_NOT_EQUAL_2(T, T)

#define TC_OPERATOR_GREATER(T)                           \
  inline bool operator>(const T &l, const T &r) {        \
    return r < l;                                        \
  }                                                      \
  inline bool operator<=(const T &l, const T &r) {       \
    return !(r < l);                                     \
  }                                                      \
  inline bool operator>=(const T &l, const T &r) {       \
    return !(l < r);                                     \
  }
