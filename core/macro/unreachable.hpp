/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * @brief This file declares XRPCODEC_UNREACHABLE macro. Use it after
 * exhaustive switches over closed enums to prevent compiler warnings.
 */

#if defined(__GNUC__)
#define XRPCODEC_UNREACHABLE __builtin_unreachable();
#elif defined(_MSC_VER)
#define XRPCODEC_UNREACHABLE __assume(false);
#else
template <unsigned int LINE>
class Unreachable_At_Line {};
#define XRPCODEC_UNREACHABLE throw Unreachable_At_Line<__LINE__>();  // NOLINT
#endif
