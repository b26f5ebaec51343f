/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libirr_LogLevel_hpp
#define libirr_LogLevel_hpp

namespace libirr {

enum class LogLevel {DEBUG, INFO, WARN, ERROR, GENERAL};

}

#endif
