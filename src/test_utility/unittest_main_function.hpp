/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef irr_test_utility_unittest_main_function_hpp
#define irr_test_utility_unittest_main_function_hpp

#include "libirr/Error.hpp"
#include "libirr/Logger.hpp"

// WATCH OUT!
// boost libraries must be included before CppUTest, so in order to be
// on the safe side include this file as the last header file in the test code
#include <CppUTest/CommandLineTestRunner.h>
#include <CppUTest/MemoryLeakWarningPlugin.h>


// boost::regex keeps a cache of memory blocks and function-local statics
// that CppUTest would report as leaks
#define IRR_UNITTEST_MAIN_FUNCTION() \
int main(int argc, char **argv) { \
    MemoryLeakWarningPlugin::turnOffNewDeleteOverloads(); \
    try { \
        return CommandLineTestRunner::RunAllTests(argc, argv); \
    } \
    catch(const libirr::Error& e) { \
        libirr::Logger::getInstance().logErrorTrace(e, "test"); \
        throw; \
    } \
}

#endif
