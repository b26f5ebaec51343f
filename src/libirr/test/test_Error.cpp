/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <ios>
#include <stdexcept>
#include <string>
#include <system_error>

#include <boost/lexical_cast/bad_lexical_cast.hpp>
#include <boost/regex/pattern_except.hpp>

#include "libirr/Error.hpp"
#include "test_utility/unittest_main_function.hpp"

TEST_GROUP(ErrorTestGroup) {
};

static int lineOfFirstThrow;
static int lineOfRethrow;

void functionThatThrows() {
    lineOfFirstThrow = __LINE__; IRR_THROW_ERROR("first error message");
}

void functionThatRethrows() {
    try {
        functionThatThrows();
    }
    catch(libirr::Error& error) {
        lineOfRethrow = __LINE__; IRR_RETHROW_ERROR(error, "second error message");
    }
}

void functionThatThrowsFromStdException() {
    auto stdException = std::runtime_error("first error message");
    const auto& ref = stdException;
    lineOfRethrow = __LINE__; IRR_RETHROW_ERROR(ref, "second error message");
}

void functionThatThrowsWithLogLevelDebug() {
    lineOfFirstThrow = __LINE__; IRR_THROW_ERROR("first error message", libirr::LogLevel::DEBUG);
}

void functionThatRethrowsWithLogLevelDebug() {
    try {
        functionThatThrows();
    }
    catch(libirr::Error& error) {
        lineOfRethrow = __LINE__; IRR_RETHROW_ERROR(error, "second error message", libirr::LogLevel::DEBUG);
    }
}

TEST(ErrorTestGroup, oneStackTraceEntry) {
    try {
        functionThatThrows();
        FAIL("expected exception");
    }
    catch(const libirr::Error& error) {
        auto expectedFirstEntry = libirr::Error::ErrorTraceEntry{"first error message", "test_Error.cpp", lineOfFirstThrow, "functionThatThrows"};

        CHECK_EQUAL(error.getErrorTrace().size(), 1);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        CHECK(error.getLogLevel() == libirr::LogLevel::ERROR);
        CHECK_EQUAL(std::string{error.what()}, std::string{"first error message"});
    }
}

TEST(ErrorTestGroup, twoStackTraceEntries) {
    try {
        functionThatRethrows();
        FAIL("expected exception");
    }
    catch (const libirr::Error& error) {
        auto expectedFirstEntry = libirr::Error::ErrorTraceEntry{"first error message", "test_Error.cpp", lineOfFirstThrow, "functionThatThrows"};
        auto expectedSecondEntry = libirr::Error::ErrorTraceEntry{"second error message", "test_Error.cpp", lineOfRethrow, "functionThatRethrows"};

        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        CHECK(error.getErrorTrace()[1] == expectedSecondEntry);
        CHECK(error.getLogLevel() == libirr::LogLevel::ERROR);
    }
}

TEST(ErrorTestGroup, fromStdException) {
    try {
        functionThatThrowsFromStdException();
        FAIL("expected exception");
    }
    catch(const libirr::Error& error) {
        auto expectedFirstEntry = libirr::Error::ErrorTraceEntry{"first error message", "unspecified location", -1, "runtime error"};
        auto expectedSecondEntry = libirr::Error::ErrorTraceEntry{"second error message", "test_Error.cpp", lineOfRethrow, "functionThatThrowsFromStdException"};

        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        CHECK(error.getErrorTrace()[1] == expectedSecondEntry);
        CHECK(error.getLogLevel() == libirr::LogLevel::ERROR);
    }
}

TEST(ErrorTestGroup, oneStackTraceEntry_throwWithLogLevelDebug) {
    try {
        functionThatThrowsWithLogLevelDebug();
        FAIL("expected exception");
    }
    catch(const libirr::Error& error) {
        auto expectedFirstEntry = libirr::Error::ErrorTraceEntry{"first error message", "test_Error.cpp", lineOfFirstThrow, "functionThatThrowsWithLogLevelDebug"};

        CHECK_EQUAL(error.getErrorTrace().size(), 1);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        CHECK(error.getLogLevel() == libirr::LogLevel::DEBUG);
    }
}

TEST(ErrorTestGroup, twoStackTraceEntries_rethrowWithLogLevelDebug) {
    try {
        functionThatRethrowsWithLogLevelDebug();
        FAIL("expected exception");
    }
    catch (const libirr::Error& error) {
        auto expectedFirstEntry = libirr::Error::ErrorTraceEntry{"first error message", "test_Error.cpp", lineOfFirstThrow, "functionThatThrows"};
        auto expectedSecondEntry = libirr::Error::ErrorTraceEntry{"second error message", "test_Error.cpp", lineOfRethrow, "functionThatRethrowsWithLogLevelDebug"};

        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        CHECK(error.getErrorTrace()[1] == expectedSecondEntry);
        CHECK(error.getLogLevel() == libirr::LogLevel::DEBUG);
    }
}

TEST(ErrorTestGroup, exceptionTypeString) {
    CHECK_EQUAL(libirr::getExceptionTypeString(boost::regex_error{"bad pattern"}), std::string{"regex error"});
    CHECK_EQUAL(libirr::getExceptionTypeString(boost::bad_lexical_cast{}), std::string{"bad lexical cast"});
    CHECK_EQUAL(libirr::getExceptionTypeString(std::system_error{std::make_error_code(std::errc::io_error)}),
                std::string{"system error"});
    CHECK_EQUAL(libirr::getExceptionTypeString(std::ios_base::failure{"stream"}), std::string{"ios_base failure"});
    CHECK_EQUAL(libirr::getExceptionTypeString(std::out_of_range{"index"}), std::string{"logic error"});
    CHECK_EQUAL(libirr::getExceptionTypeString(std::runtime_error{"failure"}), std::string{"runtime error"});
    CHECK_EQUAL(libirr::getExceptionTypeString(std::exception{}), std::string{"generic exception"});
}

IRR_UNITTEST_MAIN_FUNCTION();
