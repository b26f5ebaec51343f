/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <sstream>
#include <string>

#include <boost/regex.hpp>

#include "libirr/Logger.hpp"
#include "test_utility/unittest_main_function.hpp"

TEST_GROUP(LoggerTestGroup) {
    void teardown() {
        libirr::Logger::getInstance().setLevel(libirr::LogLevel::WARN);
    }
};

class LoggerChecker {
public:
    LoggerChecker& log(libirr::LogLevel logLevel, const std::string& message) {
        libirr::Logger::getInstance().log(message, "subsystem", logLevel, stdoutStream, stderrStream);
        return *this;
    }

    LoggerChecker& expectGeneralMessageInStdout(const std::string& message) {
        expectedPatternInStdout += message + "\n";
        return *this;
    }

    LoggerChecker& expectMessageInStdout(const std::string& logLevel, const std::string& message) {
        return expectMessage(logLevel, message, expectedPatternInStdout);
    }

    LoggerChecker& expectMessageInStderr(const std::string& logLevel, const std::string& message) {
        return expectMessage(logLevel, message, expectedPatternInStderr);
    }

    ~LoggerChecker() {
        check(stdoutStream, expectedPatternInStdout);
        check(stderrStream, expectedPatternInStderr);
    }

private:
    LoggerChecker& expectMessage(const std::string& logLevel, const std::string& message, std::string& expectedPattern) {
        expectedPattern += "\\[[0-9]+\\.[0-9]{9}\\] \\[.+-[0-9]+\\] \\[subsystem\\] \\[" + logLevel + "\\] " + message + "\n";
        return *this;
    }

    void check(const std::ostringstream& stream, const std::string& expectedPattern) const {
        CHECK(boost::regex_match(stream.str(), boost::regex(expectedPattern)));
    }

private:
    std::ostringstream stdoutStream;
    std::ostringstream stderrStream;

    std::string expectedPatternInStdout;
    std::string expectedPatternInStderr;
};

TEST(LoggerTestGroup, levels) {
    const std::string generalMessage = "GENERAL message";
    const std::string debugMessage = "DEBUG message";
    const std::string infoMessage = "INFO message";
    const std::string warnMessage = "WARN message";
    const std::string errorMessage = "ERROR message";

    libirr::Logger::getInstance().setLevel(libirr::LogLevel::DEBUG);
    LoggerChecker{}
        .log(libirr::LogLevel::GENERAL, generalMessage)
        .log(libirr::LogLevel::DEBUG, debugMessage)
        .log(libirr::LogLevel::INFO, infoMessage)
        .log(libirr::LogLevel::WARN, warnMessage)
        .log(libirr::LogLevel::ERROR, errorMessage)
        .expectGeneralMessageInStdout(generalMessage)
        .expectMessageInStdout("DEBUG", debugMessage)
        .expectMessageInStdout("INFO", infoMessage)
        .expectMessageInStderr("WARN", warnMessage)
        .expectMessageInStderr("ERROR", errorMessage);

    libirr::Logger::getInstance().setLevel(libirr::LogLevel::INFO);
    LoggerChecker{}
        .log(libirr::LogLevel::DEBUG, debugMessage)
        .log(libirr::LogLevel::INFO, infoMessage)
        .log(libirr::LogLevel::WARN, warnMessage)
        .expectMessageInStdout("INFO", infoMessage)
        .expectMessageInStderr("WARN", warnMessage);

    libirr::Logger::getInstance().setLevel(libirr::LogLevel::WARN);
    LoggerChecker{}
        .log(libirr::LogLevel::GENERAL, generalMessage)
        .log(libirr::LogLevel::DEBUG, debugMessage)
        .log(libirr::LogLevel::INFO, infoMessage)
        .log(libirr::LogLevel::WARN, warnMessage)
        .expectGeneralMessageInStdout(generalMessage)
        .expectMessageInStderr("WARN", warnMessage);

    libirr::Logger::getInstance().setLevel(libirr::LogLevel::ERROR);
    LoggerChecker{}
        .log(libirr::LogLevel::WARN, warnMessage)
        .log(libirr::LogLevel::ERROR, errorMessage)
        .expectMessageInStderr("ERROR", errorMessage);
}

TEST(LoggerTestGroup, errorTrace) {
    std::ostringstream stderrStream;
    try {
        try {
            IRR_THROW_ERROR("inner failure");
        }
        catch(libirr::Error& e) {
            IRR_RETHROW_ERROR(e, "outer failure");
        }
    }
    catch(const libirr::Error& e) {
        libirr::Logger::getInstance().logErrorTrace(e, "subsystem", stderrStream);
    }

    auto output = stderrStream.str();
    auto outer = output.find("outer failure");
    auto inner = output.find("inner failure");
    CHECK(output.find("Error trace (most nested error last):") != std::string::npos);
    CHECK(outer != std::string::npos);
    CHECK(inner != std::string::npos);
    CHECK(outer < inner);
}

TEST(LoggerTestGroup, errorTraceBelowThreshold) {
    std::ostringstream stderrStream;
    try {
        IRR_THROW_ERROR("bad command line", libirr::LogLevel::INFO);
    }
    catch(const libirr::Error& e) {
        libirr::Logger::getInstance().logErrorTrace(e, "subsystem", stderrStream);
    }
    CHECK(stderrStream.str().empty());
}

IRR_UNITTEST_MAIN_FUNCTION();
