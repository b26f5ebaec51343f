/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libirr_Logger_hpp
#define libirr_Logger_hpp

#include <string>
#include <iostream>

#include <boost/format.hpp>

#include "libirr/LogLevel.hpp"
#include "libirr/Error.hpp"

namespace libirr {

/**
 * Process-wide logger.
 *
 * Messages below the current level are discarded. Every message except
 * GENERAL ones is prefixed with a monotonic timestamp, the instance ID
 * (hostname and pid), the name of the subsystem and the level.
 * WARN and ERROR messages go to the error stream, the rest to the output stream.
 */
class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& systemName, LogLevel logLevel,
             std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);
    void log(const boost::format& message, const std::string& systemName, LogLevel logLevel,
             std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);
    void logErrorTrace(const Error& error, const std::string& systemName, std::ostream& errStream = std::cerr);
    void setLevel(LogLevel logLevel) { level = logLevel; }
    LogLevel getLevel() const { return level; }

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makeSubmessageWithTimestamp(LogLevel logLevel) const;
    std::string makeSubmessageWithInstanceID(LogLevel logLevel) const;
    std::string makeSubmessageWithSystemName(LogLevel logLevel, const std::string& systemName) const;
    std::string makeSubmessageWithLogLevel(LogLevel logLevel) const;

private:
    LogLevel level;
};

}

#endif
