/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libirr/Logger.hpp"

#include <string>
#include <iostream>
#include <cerrno>
#include <cstring>

#include <time.h>
#include <sys/types.h>
#include <unistd.h>
#include <limits.h>

#include <boost/format.hpp>

#include "libirr/Error.hpp"

namespace libirr {

namespace {

std::string getHostname() {
    char hostname[HOST_NAME_MAX + 1];
    if(gethostname(hostname, sizeof(hostname)) != 0) {
        auto message = boost::format("logger failed to retrieve hostname (%s)") % strerror(errno);
        IRR_THROW_ERROR(message.str());
    }
    hostname[HOST_NAME_MAX] = '\0';
    return hostname;
}

}

Logger& Logger::getInstance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level{ LogLevel::WARN }
{}

void Logger::log(const std::string& message, const std::string& systemName, LogLevel logLevel,
                 std::ostream& outStream, std::ostream& errStream) {
    if(logLevel < level) {
        return;
    }

    auto fullLogMessage = makeSubmessageWithTimestamp(logLevel)
        + makeSubmessageWithInstanceID(logLevel)
        + makeSubmessageWithSystemName(logLevel, systemName)
        + makeSubmessageWithLogLevel(logLevel)
        + message;

    if(logLevel == LogLevel::WARN || logLevel == LogLevel::ERROR) {
        errStream << fullLogMessage << std::endl;
    }
    else {
        outStream << fullLogMessage << std::endl;
    }
}

void Logger::log(const boost::format& message, const std::string& systemName, LogLevel logLevel,
                 std::ostream& outStream, std::ostream& errStream) {
    log(message.str(), systemName, logLevel, outStream, errStream);
}

void Logger::logErrorTrace(const Error& error, const std::string& systemName, std::ostream& errStream) {
    if(error.getLogLevel() < level) {
        return;
    }

    log("Error trace (most nested error last):", systemName, LogLevel::ERROR, std::cout, errStream);

    const auto& trace = error.getErrorTrace();
    for(size_t i=0; i!=trace.size(); ++i) {
        const auto& entry = trace[trace.size()-i-1];
        auto line = boost::format("#%-3.3s %s at %s:%s %s\n")
            % i
            % entry.functionName
            % entry.fileName.string()
            % (entry.fileLine != -1 ? std::to_string(entry.fileLine) : "")
            % entry.errorMessage;
        errStream << line;
    }
}

std::string Logger::makeSubmessageWithTimestamp(LogLevel logLevel) const {
    if(logLevel == LogLevel::GENERAL) {
        return "";
    }

    auto tp = timespec{};
    if(clock_gettime(CLOCK_MONOTONIC, &tp) != 0) {
        auto message = boost::format("logger failed to retrieve monotonic time (%s)") % strerror(errno);
        IRR_THROW_ERROR(message.str());
    }

    auto timestamp = boost::format("[%d.%09d] ") % tp.tv_sec % tp.tv_nsec;
    return timestamp.str();
}

std::string Logger::makeSubmessageWithInstanceID(LogLevel logLevel) const {
    if(logLevel == LogLevel::GENERAL) {
        return "";
    }

    auto id = boost::format("[%s-%d] ") % getHostname() % getpid();
    return id.str();
}

std::string Logger::makeSubmessageWithSystemName(LogLevel logLevel, const std::string& systemName) const {
    if(logLevel == LogLevel::GENERAL) {
        return "";
    }

    return "[" + systemName + "] ";
}

std::string Logger::makeSubmessageWithLogLevel(LogLevel logLevel) const {
    switch(logLevel) {
        case LogLevel::DEBUG:   return "[DEBUG] ";
        case LogLevel::INFO :   return "[INFO] ";
        case LogLevel::WARN :   return "[WARN] ";
        case LogLevel::ERROR:   return "[ERROR] ";
        case LogLevel::GENERAL: return "";
    }
    IRR_THROW_ERROR("logger failed to convert unknown log level to string");
}

}
