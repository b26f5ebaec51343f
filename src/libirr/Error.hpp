/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libirr_Error_hpp
#define libirr_Error_hpp

#include <cassert>
#include <cstring>
#include <exception>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/filesystem.hpp>

#include "libirr/LogLevel.hpp"

namespace libirr {

/**
 * Exception carrying an error trace.
 *
 * Each trace entry records the message together with the file, line and
 * function where it was added. The first entry is created by IRR_THROW_ERROR,
 * every IRR_RETHROW_ERROR along the way up the stack appends one more.
 *
 * Instances are meant to be created through the macros, and caught instances
 * are meant to be propagated with IRR_RETHROW_ERROR so the trace keeps growing.
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry)
        : logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    // The message of the entry that started the trace, as if the
    // exception had reached this frame without intermediate rethrows.
    const char* what() const noexcept override {
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    std::vector<ErrorTraceEntry> errorTrace;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);

}


#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define IRR_MAKE_ERROR_TRACE_ENTRY(errorMessage) \
    libirr::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}


// IRR_THROW_ERROR(message[, logLevel])
#define IRR_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define IRR_THROW_ERROR_2(errorMessage, logLevel) { \
    auto errorTraceEntry = IRR_MAKE_ERROR_TRACE_ENTRY(errorMessage); \
    throw libirr::Error{logLevel, errorTraceEntry}; \
}

#define IRR_THROW_ERROR_1(errorMessage) IRR_THROW_ERROR_2(errorMessage, libirr::LogLevel::ERROR)

#define IRR_THROW_ERROR(...) IRR_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, IRR_THROW_ERROR_2, IRR_THROW_ERROR_1)(__VA_ARGS__)


// IRR_RETHROW_ERROR(exception, message[, logLevel])
// A caught libirr::Error (or subclass) gets a new trace entry and is rethrown
// with its dynamic type intact; any other std::exception is converted.
#define IRR_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define IRR_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = IRR_MAKE_ERROR_TRACE_ENTRY(errorMessage); \
    const auto* cp = dynamic_cast<const libirr::Error*>(&exception); \
    if(cp) { \
        assert(!std::is_const<decltype(exception)>{}); /* the trace is modified in place */ \
        auto* p = const_cast<libirr::Error*>(cp); \
        p->setLogLevel(logLevel); \
        p->appendErrorTraceEntry(errorTraceEntry); \
        throw; \
    } \
    else { \
        auto previousErrorTraceEntry = libirr::Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, \
                                                                      libirr::getExceptionTypeString(exception)}; \
        auto error = libirr::Error{logLevel, previousErrorTraceEntry}; \
        error.appendErrorTraceEntry(errorTraceEntry); \
        throw error; \
    } \
}

#define IRR_RETHROW_ERROR_2(exception, errorMessage) { \
    const auto* cp = dynamic_cast<const libirr::Error*>(&exception); \
    if(cp) { \
        IRR_RETHROW_ERROR_3(exception, errorMessage, cp->getLogLevel()) \
    } \
    else { \
        IRR_RETHROW_ERROR_3(exception, errorMessage, libirr::LogLevel::ERROR) \
    } \
}

#define IRR_RETHROW_ERROR(...) IRR_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, IRR_RETHROW_ERROR_3, IRR_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
