/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_LOGGING_HPP
#define CPPLIVE_LOGGING_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains facilities for logging. */
//------------------------------------------------------------------------------

#include <chrono>
#include <functional>
#include <ostream>
#include <string>
#include <system_error>
#include "api.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** Log entry severity levels.
    These match the levels of the popular
    [gabime/spdlog](https://github.com/gabime/spdlog) library. */
//------------------------------------------------------------------------------
enum class CPPLIVE_API LogLevel
{
    trace,    ///< For inbound/outbound frame dumps
    debug,    ///< For session state transitions
    info,     ///< For topic rooms being opened and closed
    warning,  ///< For detected problems that don't affect normal operation
    error,    ///< For failures where operations cannot be completed
    critical, ///< For faults that reset a topic or session
    off       ///< Used to disable all log events
};

//------------------------------------------------------------------------------
/** Obtains the lowercase label of the given log level. */
//------------------------------------------------------------------------------
CPPLIVE_API const std::string& logLevelLabel(LogLevel lv);

//------------------------------------------------------------------------------
/** Contains logging information. */
//------------------------------------------------------------------------------
class CPPLIVE_API LogEntry
{
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /** Outputs a timestamp in RFC3339 format. */
    static std::ostream& outputTime(std::ostream& out, TimePoint when);

    /** Constructor. */
    LogEntry(LogLevel severity, std::string message, std::error_code ec = {});

    /** Obtains the entry's severity level. */
    LogLevel severity() const;

    /** Obtains the entry's information text. */
    const std::string& message() const &;

    /** Moves the entry's information text. */
    std::string&& message() &&;

    /** Appends the given text to the entry's information text. */
    LogEntry& append(std::string extra);

    /** Obtains the error code associated with this entry, if applicable. */
    const std::error_code& error() const;

    /** Obtains the entry's timestamp. */
    TimePoint when() const;

private:
    std::string message_;
    std::error_code ec_;
    TimePoint when_;
    LogLevel severity_ = LogLevel::off;
};

/** Obtains a formatted log entry string combining all available information.
    @relates LogEntry */
CPPLIVE_API std::string toString(const LogEntry& entry);

/** Obtains a formatted log entry string with a custom origin field.
    @relates LogEntry */
CPPLIVE_API std::string toString(const LogEntry& entry,
                                 const std::string& origin);

/** Outputs a formatted log entry with a custom origin field.
    @relates LogEntry */
CPPLIVE_API std::ostream& toStream(std::ostream& out, const LogEntry& entry,
                                   const std::string& origin);

/** Outputs a formatted, colored log entry with a custom origin field.
    @relates LogEntry */
CPPLIVE_API std::ostream& toColorStream(std::ostream& out,
                                        const LogEntry& entry,
                                        const std::string& origin);

/** Outputs a LogEntry to an output stream.
    @relates LogEntry */
CPPLIVE_API std::ostream& operator<<(std::ostream& out, const LogEntry& entry);

//------------------------------------------------------------------------------
/** Type-erased handler for log entries. */
//------------------------------------------------------------------------------
using LogHandler = std::function<void (LogEntry)>;

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "internal/logging.inl.hpp"
#endif

#endif // CPPLIVE_LOGGING_HPP
