/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../logging.hpp"
#include <array>
#include <sstream>
#include <type_traits>
#include <utility>
#include "../api.hpp"
#include "timeformatting.hpp"

namespace live
{

//******************************************************************************
// LogLevel
//******************************************************************************

//------------------------------------------------------------------------------
CPPLIVE_INLINE const std::string& logLevelLabel(LogLevel lv)
{
    static const std::array<std::string, 7> labels =
    {{
        "trace",
        "debug",
        "info",
        "warning",
        "error",
        "critical",
        "off"
    }};

    using T = std::underlying_type<LogLevel>::type;
    return labels.at(static_cast<T>(lv));
}


//******************************************************************************
// LogEntry
//******************************************************************************

//------------------------------------------------------------------------------
/** @details
    The following format is used:
    ```
    YYYY-MM-DDTHH:MM:SS.sssZ
    ``` */
//------------------------------------------------------------------------------
CPPLIVE_INLINE std::ostream& LogEntry::outputTime(std::ostream& out,
                                                  TimePoint when)
{
    return internal::outputRfc3339Timestamp(out, when);
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE LogEntry::LogEntry(LogLevel severity, std::string message,
                                  std::error_code ec)
    : message_(std::move(message)),
      ec_(ec),
      when_(std::chrono::system_clock::now()),
      severity_(severity)
{}

//------------------------------------------------------------------------------
CPPLIVE_INLINE LogLevel LogEntry::severity() const {return severity_;}

//------------------------------------------------------------------------------
CPPLIVE_INLINE const std::string& LogEntry::message() const & {return message_;}

//------------------------------------------------------------------------------
CPPLIVE_INLINE std::string&& LogEntry::message() && {return std::move(message_);}

//------------------------------------------------------------------------------
CPPLIVE_INLINE LogEntry& LogEntry::append(std::string extra)
{
    message_ += std::move(extra);
    return *this;
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE const std::error_code& LogEntry::error() const {return ec_;}

//------------------------------------------------------------------------------
CPPLIVE_INLINE LogEntry::TimePoint LogEntry::when() const {return when_;}

//------------------------------------------------------------------------------
/** @relates LogEntry
    @details
    The following format is used:
    ```
    YYYY-MM-DDTHH:MM:SS.sssZ | origin | level | message | error code info
    ``` */
//------------------------------------------------------------------------------
CPPLIVE_INLINE std::string toString(const LogEntry& entry)
{
    return toString(entry, "cpplive");
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE std::string toString(const LogEntry& entry,
                                    const std::string& origin)
{
    std::ostringstream oss;
    toStream(oss, entry, origin);
    return oss.str();
}

namespace internal
{

inline std::ostream& outputLogErrorField(std::ostream& out,
                                         const LogEntry& entry)
{
    static constexpr const char* sep = " | ";
    auto ec = entry.error();
    if (ec)
        out << sep << ec << " (" << ec.message() << ")";
    else
        out << sep << '-';
    return out;
}

} // namespace internal

//------------------------------------------------------------------------------
CPPLIVE_INLINE std::ostream& toStream(std::ostream& out, const LogEntry& entry,
                                      const std::string& origin)
{
    static constexpr const char* sep = " | ";

    LogEntry::outputTime(out, entry.when());
    out << sep << origin << sep << logLevelLabel(entry.severity())
        << sep << entry.message();
    return internal::outputLogErrorField(out, entry);
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE std::ostream& toColorStream(std::ostream& out,
                                           const LogEntry& entry,
                                           const std::string& origin)
{
    static constexpr const char* sep = " | ";
    static constexpr const char* red = "\x1b[1;31m";
    static constexpr const char* green = "\x1b[1;32m";
    static constexpr const char* yellow = "\x1b[1;33m";
    static constexpr const char* plain = "\x1b[0m";

    const char* color = nullptr;
    switch (entry.severity())
    {
    case LogLevel::info:
        color = green;
        break;

    case LogLevel::warning:
        color = yellow;
        break;

    case LogLevel::error:
    case LogLevel::critical:
        color = red;
        break;

    default:
        break;
    }

    LogEntry::outputTime(out, entry.when());
    out << sep << origin << sep;
    if (color != nullptr)
        out << color << logLevelLabel(entry.severity()) << plain;
    else
        out << logLevelLabel(entry.severity());
    out << sep << entry.message();
    return internal::outputLogErrorField(out, entry);
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE std::ostream& operator<<(std::ostream& out,
                                        const LogEntry& entry)
{
    return toStream(out, entry, "cpplive");
}

} // namespace live
