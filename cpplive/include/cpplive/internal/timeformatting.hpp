/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_INTERNAL_TIMEFORMATTING_HPP
#define CPPLIVE_INTERNAL_TIMEFORMATTING_HPP

#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

#if _POSIX_C_SOURCE >= 1 || _XOPEN_SOURCE || _BSD_SOURCE || _SVID_SOURCE || \
_POSIX_SOURCE
#define CPPLIVE_HAS_GMTIME_R
#endif

namespace live
{

namespace internal
{

//------------------------------------------------------------------------------
// Outputs a UTC timestamp of the form YYYY-MM-DDTHH:MM:SS.sssZ
//------------------------------------------------------------------------------
inline std::ostream& outputRfc3339Timestamp(
    std::ostream& out, std::chrono::system_clock::time_point when)
{
    static_assert(sizeof(std::time_t) >= sizeof(int64_t),
                  "std::time_t is 32-bit and will overflow in 2038");

    namespace chrono = std::chrono;
    using TimePoint = chrono::system_clock::time_point;
    auto d = when.time_since_epoch();

    // Floor to the whole minute so that pre-epoch times stay well-formed
    auto mins = chrono::duration_cast<chrono::minutes>(d);
    if (mins > d)
        mins -= chrono::minutes{1};

    auto rest = (when - mins).time_since_epoch();
    assert(rest.count() >= 0);
    auto secs = chrono::duration_cast<chrono::seconds>(rest);
    auto millis = chrono::duration_cast<chrono::milliseconds>(rest - secs);

    auto time = chrono::system_clock::to_time_t(TimePoint{mins});

#ifdef CPPLIVE_HAS_GMTIME_R
    std::tm tmbResult; // NOLINT(cppcoreguidelines-pro-type-member-init)
    std::memset(&tmbResult, 0, sizeof(tmbResult));
    std::tm* tmb = ::gmtime_r(&time, &tmbResult);
#else
    std::tm* tmb = std::gmtime(&time);
#endif

    auto locale = out.getloc();
    out.imbue(std::locale::classic());
    out << std::put_time(tmb, "%FT%H:%M:")
        << std::setfill('0') << std::setw(2) << secs.count()
        << '.' << std::setw(3) << millis.count() << 'Z';
    out.imbue(locale);
    return out;
}

//------------------------------------------------------------------------------
inline std::string toRfc3339Timestamp(std::chrono::system_clock::time_point when)
{
    std::ostringstream oss;
    outputRfc3339Timestamp(oss, when);
    return oss.str();
}

} // namespace internal

} // namespace live

#undef CPPLIVE_HAS_GMTIME_R

#endif // CPPLIVE_INTERNAL_TIMEFORMATTING_HPP
