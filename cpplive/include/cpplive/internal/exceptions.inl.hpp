/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../exceptions.hpp"
#include <sstream>
#include "../api.hpp"

namespace live
{

namespace error
{

//------------------------------------------------------------------------------
// error::Failure exception
//------------------------------------------------------------------------------

CPPLIVE_INLINE Failure::Failure(std::error_code ec)
    : std::system_error(ec, makeMessage(ec))
{}

CPPLIVE_INLINE Failure::Failure(std::error_code ec, const std::string& info)
    : std::system_error(ec, makeMessage(ec, info))
{}

CPPLIVE_INLINE std::string Failure::makeMessage(std::error_code ec)
{
    std::ostringstream oss;
    oss << "error::Failure: " << ec << " (" << ec.message() << ")";
    return oss.str();
}

CPPLIVE_INLINE std::string Failure::makeMessage(std::error_code ec,
                                                const std::string& info)
{
    return makeMessage(ec) + ": " + info;
}

//------------------------------------------------------------------------------
// error::Logic exception
//------------------------------------------------------------------------------

/** @details
    The @ref CPPLIVE_LOGIC_ERROR macro should be used instead, which will
    conveniently fill in the `file` and `line` details. */
CPPLIVE_INLINE void Logic::raise(const char* file, int line,
                                 const std::string& msg)
{
    std::ostringstream oss;
    oss << file << ':' << line << ", live::error::Logic: " << msg;
    throw Logic(oss.str());
}

/** @details
    Used for asserting preconditions. */
CPPLIVE_INLINE void Logic::check(bool condition, const char* file, int line,
                                 const std::string& msg)
{
    if (!condition)
        raise(file, line, msg);
}

} // namespace error

} // namespace live
