/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_EXCEPTIONS_HPP
#define CPPLIVE_EXCEPTIONS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Provides exception types. */
//------------------------------------------------------------------------------

#include <stdexcept>
#include <string>
#include <system_error>
#include "api.hpp"

//------------------------------------------------------------------------------
/** Throws an error::Logic exception having the given message string.
    @param msg A string describing the cause of the exception. */
//------------------------------------------------------------------------------
#define CPPLIVE_LOGIC_ERROR(msg) \
    error::Logic::raise(__FILE__, __LINE__, (msg));

//------------------------------------------------------------------------------
/** Conditionally throws an error::Logic exception having the given message
    string.
    @param cond A boolean expression that, if `true`, will cause an exception
                to be thrown.
    @param msg A string describing the cause of the exception. */
//------------------------------------------------------------------------------
#define CPPLIVE_LOGIC_CHECK(cond, msg) \
    {error::Logic::check((cond), __FILE__, __LINE__, (msg));}

namespace live
{

namespace error
{

//------------------------------------------------------------------------------
/** General purpose runtime exception that wraps a std::error_code. */
//------------------------------------------------------------------------------
class CPPLIVE_API Failure : public std::system_error
{
public:
    /** Obtains a human-readable message from the given error code. */
    static std::string makeMessage(std::error_code ec);

    /** Obtains a human-readable message from the given error code and
        information string. */
    static std::string makeMessage(std::error_code ec, const std::string& info);

    /** Constructor taking an error code. */
    explicit Failure(std::error_code ec);

    /** Constructor taking an error code and informational string. */
    Failure(std::error_code ec, const std::string& info);
};

//------------------------------------------------------------------------------
/** Exception thrown when a pre-condition is not met. */
//------------------------------------------------------------------------------
struct CPPLIVE_API Logic : public std::logic_error
{
    using std::logic_error::logic_error;

    /** Throws an error::Logic exception with the given details. */
    static void raise(const char* file, int line, const std::string& msg);

    /** Conditionally throws an error::Logic exception with the given
        details. */
    static void check(bool condition, const char* file, int line,
                      const std::string& msg);
};

} // namespace error

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "internal/exceptions.inl.hpp"
#endif

#endif // CPPLIVE_EXCEPTIONS_HPP
