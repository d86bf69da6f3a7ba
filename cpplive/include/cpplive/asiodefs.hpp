/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_ASIODEFS_HPP
#define CPPLIVE_ASIODEFS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Commonly used Boost.Asio type aliases. */
//------------------------------------------------------------------------------

#include <type_traits>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

namespace live
{

/** Queues and runs I/O completion handlers. */
using IoContext = boost::asio::io_context;

/** Polymorphic executor for I/O objects. */
using AnyIoExecutor = boost::asio::any_io_executor;

/** Serializes I/O operations. */
using IoStrand = boost::asio::strand<AnyIoExecutor>;

/** Timer type used for deadlines. */
using SteadyTimer = boost::asio::steady_timer;

/** Metafunction that determines if T meets the requirements of
    Boost.Asio's ExecutionContext. */
template <typename T>
static constexpr bool isExecutionContext()
{
    return std::is_base_of<boost::asio::execution_context, T>::value;
}

} // namespace live

#endif // CPPLIVE_ASIODEFS_HPP
