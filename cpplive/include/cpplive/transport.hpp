/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_TRANSPORT_HPP
#define CPPLIVE_TRANSPORT_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the interface to the network transport of a client
           connection. */
//------------------------------------------------------------------------------

#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include "livedefs.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** Authenticated output of the transport handshake. */
//------------------------------------------------------------------------------
struct ClientInfo
{
    Identity identity;

    /** Device of the client. When left empty, the hub generates one that is
        unique to the connection. */
    DeviceId deviceId;
};

//------------------------------------------------------------------------------
/** Outbound half of an authenticated client connection.
    Each Session of a connection has at most one send outstanding at any
    time, but sends from different Sessions of the same connection may be
    outstanding concurrently and may be initiated from different threads.
    The handler must be invoked exactly once per send, from any thread. A
    non-zero error code indicates the connection is no longer usable. */
//------------------------------------------------------------------------------
class Transport
{
public:
    using Ptr = std::shared_ptr<Transport>;
    using SendHandler = std::function<void (std::error_code)>;

    virtual ~Transport() = default;

    /** Sends a text frame to the client. */
    virtual void send(std::string frame, SendHandler handler) = 0;

    /** Closes the connection. Outstanding sends complete with an error. */
    virtual void close() = 0;
};

} // namespace live

#endif // CPPLIVE_TRANSPORT_HPP
