/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_CONNECTION_HPP
#define CPPLIVE_CONNECTION_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the Connection handle through which client frames enter
           a hub. */
//------------------------------------------------------------------------------

#include <cstddef>
#include <memory>
#include <string>
#include "api.hpp"
#include "transport.hpp"

namespace live
{

namespace internal { class ConnectionImpl; }

class Hub;

//------------------------------------------------------------------------------
/** Handle to an authenticated client connection attached to a Hub.
    The connection holds one session per joined topic. Frames received from
    the client are decoded and routed by their `topic` field, or to the sole
    session when the field is omitted. All member functions are thread-safe.
    Copies refer to the same connection. */
//------------------------------------------------------------------------------
class CPPLIVE_API Connection
{
public:
    /** Constructs an empty handle. */
    Connection();

    /** Returns true if this handle refers to a connection. */
    explicit operator bool() const;

    /** Determines if the connection still accepts frames. */
    bool isOpen() const;

    /** Obtains the client's identity and device. */
    const ClientInfo& info() const;

    /** Obtains the number of sessions currently held. */
    std::size_t sessionCount() const;

    /** Processes a text frame received from the client. */
    void receive(std::string frame);

    /** Terminates every session after the transport was lost. */
    void disconnect();

    /** Terminates every session and closes the transport. */
    void close();

private:
    explicit Connection(std::shared_ptr<internal::ConnectionImpl> impl);

    std::shared_ptr<internal::ConnectionImpl> impl_;

    friend class Hub;
};

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "internal/connection.inl.hpp"
#endif

#endif // CPPLIVE_CONNECTION_HPP
