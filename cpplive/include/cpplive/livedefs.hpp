/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_LIVEDEFS_HPP
#define CPPLIVE_LIVEDEFS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains type definitions related to identities, topics and
           sessions. */
//------------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace live
{

using Identity       = std::string; ///< Authenticated user identity
using DeviceId       = std::string; ///< Identifies one device/client of a user
using MessageId      = std::string; ///< Identifier assigned by the message store
using SequenceNumber = uint64_t;    ///< Per-topic event sequence number
using SubscriptionId = uint64_t;    ///< Handle of a broadcaster subscription
using SessionKey     = uint64_t;    ///< Process-wide unique session number
using TimePoint      = std::chrono::system_clock::time_point;

///< Obtains the value representing a blank sequence number.
constexpr SequenceNumber nullSequence() {return 0;}

///< Obtains the value representing a blank subscription handle.
constexpr SubscriptionId nullSubscription() {return 0;}

//------------------------------------------------------------------------------
/** Enumerates the states of a per-connection, per-topic session. */
//------------------------------------------------------------------------------
enum class SessionState
{
    connecting, ///< Created, waiting for a join request
    joining,    ///< Join requested, authorization and registration underway
    joined,     ///< Authorized and subscribed to exactly one topic
    terminated  ///< Cleaned up; no further commands are accepted
};

//------------------------------------------------------------------------------
/** Obtains a label for the given session state. */
//------------------------------------------------------------------------------
inline const char* sessionStateLabel(SessionState s)
{
    switch (s)
    {
    case SessionState::connecting: return "connecting";
    case SessionState::joining:    return "joining";
    case SessionState::joined:     return "joined";
    case SessionState::terminated: return "terminated";
    default: break;
    }
    return "unknown";
}

} // namespace live

#endif // CPPLIVE_LIVEDEFS_HPP
