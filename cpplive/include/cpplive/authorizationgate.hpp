/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_AUTHORIZATIONGATE_HPP
#define CPPLIVE_AUTHORIZATIONGATE_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains facilities for topic join authorization. */
//------------------------------------------------------------------------------

#include <string>
#include <system_error>
#include "api.hpp"
#include "channeldirectory.hpp"
#include "errorcodes.hpp"
#include "livedefs.hpp"
#include "topicuri.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** Outcome of a join authorization. */
//------------------------------------------------------------------------------
class CPPLIVE_API Authorization
{
public:
    /** Constructs an instance indicating the join is allowed. */
    static Authorization granted();

    /** Constructs an instance indicating the join is denied for the
        given reason. */
    static Authorization denied(std::error_code ec);

    /** Constructs an instance indicating the join is denied for the
        given reason. */
    static Authorization denied(LiveErrc errc = LiveErrc::unauthorized);

    /** Returns true if and only if the join is allowed. */
    bool good() const;

    /** Same as good(). */
    explicit operator bool() const;

    /** Obtains the reason for denial. */
    std::error_code error() const;

private:
    explicit Authorization(std::error_code ec);

    std::error_code errorCode_;
};

//------------------------------------------------------------------------------
/** Decides whether an identity may join a topic.

    Rules are evaluated in order, the first match winning:
    - unknown topic: denied with LiveErrc::noSuchTopic;
    - workspace topic: allowed iff the identity is a workspace member;
    - archived channel: allowed iff the identity is a workspace admin,
      otherwise denied with LiveErrc::archived;
    - private channel: allowed iff the identity is a channel member;
    - public channel: allowed iff the identity is a member of the channel's
      workspace.

    Decisions are never cached; every join attempt consults the
    ChannelDirectory afresh. */
//------------------------------------------------------------------------------
class CPPLIVE_API AuthorizationGate
{
public:
    explicit AuthorizationGate(ChannelDirectory::Ptr directory);

    Authorization authorize(const Identity& identity,
                            const TopicUri& topic) const;

    /** Parses the topic name before authorizing. Malformed names are
        denied with LiveErrc::noSuchTopic. */
    Authorization authorize(const Identity& identity,
                            const std::string& topicName) const;

private:
    ChannelDirectory::Ptr directory_;
};

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "internal/authorizationgate.inl.hpp"
#endif

#endif // CPPLIVE_AUTHORIZATIONGATE_HPP
