/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_CHANNELDIRECTORY_HPP
#define CPPLIVE_CHANNELDIRECTORY_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the ChannelDirectory collaborator interface. */
//------------------------------------------------------------------------------

#include <memory>
#include <string>
#include "livedefs.hpp"
#include "topicuri.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** Visibility of a channel within its workspace. */
//------------------------------------------------------------------------------
enum class ChannelVisibility
{
    publicChannel,
    privateChannel
};

//------------------------------------------------------------------------------
/** Provides membership and channel metadata consumed by the
    AuthorizationGate.
    Implementations must be safe to call concurrently from multiple
    threads. */
//------------------------------------------------------------------------------
class ChannelDirectory
{
public:
    using Ptr = std::shared_ptr<ChannelDirectory>;

    virtual ~ChannelDirectory() = default;

    /** Determines if the workspace or channel exists. */
    virtual bool topicExists(const TopicUri& topic) const = 0;

    /** For a workspace topic, determines if the identity holds active
        membership in the workspace. For a channel topic, determines if the
        identity is an explicit member of the channel. */
    virtual bool isMember(const Identity& identity,
                          const TopicUri& topic) const = 0;

    /** Obtains the visibility of a channel. */
    virtual ChannelVisibility visibility(const TopicUri& channel) const = 0;

    /** Determines if a channel is archived. */
    virtual bool isArchived(const TopicUri& channel) const = 0;

    /** Determines if the identity has admin rights in the workspace. */
    virtual bool isAdmin(const Identity& identity,
                         const std::string& workspaceId) const = 0;

    /** Obtains the ID of the workspace containing a channel. */
    virtual std::string workspaceOf(const TopicUri& channel) const = 0;
};

} // namespace live

#endif // CPPLIVE_CHANNELDIRECTORY_HPP
