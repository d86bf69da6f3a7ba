/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_COLLABORATORS_MEMORYCHANNELDIRECTORY_HPP
#define CPPLIVE_COLLABORATORS_MEMORYCHANNELDIRECTORY_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains an in-memory ChannelDirectory. */
//------------------------------------------------------------------------------

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include "../api.hpp"
#include "../channeldirectory.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** ChannelDirectory implementation holding workspaces, channels and their
    memberships in memory. Membership may be changed at any time; the
    changes are observed by subsequent join attempts. */
//------------------------------------------------------------------------------
class CPPLIVE_API MemoryChannelDirectory : public ChannelDirectory
{
public:
    using Ptr = std::shared_ptr<MemoryChannelDirectory>;

    static Ptr create();

    MemoryChannelDirectory& addWorkspace(const std::string& workspaceId);

    MemoryChannelDirectory& addWorkspaceMember(const std::string& workspaceId,
                                               const Identity& identity,
                                               bool isAdmin = false);

    MemoryChannelDirectory& removeWorkspaceMember(
        const std::string& workspaceId, const Identity& identity);

    /** Adds a channel to an existing workspace.
        @throws error::Logic if the workspace is unknown. */
    MemoryChannelDirectory& addChannel(
        const std::string& channelId, const std::string& workspaceId,
        ChannelVisibility visibility = ChannelVisibility::publicChannel);

    MemoryChannelDirectory& addChannelMember(const std::string& channelId,
                                             const Identity& identity);

    MemoryChannelDirectory& removeChannelMember(const std::string& channelId,
                                                const Identity& identity);

    MemoryChannelDirectory& archiveChannel(const std::string& channelId,
                                           bool archived = true);

    bool topicExists(const TopicUri& topic) const override;

    bool isMember(const Identity& identity,
                  const TopicUri& topic) const override;

    ChannelVisibility visibility(const TopicUri& channel) const override;

    bool isArchived(const TopicUri& channel) const override;

    bool isAdmin(const Identity& identity,
                 const std::string& workspaceId) const override;

    std::string workspaceOf(const TopicUri& channel) const override;

private:
    struct Workspace
    {
        std::set<Identity> members;
        std::set<Identity> admins;
    };

    struct Channel
    {
        std::string workspaceId;
        std::set<Identity> members;
        ChannelVisibility visibility = ChannelVisibility::publicChannel;
        bool archived = false;
    };

    MemoryChannelDirectory() = default;

    Channel& channelAt(const std::string& channelId);

    const Channel* findChannel(const TopicUri& topic) const;

    std::map<std::string, Workspace> workspaces_;
    std::map<std::string, Channel> channels_;
    mutable std::mutex mutex_;
};

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "../internal/memorychanneldirectory.inl.hpp"
#endif

#endif // CPPLIVE_COLLABORATORS_MEMORYCHANNELDIRECTORY_HPP
