/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../collaborators/memorychanneldirectory.hpp"
#include "../api.hpp"
#include "../exceptions.hpp"

namespace live
{

//------------------------------------------------------------------------------
CPPLIVE_INLINE MemoryChannelDirectory::Ptr MemoryChannelDirectory::create()
{
    return Ptr(new MemoryChannelDirectory);
}

CPPLIVE_INLINE MemoryChannelDirectory&
MemoryChannelDirectory::addWorkspace(const std::string& workspaceId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    workspaces_[workspaceId];
    return *this;
}

CPPLIVE_INLINE MemoryChannelDirectory&
MemoryChannelDirectory::addWorkspaceMember(const std::string& workspaceId,
                                           const Identity& identity,
                                           bool isAdmin)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& ws = workspaces_[workspaceId];
    ws.members.insert(identity);
    if (isAdmin)
        ws.admins.insert(identity);
    else
        ws.admins.erase(identity);
    return *this;
}

CPPLIVE_INLINE MemoryChannelDirectory&
MemoryChannelDirectory::removeWorkspaceMember(const std::string& workspaceId,
                                              const Identity& identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = workspaces_.find(workspaceId);
    if (found != workspaces_.end())
    {
        found->second.members.erase(identity);
        found->second.admins.erase(identity);
    }
    return *this;
}

CPPLIVE_INLINE MemoryChannelDirectory&
MemoryChannelDirectory::addChannel(const std::string& channelId,
                                   const std::string& workspaceId,
                                   ChannelVisibility visibility)
{
    std::lock_guard<std::mutex> lock(mutex_);
    CPPLIVE_LOGIC_CHECK(workspaces_.count(workspaceId) != 0,
                        "Unknown workspace '" + workspaceId + "'");
    auto& ch = channels_[channelId];
    ch.workspaceId = workspaceId;
    ch.visibility = visibility;
    return *this;
}

CPPLIVE_INLINE MemoryChannelDirectory&
MemoryChannelDirectory::addChannelMember(const std::string& channelId,
                                         const Identity& identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    channelAt(channelId).members.insert(identity);
    return *this;
}

CPPLIVE_INLINE MemoryChannelDirectory&
MemoryChannelDirectory::removeChannelMember(const std::string& channelId,
                                            const Identity& identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    channelAt(channelId).members.erase(identity);
    return *this;
}

CPPLIVE_INLINE MemoryChannelDirectory&
MemoryChannelDirectory::archiveChannel(const std::string& channelId,
                                       bool archived)
{
    std::lock_guard<std::mutex> lock(mutex_);
    channelAt(channelId).archived = archived;
    return *this;
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE bool
MemoryChannelDirectory::topicExists(const TopicUri& topic) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (topic.kind() == TopicKind::workspace)
        return workspaces_.count(topic.id()) != 0;
    return findChannel(topic) != nullptr;
}

CPPLIVE_INLINE bool MemoryChannelDirectory::isMember(
    const Identity& identity, const TopicUri& topic) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (topic.kind() == TopicKind::workspace)
    {
        auto found = workspaces_.find(topic.id());
        return found != workspaces_.end() &&
               found->second.members.count(identity) != 0;
    }

    const auto* ch = findChannel(topic);
    return ch != nullptr && ch->members.count(identity) != 0;
}

CPPLIVE_INLINE ChannelVisibility
MemoryChannelDirectory::visibility(const TopicUri& channel) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* ch = findChannel(channel);
    return ch == nullptr ? ChannelVisibility::privateChannel : ch->visibility;
}

CPPLIVE_INLINE bool
MemoryChannelDirectory::isArchived(const TopicUri& channel) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* ch = findChannel(channel);
    return ch != nullptr && ch->archived;
}

CPPLIVE_INLINE bool
MemoryChannelDirectory::isAdmin(const Identity& identity,
                                const std::string& workspaceId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = workspaces_.find(workspaceId);
    return found != workspaces_.end() &&
           found->second.admins.count(identity) != 0;
}

CPPLIVE_INLINE std::string
MemoryChannelDirectory::workspaceOf(const TopicUri& channel) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* ch = findChannel(channel);
    return ch == nullptr ? std::string{} : ch->workspaceId;
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE MemoryChannelDirectory::Channel&
MemoryChannelDirectory::channelAt(const std::string& channelId)
{
    auto found = channels_.find(channelId);
    CPPLIVE_LOGIC_CHECK(found != channels_.end(),
                        "Unknown channel '" + channelId + "'");
    return found->second;
}

CPPLIVE_INLINE const MemoryChannelDirectory::Channel*
MemoryChannelDirectory::findChannel(const TopicUri& topic) const
{
    if (topic.kind() != TopicKind::channel)
        return nullptr;
    auto found = channels_.find(topic.id());
    return found == channels_.end() ? nullptr : &(found->second);
}

} // namespace live
