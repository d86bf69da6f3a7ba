/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../authorizationgate.hpp"
#include <utility>
#include "../api.hpp"
#include "../exceptions.hpp"

namespace live
{

//******************************************************************************
// Authorization
//******************************************************************************

CPPLIVE_INLINE Authorization Authorization::granted()
{
    return Authorization{std::error_code{}};
}

CPPLIVE_INLINE Authorization Authorization::denied(std::error_code ec)
{
    CPPLIVE_LOGIC_CHECK(static_cast<bool>(ec),
                        "Denial requires a non-zero error code");
    return Authorization{ec};
}

CPPLIVE_INLINE Authorization Authorization::denied(LiveErrc errc)
{
    return denied(make_error_code(errc));
}

CPPLIVE_INLINE bool Authorization::good() const {return !errorCode_;}

CPPLIVE_INLINE Authorization::operator bool() const {return good();}

CPPLIVE_INLINE std::error_code Authorization::error() const
{
    return errorCode_;
}

CPPLIVE_INLINE Authorization::Authorization(std::error_code ec)
    : errorCode_(ec)
{}


//******************************************************************************
// AuthorizationGate
//******************************************************************************

CPPLIVE_INLINE AuthorizationGate::AuthorizationGate(
    ChannelDirectory::Ptr directory)
    : directory_(std::move(directory))
{
    CPPLIVE_LOGIC_CHECK(directory_ != nullptr,
                        "AuthorizationGate requires a ChannelDirectory");
}

CPPLIVE_INLINE Authorization
AuthorizationGate::authorize(const Identity& identity,
                             const TopicUri& topic) const
{
    const auto& dir = *directory_;

    if (topic.empty() || !dir.topicExists(topic))
        return Authorization::denied(LiveErrc::noSuchTopic);

    if (topic.kind() == TopicKind::workspace)
    {
        return dir.isMember(identity, topic) ? Authorization::granted()
                                             : Authorization::denied();
    }

    auto workspaceId = dir.workspaceOf(topic);
    if (dir.isArchived(topic))
    {
        return dir.isAdmin(identity, workspaceId)
                   ? Authorization::granted()
                   : Authorization::denied(LiveErrc::archived);
    }

    if (dir.visibility(topic) == ChannelVisibility::privateChannel)
    {
        return dir.isMember(identity, topic) ? Authorization::granted()
                                             : Authorization::denied();
    }

    auto workspace = TopicUri::workspace(std::move(workspaceId));
    return dir.isMember(identity, workspace) ? Authorization::granted()
                                             : Authorization::denied();
}

CPPLIVE_INLINE Authorization
AuthorizationGate::authorize(const Identity& identity,
                             const std::string& topicName) const
{
    auto topic = TopicUri::parse(topicName);
    if (!topic)
        return Authorization::denied(topic.error());
    return authorize(identity, *topic);
}

} // namespace live
