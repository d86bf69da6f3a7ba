/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../topicuri.hpp"
#include <cctype>
#include <tuple>
#include <utility>
#include "../api.hpp"

namespace live
{

namespace internal
{

inline const std::string& topicKindLabel(TopicKind kind)
{
    static const std::string workspace = "workspace";
    static const std::string channel = "channel";
    return kind == TopicKind::channel ? channel : workspace;
}

inline bool isValidTopicId(const std::string& id)
{
    if (id.empty())
        return false;
    for (char c: id)
    {
        if (c == ':' || std::isspace(static_cast<unsigned char>(c)) ||
            std::iscntrl(static_cast<unsigned char>(c)))
        {
            return false;
        }
    }
    return true;
}

} // namespace internal

//------------------------------------------------------------------------------
CPPLIVE_INLINE ErrorOr<TopicUri> TopicUri::parse(const std::string& name)
{
    auto colon = name.find(':');
    if (colon == std::string::npos)
        return makeUnexpectedError(LiveErrc::noSuchTopic);

    auto prefix = name.substr(0, colon);
    auto id = name.substr(colon + 1);
    if (!internal::isValidTopicId(id))
        return makeUnexpectedError(LiveErrc::noSuchTopic);

    if (prefix == internal::topicKindLabel(TopicKind::workspace))
        return TopicUri{TopicKind::workspace, std::move(id)};
    if (prefix == internal::topicKindLabel(TopicKind::channel))
        return TopicUri{TopicKind::channel, std::move(id)};
    return makeUnexpectedError(LiveErrc::noSuchTopic);
}

CPPLIVE_INLINE TopicUri TopicUri::workspace(std::string id)
{
    return TopicUri{TopicKind::workspace, std::move(id)};
}

CPPLIVE_INLINE TopicUri TopicUri::channel(std::string id)
{
    return TopicUri{TopicKind::channel, std::move(id)};
}

CPPLIVE_INLINE TopicUri::TopicUri() = default;

CPPLIVE_INLINE bool TopicUri::empty() const {return id_.empty();}

CPPLIVE_INLINE TopicKind TopicUri::kind() const {return kind_;}

CPPLIVE_INLINE const std::string& TopicUri::id() const {return id_;}

CPPLIVE_INLINE std::string TopicUri::str() const
{
    if (empty())
        return {};
    return internal::topicKindLabel(kind_) + ':' + id_;
}

CPPLIVE_INLINE TopicUri::TopicUri(TopicKind kind, std::string id)
    : id_(std::move(id)),
      kind_(kind)
{}

//------------------------------------------------------------------------------
CPPLIVE_INLINE bool operator==(const TopicUri& lhs, const TopicUri& rhs)
{
    return lhs.kind() == rhs.kind() && lhs.id() == rhs.id();
}

CPPLIVE_INLINE bool operator!=(const TopicUri& lhs, const TopicUri& rhs)
{
    return !(lhs == rhs);
}

CPPLIVE_INLINE bool operator<(const TopicUri& lhs, const TopicUri& rhs)
{
    auto lk = static_cast<int>(lhs.kind());
    auto rk = static_cast<int>(rhs.kind());
    return std::tie(lk, lhs.id()) < std::tie(rk, rhs.id());
}

CPPLIVE_INLINE std::ostream& operator<<(std::ostream& out, const TopicUri& uri)
{
    return out << uri.str();
}

} // namespace live
