/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_TOPICURI_HPP
#define CPPLIVE_TOPICURI_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the TopicUri class. */
//------------------------------------------------------------------------------

#include <ostream>
#include <string>
#include "api.hpp"
#include "erroror.hpp"
#include "errorcodes.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** Enumerates the kinds of broadcast domains. */
//------------------------------------------------------------------------------
enum class TopicKind
{
    workspace,
    channel
};

//------------------------------------------------------------------------------
/** Immutable name of a topic, of the form `workspace:<id>` or
    `channel:<id>`. */
//------------------------------------------------------------------------------
class CPPLIVE_API TopicUri
{
public:
    /** Parses a topic name.
        @returns LiveErrc::noSuchTopic if the name has any other shape. */
    static ErrorOr<TopicUri> parse(const std::string& name);

    /** Creates the topic of the given workspace. */
    static TopicUri workspace(std::string id);

    /** Creates the topic of the given channel. */
    static TopicUri channel(std::string id);

    /** Default constructs a blank topic name. */
    TopicUri();

    /** Returns true if this is a blank topic name. */
    bool empty() const;

    /** Obtains the topic kind. */
    TopicKind kind() const;

    /** Obtains the workspace or channel ID. */
    const std::string& id() const;

    /** Renders the canonical `<kind>:<id>` string. */
    std::string str() const;

private:
    TopicUri(TopicKind kind, std::string id);

    std::string id_;
    TopicKind kind_ = TopicKind::workspace;
};

/** @relates TopicUri */
CPPLIVE_API bool operator==(const TopicUri& lhs, const TopicUri& rhs);

/** @relates TopicUri */
CPPLIVE_API bool operator!=(const TopicUri& lhs, const TopicUri& rhs);

/** Orders by kind, then by ID.
    @relates TopicUri */
CPPLIVE_API bool operator<(const TopicUri& lhs, const TopicUri& rhs);

/** @relates TopicUri */
CPPLIVE_API std::ostream& operator<<(std::ostream& out, const TopicUri& uri);

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "internal/topicuri.inl.hpp"
#endif

#endif // CPPLIVE_TOPICURI_HPP
