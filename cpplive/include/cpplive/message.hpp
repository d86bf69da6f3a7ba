/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_MESSAGE_HPP
#define CPPLIVE_MESSAGE_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the records produced by the message store. */
//------------------------------------------------------------------------------

#include <string>
#include <vector>
#include "livedefs.hpp"
#include "topicuri.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** A persisted chat message, or thread reply when `threadId` is not
    empty. */
//------------------------------------------------------------------------------
struct MessageRecord
{
    bool isThreadReply() const {return !threadId.empty();}

    bool isEdited() const {return editedAt != TimePoint{};}

    MessageId id;
    TopicUri topic;
    Identity author;
    std::string content;
    std::vector<std::string> attachments;
    MessageId threadId;     ///< Parent message of a thread reply
    TimePoint createdAt;
    TimePoint editedAt;     ///< Default-constructed if never edited
};

/** Messages in chronological order. */
using MessageList = std::vector<MessageRecord>;

//------------------------------------------------------------------------------
/** An emoji reaction placed on a message by an identity. */
//------------------------------------------------------------------------------
struct ReactionRecord
{
    MessageId messageId;
    std::string emoji;
    Identity identity;
};

inline bool operator==(const ReactionRecord& lhs, const ReactionRecord& rhs)
{
    return lhs.messageId == rhs.messageId && lhs.emoji == rhs.emoji &&
           lhs.identity == rhs.identity;
}

} // namespace live

#endif // CPPLIVE_MESSAGE_HPP
