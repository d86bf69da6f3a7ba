/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_MESSAGESTORE_HPP
#define CPPLIVE_MESSAGESTORE_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the MessageStore collaborator interface. */
//------------------------------------------------------------------------------

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "erroror.hpp"
#include "event.hpp"
#include "livedefs.hpp"
#include "message.hpp"
#include "topicuri.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** Durable storage of messages, reactions, threads and read receipts.

    Every operation is asynchronous and reports its outcome exactly once via
    the given handler, which may be invoked from any thread, including from
    within the call itself. Mutating operations enforce ownership rules and
    complete with the Event to be broadcast on success. Failures are
    reported with LiveErrc codes or any other error code, the latter being
    treated as LiveErrc::storeFailure. */
//------------------------------------------------------------------------------
class MessageStore
{
public:
    using Ptr = std::shared_ptr<MessageStore>;
    using EventHandler = std::function<void (ErrorOr<Event>)>;
    using ListHandler = std::function<void (ErrorOr<MessageList>)>;
    using Attachments = std::vector<std::string>;

    virtual ~MessageStore() = default;

    /** Persists a new top-level message. */
    virtual void createMessage(const Identity& author, const TopicUri& topic,
                               std::string content, Attachments attachments,
                               EventHandler handler) = 0;

    /** Replaces the content of a message owned by the identity. */
    virtual void editMessage(const Identity& identity, const TopicUri& topic,
                             const MessageId& messageId, std::string content,
                             EventHandler handler) = 0;

    /** Deletes a message owned by the identity. */
    virtual void deleteMessage(const Identity& identity, const TopicUri& topic,
                               const MessageId& messageId,
                               EventHandler handler) = 0;

    /** Adds the identity's emoji reaction to a message. */
    virtual void addReaction(const Identity& identity, const TopicUri& topic,
                             const MessageId& messageId, std::string emoji,
                             EventHandler handler) = 0;

    /** Removes the identity's emoji reaction from a message. */
    virtual void removeReaction(const Identity& identity,
                                const TopicUri& topic,
                                const MessageId& messageId, std::string emoji,
                                EventHandler handler) = 0;

    /** Persists a reply in the thread rooted at the given parent message. */
    virtual void createThreadReply(const Identity& author,
                                   const TopicUri& topic,
                                   const MessageId& parentId,
                                   std::string content,
                                   Attachments attachments,
                                   EventHandler handler) = 0;

    /** Records that the identity has read up to the given message. */
    virtual void markRead(const Identity& identity, const TopicUri& topic,
                          const MessageId& messageId,
                          EventHandler handler) = 0;

    /** Obtains up to `limit` of the most recent top-level messages, oldest
        first. */
    virtual void listRecent(const TopicUri& topic, std::size_t limit,
                            ListHandler handler) = 0;

    /** Obtains up to `limit` top-level messages preceding the given one,
        oldest first. */
    virtual void listBefore(const TopicUri& topic, const MessageId& beforeId,
                            std::size_t limit, ListHandler handler) = 0;
};

} // namespace live

#endif // CPPLIVE_MESSAGESTORE_HPP
