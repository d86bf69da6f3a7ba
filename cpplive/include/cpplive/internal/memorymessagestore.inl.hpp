/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../collaborators/memorymessagestore.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <utility>
#include "../api.hpp"
#include "../errorcodes.hpp"

namespace live
{

namespace internal
{

inline bool isBlank(const std::string& text)
{
    return std::all_of(text.begin(), text.end(), [](char c)
        {return std::isspace(static_cast<unsigned char>(c)) != 0;});
}

inline MessageList takeTail(MessageList list, std::size_t limit)
{
    if (list.size() > limit)
        list.erase(list.begin(), list.end() - limit);
    return list;
}

} // namespace internal

//------------------------------------------------------------------------------
CPPLIVE_INLINE MemoryMessageStore::Ptr MemoryMessageStore::create()
{
    return Ptr(new MemoryMessageStore);
}

CPPLIVE_INLINE MessageId MemoryMessageStore::lastRead(
    const Identity& identity, const TopicUri& topic) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = reads_.find(ReadKey{identity, topic});
    return found == reads_.end() ? MessageId{} : found->second;
}

CPPLIVE_INLINE ErrorOr<MessageRecord>
MemoryMessageStore::find(const MessageId& messageId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = messages_.find(messageId);
    if (found == messages_.end())
        return makeUnexpectedError(LiveErrc::noSuchMessage);
    return found->second;
}

CPPLIVE_INLINE std::size_t MemoryMessageStore::messageCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE void MemoryMessageStore::createMessage(
    const Identity& author, const TopicUri& topic, std::string content,
    Attachments attachments, EventHandler handler)
{
    ErrorOr<Event> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto msg = insert(author, topic, std::move(content),
                          std::move(attachments), {});
        if (msg)
            result = Event::messageCreated(std::move(*msg));
        else
            result = UnexpectedError(msg.error());
    }
    handler(std::move(result));
}

CPPLIVE_INLINE void MemoryMessageStore::editMessage(
    const Identity& identity, const TopicUri& topic,
    const MessageId& messageId, std::string content, EventHandler handler)
{
    ErrorOr<Event> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto msg = lookup(topic, messageId);
        if (!msg)
            result = UnexpectedError(msg.error());
        else if ((*msg)->author != identity)
            result = makeUnexpectedError(LiveErrc::unauthorized);
        else if (internal::isBlank(content))
            result = makeUnexpectedError(LiveErrc::invalid);
        else
        {
            (*msg)->content = std::move(content);
            (*msg)->editedAt = std::chrono::system_clock::now();
            result = Event::messageEdited(**msg);
        }
    }
    handler(std::move(result));
}

CPPLIVE_INLINE void MemoryMessageStore::deleteMessage(
    const Identity& identity, const TopicUri& topic,
    const MessageId& messageId, EventHandler handler)
{
    ErrorOr<Event> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto msg = lookup(topic, messageId);
        if (!msg)
            result = UnexpectedError(msg.error());
        else if ((*msg)->author != identity)
            result = makeUnexpectedError(LiveErrc::unauthorized);
        else
        {
            auto record = std::move(**msg);
            messages_.erase(messageId);
            auto& timeline = timelines_[topic];
            timeline.erase(std::remove(timeline.begin(), timeline.end(),
                                       messageId),
                           timeline.end());
            auto iter = reactions_.lower_bound(
                ReactionKey{messageId, std::string{}, Identity{}});
            while (iter != reactions_.end() && std::get<0>(*iter) == messageId)
                iter = reactions_.erase(iter);
            result = Event::messageDeleted(std::move(record), identity);
        }
    }
    handler(std::move(result));
}

CPPLIVE_INLINE void MemoryMessageStore::addReaction(
    const Identity& identity, const TopicUri& topic,
    const MessageId& messageId, std::string emoji, EventHandler handler)
{
    ErrorOr<Event> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto msg = lookup(topic, messageId);
        if (!msg)
            result = UnexpectedError(msg.error());
        else if (internal::isBlank(emoji))
            result = makeUnexpectedError(LiveErrc::invalid);
        else if (!reactions_.emplace(messageId, emoji, identity).second)
            result = makeUnexpectedError(LiveErrc::invalid);
        else
            result = Event::reactionAdded({messageId, std::move(emoji),
                                           identity});
    }
    handler(std::move(result));
}

CPPLIVE_INLINE void MemoryMessageStore::removeReaction(
    const Identity& identity, const TopicUri& topic,
    const MessageId& messageId, std::string emoji, EventHandler handler)
{
    ErrorOr<Event> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto msg = lookup(topic, messageId);
        if (!msg)
        {
            result = UnexpectedError(msg.error());
        }
        else if (reactions_.erase(ReactionKey{messageId, emoji, identity}) == 0)
        {
            bool placedByOther = std::any_of(
                reactions_.begin(), reactions_.end(),
                [&](const ReactionKey& k)
                {
                    return std::get<0>(k) == messageId &&
                           std::get<1>(k) == emoji;
                });
            result = makeUnexpectedError(placedByOther
                                             ? LiveErrc::unauthorized
                                             : LiveErrc::noSuchReaction);
        }
        else
        {
            result = Event::reactionRemoved({messageId, std::move(emoji),
                                             identity});
        }
    }
    handler(std::move(result));
}

CPPLIVE_INLINE void MemoryMessageStore::createThreadReply(
    const Identity& author, const TopicUri& topic, const MessageId& parentId,
    std::string content, Attachments attachments, EventHandler handler)
{
    ErrorOr<Event> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto parent = lookup(topic, parentId);
        if (!parent)
        {
            result = UnexpectedError(parent.error());
        }
        else
        {
            // Replies to a reply join the thread of its root message.
            auto root = (*parent)->isThreadReply() ? (*parent)->threadId
                                                   : (*parent)->id;
            auto msg = insert(author, topic, std::move(content),
                              std::move(attachments), std::move(root));
            if (msg)
                result = Event::threadReplyCreated(std::move(*msg));
            else
                result = UnexpectedError(msg.error());
        }
    }
    handler(std::move(result));
}

CPPLIVE_INLINE void MemoryMessageStore::markRead(
    const Identity& identity, const TopicUri& topic,
    const MessageId& messageId, EventHandler handler)
{
    ErrorOr<Event> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto msg = lookup(topic, messageId);
        if (!msg)
        {
            result = UnexpectedError(msg.error());
        }
        else
        {
            reads_[ReadKey{identity, topic}] = messageId;
            result = Event::messageRead(messageId, identity);
        }
    }
    handler(std::move(result));
}

CPPLIVE_INLINE void MemoryMessageStore::listRecent(
    const TopicUri& topic, std::size_t limit, ListHandler handler)
{
    MessageList list;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = timelines_.find(topic);
        if (found != timelines_.end())
        {
            for (const auto& id: found->second)
            {
                const auto& msg = messages_.at(id);
                if (!msg.isThreadReply())
                    list.push_back(msg);
            }
        }
    }
    handler(internal::takeTail(std::move(list), limit));
}

CPPLIVE_INLINE void MemoryMessageStore::listBefore(
    const TopicUri& topic, const MessageId& beforeId, std::size_t limit,
    ListHandler handler)
{
    ErrorOr<MessageList> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto anchor = lookup(topic, beforeId);
        if (!anchor)
        {
            result = UnexpectedError(anchor.error());
        }
        else
        {
            MessageList list;
            for (const auto& id: timelines_[topic])
            {
                if (id == beforeId)
                    break;
                const auto& msg = messages_.at(id);
                if (!msg.isThreadReply())
                    list.push_back(msg);
            }
            result = internal::takeTail(std::move(list), limit);
        }
    }
    handler(std::move(result));
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE ErrorOr<MessageRecord> MemoryMessageStore::insert(
    const Identity& author, const TopicUri& topic, std::string content,
    Attachments attachments, MessageId threadId)
{
    if (internal::isBlank(content) && attachments.empty())
        return makeUnexpectedError(LiveErrc::invalid);

    MessageRecord msg;
    msg.id = "msg-" + std::to_string(nextId_++);
    msg.topic = topic;
    msg.author = author;
    msg.content = std::move(content);
    msg.attachments = std::move(attachments);
    msg.threadId = std::move(threadId);
    msg.createdAt = std::chrono::system_clock::now();

    timelines_[topic].push_back(msg.id);
    messages_.emplace(msg.id, msg);
    return msg;
}

CPPLIVE_INLINE ErrorOr<MessageRecord*> MemoryMessageStore::lookup(
    const TopicUri& topic, const MessageId& messageId)
{
    auto found = messages_.find(messageId);
    if (found == messages_.end() || found->second.topic != topic)
        return makeUnexpectedError(LiveErrc::noSuchMessage);
    return &(found->second);
}

} // namespace live
