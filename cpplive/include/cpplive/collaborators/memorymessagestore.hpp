/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_COLLABORATORS_MEMORYMESSAGESTORE_HPP
#define CPPLIVE_COLLABORATORS_MEMORYMESSAGESTORE_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains an in-memory MessageStore. */
//------------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <vector>
#include "../api.hpp"
#include "../messagestore.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** MessageStore implementation keeping everything in memory.
    Handlers are invoked synchronously from within each call, after the
    store's lock has been released.

    Ownership rules:
    - only a message's author may edit or delete it;
    - only the identity that placed a reaction may remove it;
    - message content and emojis must not be blank;
    - a message ID belonging to another topic is reported as unknown. */
//------------------------------------------------------------------------------
class CPPLIVE_API MemoryMessageStore : public MessageStore
{
public:
    using Ptr = std::shared_ptr<MemoryMessageStore>;

    static Ptr create();

    /** Obtains the last message marked as read by the identity in the
        topic, or an empty string if none. */
    MessageId lastRead(const Identity& identity, const TopicUri& topic) const;

    /** Obtains a copy of the stored message with the given ID. */
    ErrorOr<MessageRecord> find(const MessageId& messageId) const;

    /** Obtains the number of stored messages, including thread replies. */
    std::size_t messageCount() const;

    void createMessage(const Identity& author, const TopicUri& topic,
                       std::string content, Attachments attachments,
                       EventHandler handler) override;

    void editMessage(const Identity& identity, const TopicUri& topic,
                     const MessageId& messageId, std::string content,
                     EventHandler handler) override;

    void deleteMessage(const Identity& identity, const TopicUri& topic,
                       const MessageId& messageId,
                       EventHandler handler) override;

    void addReaction(const Identity& identity, const TopicUri& topic,
                     const MessageId& messageId, std::string emoji,
                     EventHandler handler) override;

    void removeReaction(const Identity& identity, const TopicUri& topic,
                        const MessageId& messageId, std::string emoji,
                        EventHandler handler) override;

    void createThreadReply(const Identity& author, const TopicUri& topic,
                           const MessageId& parentId, std::string content,
                           Attachments attachments,
                           EventHandler handler) override;

    void markRead(const Identity& identity, const TopicUri& topic,
                  const MessageId& messageId, EventHandler handler) override;

    void listRecent(const TopicUri& topic, std::size_t limit,
                    ListHandler handler) override;

    void listBefore(const TopicUri& topic, const MessageId& beforeId,
                    std::size_t limit, ListHandler handler) override;

protected:
    MemoryMessageStore() = default;

private:
    using ReactionKey = std::tuple<MessageId, std::string, Identity>;
    using ReadKey = std::pair<Identity, TopicUri>;

    ErrorOr<MessageRecord> insert(const Identity& author,
                                  const TopicUri& topic, std::string content,
                                  Attachments attachments, MessageId threadId);

    ErrorOr<MessageRecord*> lookup(const TopicUri& topic,
                                   const MessageId& messageId);

    std::map<MessageId, MessageRecord> messages_;
    std::map<TopicUri, std::vector<MessageId>> timelines_;
    std::set<ReactionKey> reactions_;
    std::map<ReadKey, MessageId> reads_;
    uint64_t nextId_ = 1;
    mutable std::mutex mutex_;
};

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "../internal/memorymessagestore.inl.hpp"
#endif

#endif // CPPLIVE_COLLABORATORS_MEMORYMESSAGESTORE_HPP
