/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_EVENT_HPP
#define CPPLIVE_EVENT_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the Event class broadcast to topic subscribers. */
//------------------------------------------------------------------------------

#include <memory>
#include <string>
#include "api.hpp"
#include "livedefs.hpp"
#include "message.hpp"
#include "presence.hpp"

namespace live
{

namespace internal { class TopicBroadcaster; }

//------------------------------------------------------------------------------
/** Enumerates the kinds of events published to a topic. */
//------------------------------------------------------------------------------
enum class EventKind
{
    none,
    messageCreated,
    messageEdited,
    messageDeleted,
    reactionAdded,
    reactionRemoved,
    threadReplyCreated,
    typingStarted,
    typingStopped,
    presenceDiffed,
    messageRead
};

//------------------------------------------------------------------------------
/** Obtains the wire event name of the given kind. */
//------------------------------------------------------------------------------
CPPLIVE_API const std::string& eventKindLabel(EventKind kind);

//------------------------------------------------------------------------------
/** Domain event published to a topic.
    The sequence number is assigned by the topic's broadcaster when the event
    is published; published events are shared as EventPtr and are never
    modified afterwards. */
//------------------------------------------------------------------------------
class CPPLIVE_API Event
{
public:
    /** @name Factories */
    /// @{
    static Event messageCreated(MessageRecord message);
    static Event messageEdited(MessageRecord message);
    static Event messageDeleted(MessageRecord message, Identity deleter);
    static Event threadReplyCreated(MessageRecord reply);
    static Event reactionAdded(ReactionRecord reaction);
    static Event reactionRemoved(ReactionRecord reaction);
    static Event messageRead(MessageId messageId, Identity reader);
    static Event typingStarted(Identity identity);
    static Event typingStopped(Identity identity);
    static Event presenceDiffed(PresenceDiff diff, Identity identity);
    /// @}

    /** Default constructs an event of kind EventKind::none. */
    Event();

    /** Obtains the event kind. */
    EventKind kind() const;

    /** Obtains the per-topic sequence number, or nullSequence() if the event
        has not been published. */
    SequenceNumber sequence() const;

    /** Obtains the identity whose action caused this event. */
    const Identity& originator() const;

    /** Returns true for typingStarted and typingStopped events. */
    bool isTyping() const;

    /** Obtains the message record of message and thread reply events. */
    const MessageRecord& message() const;

    /** Obtains the reaction record of reaction events. */
    const ReactionRecord& reaction() const;

    /** Obtains the ID of the message this event concerns, if any. */
    const MessageId& messageId() const;

    /** Obtains the diff of presenceDiffed events. */
    const PresenceDiff& presenceDiff() const;

private:
    explicit Event(EventKind kind, Identity originator);

    MessageRecord message_;
    ReactionRecord reaction_;
    PresenceDiff diff_;
    MessageId messageId_;
    Identity originator_;
    SequenceNumber sequence_ = nullSequence();
    EventKind kind_ = EventKind::none;

    friend class internal::TopicBroadcaster;
};

//------------------------------------------------------------------------------
/** Shared handle to a published event. */
//------------------------------------------------------------------------------
using EventPtr = std::shared_ptr<const Event>;

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "internal/event.inl.hpp"
#endif

#endif // CPPLIVE_EVENT_HPP
