/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../event.hpp"
#include <array>
#include <utility>
#include "../api.hpp"

namespace live
{

//------------------------------------------------------------------------------
CPPLIVE_INLINE const std::string& eventKindLabel(EventKind kind)
{
    static const std::array<std::string, 11> labels =
    {{
        "none",
        "message_created",
        "message_edited",
        "message_deleted",
        "reaction_added",
        "reaction_removed",
        "thread_reply_created",
        "typing_started",
        "typing_stopped",
        "presence_diff",
        "message_read"
    }};
    return labels.at(static_cast<unsigned>(kind));
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE Event Event::messageCreated(MessageRecord message)
{
    Event ev{EventKind::messageCreated, message.author};
    ev.messageId_ = message.id;
    ev.message_ = std::move(message);
    return ev;
}

CPPLIVE_INLINE Event Event::messageEdited(MessageRecord message)
{
    Event ev{EventKind::messageEdited, message.author};
    ev.messageId_ = message.id;
    ev.message_ = std::move(message);
    return ev;
}

CPPLIVE_INLINE Event Event::messageDeleted(MessageRecord message,
                                           Identity deleter)
{
    Event ev{EventKind::messageDeleted, std::move(deleter)};
    ev.messageId_ = message.id;
    ev.message_ = std::move(message);
    return ev;
}

CPPLIVE_INLINE Event Event::threadReplyCreated(MessageRecord reply)
{
    Event ev{EventKind::threadReplyCreated, reply.author};
    ev.messageId_ = reply.id;
    ev.message_ = std::move(reply);
    return ev;
}

CPPLIVE_INLINE Event Event::reactionAdded(ReactionRecord reaction)
{
    Event ev{EventKind::reactionAdded, reaction.identity};
    ev.messageId_ = reaction.messageId;
    ev.reaction_ = std::move(reaction);
    return ev;
}

CPPLIVE_INLINE Event Event::reactionRemoved(ReactionRecord reaction)
{
    Event ev{EventKind::reactionRemoved, reaction.identity};
    ev.messageId_ = reaction.messageId;
    ev.reaction_ = std::move(reaction);
    return ev;
}

CPPLIVE_INLINE Event Event::messageRead(MessageId messageId, Identity reader)
{
    Event ev{EventKind::messageRead, std::move(reader)};
    ev.messageId_ = std::move(messageId);
    return ev;
}

CPPLIVE_INLINE Event Event::typingStarted(Identity identity)
{
    return Event{EventKind::typingStarted, std::move(identity)};
}

CPPLIVE_INLINE Event Event::typingStopped(Identity identity)
{
    return Event{EventKind::typingStopped, std::move(identity)};
}

CPPLIVE_INLINE Event Event::presenceDiffed(PresenceDiff diff,
                                           Identity identity)
{
    Event ev{EventKind::presenceDiffed, std::move(identity)};
    ev.diff_ = std::move(diff);
    return ev;
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE Event::Event() = default;

CPPLIVE_INLINE EventKind Event::kind() const {return kind_;}

CPPLIVE_INLINE SequenceNumber Event::sequence() const {return sequence_;}

CPPLIVE_INLINE const Identity& Event::originator() const {return originator_;}

CPPLIVE_INLINE bool Event::isTyping() const
{
    return kind_ == EventKind::typingStarted ||
           kind_ == EventKind::typingStopped;
}

CPPLIVE_INLINE const MessageRecord& Event::message() const {return message_;}

CPPLIVE_INLINE const ReactionRecord& Event::reaction() const
{
    return reaction_;
}

CPPLIVE_INLINE const MessageId& Event::messageId() const {return messageId_;}

CPPLIVE_INLINE const PresenceDiff& Event::presenceDiff() const {return diff_;}

CPPLIVE_INLINE Event::Event(EventKind kind, Identity originator)
    : originator_(std::move(originator)),
      kind_(kind)
{}

} // namespace live
