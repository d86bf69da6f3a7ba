/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../wire.hpp"
#include <array>
#include <utility>
#include <jsoncons/json.hpp>
#include "../api.hpp"
#include "../errorcodes.hpp"
#include "timeformatting.hpp"

namespace live
{

namespace internal
{

using Json = jsoncons::json;

//------------------------------------------------------------------------------
inline const std::array<std::string, 14>& clientOpLabels()
{
    static const std::array<std::string, 14> labels =
    {{
        "unknown",
        "join",
        "leave",
        "send_message",
        "edit_message",
        "delete_message",
        "add_reaction",
        "remove_reaction",
        "start_thread",
        "typing_start",
        "typing_stop",
        "mark_read",
        "load_older_messages",
        "update_status"
    }};
    return labels;
}

inline ClientOp parseClientOp(const std::string& name)
{
    const auto& labels = clientOpLabels();
    for (unsigned i = 1; i < labels.size(); ++i)
    {
        if (labels[i] == name)
            return static_cast<ClientOp>(i);
    }
    return ClientOp::unknown;
}

//------------------------------------------------------------------------------
class ClientFrameReader
{
public:
    explicit ClientFrameReader(const Json& obj) : obj_(obj) {}

    bool optionalString(const char* key, std::string& out) const
    {
        if (!obj_.contains(key))
            return true;
        const auto& v = obj_.at(key);
        if (!v.is_string())
            return false;
        out = v.as<std::string>();
        return true;
    }

    bool requiredString(const char* key, std::string& out) const
    {
        return obj_.contains(key) && optionalString(key, out);
    }

    // IDs may be sent as strings or as integers.
    bool requiredId(const char* key, std::string& out) const
    {
        if (!obj_.contains(key))
            return false;
        const auto& v = obj_.at(key);
        if (v.is_int64() || v.is_uint64())
            out = v.as<std::string>();
        else if (v.is_string())
            out = v.as<std::string>();
        else
            return false;
        return !out.empty();
    }

    bool optionalId(const char* key, std::string& out) const
    {
        return !obj_.contains(key) || obj_.at(key).is_null() ||
               requiredId(key, out);
    }

    bool optionalStringList(const char* key,
                            std::vector<std::string>& out) const
    {
        if (!obj_.contains(key) || obj_.at(key).is_null())
            return true;
        const auto& v = obj_.at(key);
        if (!v.is_array())
            return false;
        for (const auto& elem: v.array_range())
        {
            if (!elem.is_string())
                return false;
            out.push_back(elem.as<std::string>());
        }
        return true;
    }

private:
    const Json& obj_;
};

//------------------------------------------------------------------------------
inline bool readCommandFields(const ClientFrameReader& r, ClientCommand& cmd)
{
    switch (cmd.op)
    {
    case ClientOp::join:
        return !cmd.topic.empty();

    case ClientOp::sendMessage:
        return r.requiredString("content", cmd.content) &&
               r.optionalStringList("attachments", cmd.attachments) &&
               r.optionalId("thread_id", cmd.threadId);

    case ClientOp::editMessage:
        return r.requiredId("message_id", cmd.messageId) &&
               r.requiredString("content", cmd.content);

    case ClientOp::deleteMessage:
    case ClientOp::markRead:
        return r.requiredId("message_id", cmd.messageId);

    case ClientOp::addReaction:
    case ClientOp::removeReaction:
        return r.requiredId("message_id", cmd.messageId) &&
               r.requiredString("emoji", cmd.emoji);

    case ClientOp::startThread:
        return r.requiredId("message_id", cmd.messageId) &&
               r.requiredString("content", cmd.content) &&
               r.optionalStringList("attachments", cmd.attachments);

    case ClientOp::loadOlderMessages:
        return r.requiredId("before_id", cmd.messageId);

    case ClientOp::updateStatus:
    {
        std::string label;
        if (!r.requiredString("status", label))
            return false;
        auto status = parsePresenceStatus(label);
        if (!status)
            return false;
        cmd.status = *status;
        return true;
    }

    case ClientOp::leave:
    case ClientOp::typingStart:
    case ClientOp::typingStop:
        return true;

    default:
        break;
    }
    return false;
}

//------------------------------------------------------------------------------
inline Json toJson(const MessageRecord& m)
{
    Json attachments(jsoncons::json_array_arg);
    for (const auto& a: m.attachments)
        attachments.push_back(a);

    Json j(jsoncons::json_object_arg);
    j.insert_or_assign("id", m.id);
    j.insert_or_assign("topic", m.topic.str());
    j.insert_or_assign("author", m.author);
    j.insert_or_assign("content", m.content);
    j.insert_or_assign("attachments", std::move(attachments));
    j.insert_or_assign("created_at", toRfc3339Timestamp(m.createdAt));
    if (m.isThreadReply())
        j.insert_or_assign("thread_id", m.threadId);
    if (m.isEdited())
        j.insert_or_assign("edited_at", toRfc3339Timestamp(m.editedAt));
    return j;
}

inline Json toJson(const MessageList& list)
{
    Json j(jsoncons::json_array_arg);
    for (const auto& m: list)
        j.push_back(toJson(m));
    return j;
}

inline Json toJson(const PresenceMap& map)
{
    Json j(jsoncons::json_object_arg);
    for (const auto& entry: map)
    {
        Json metas(jsoncons::json_array_arg);
        for (const auto& meta: entry.second)
        {
            Json m(jsoncons::json_object_arg);
            m.insert_or_assign("device_id", meta.deviceId);
            m.insert_or_assign("status", presenceStatusLabel(meta.status));
            m.insert_or_assign("joined_at",
                               toRfc3339Timestamp(meta.joinedAt));
            metas.push_back(std::move(m));
        }
        j.insert_or_assign(entry.first, std::move(metas));
    }
    return j;
}

inline Json makeServerFrame(const std::string& event, const std::string& topic)
{
    Json j(jsoncons::json_object_arg);
    j.insert_or_assign("event", event);
    j.insert_or_assign("topic", topic);
    return j;
}

inline std::string dumpFrame(const Json& j)
{
    std::string text;
    j.dump(text);
    return text;
}

} // namespace internal


//------------------------------------------------------------------------------
CPPLIVE_INLINE const std::string& clientOpLabel(ClientOp op)
{
    return internal::clientOpLabels().at(static_cast<unsigned>(op));
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE ClientCommand decodeClientFrame(const std::string& text)
{
    ClientCommand cmd;
    cmd.error = make_error_code(LiveErrc::invalid);

    internal::Json frame;
    try
    {
        frame = internal::Json::parse(text);
    }
    catch (const jsoncons::ser_error&)
    {
        return cmd;
    }

    if (!frame.is_object())
        return cmd;

    internal::ClientFrameReader reader{frame};
    if (!reader.requiredString("op", cmd.opName))
        return cmd;
    if (!reader.optionalString("topic", cmd.topic))
        return cmd;

    // A client_ref is only echoed back, so any scalar is accepted.
    if (frame.contains("client_ref") && !frame.at("client_ref").is_null())
    {
        const auto& ref = frame.at("client_ref");
        if (ref.is_object() || ref.is_array())
            return cmd;
        cmd.clientRef = ref.as<std::string>();
    }

    cmd.op = internal::parseClientOp(cmd.opName);
    if (cmd.op == ClientOp::unknown)
        return cmd;

    if (internal::readCommandFields(reader, cmd))
        cmd.error.clear();
    return cmd;
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE std::string encodeJoinedFrame(const TopicUri& topic,
                                             const PresenceMap& presence,
                                             const MessageList& recent)
{
    internal::Json snapshot(jsoncons::json_object_arg);
    snapshot.insert_or_assign("presence", internal::toJson(presence));
    snapshot.insert_or_assign("recent_messages", internal::toJson(recent));

    auto j = internal::makeServerFrame("joined", topic.str());
    j.insert_or_assign("snapshot", std::move(snapshot));
    return internal::dumpFrame(j);
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE std::string encodeErrorFrame(const std::string& topic,
                                            const std::string& op,
                                            std::error_code ec,
                                            const std::string& clientRef)
{
    auto j = internal::makeServerFrame("error", topic);
    j.insert_or_assign("op", op);
    j.insert_or_assign("reason", errorCodeToReason(ec));
    if (!clientRef.empty())
        j.insert_or_assign("client_ref", clientRef);
    return internal::dumpFrame(j);
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE std::string encodeEventFrame(const TopicUri& topic,
                                            const Event& event)
{
    auto j = internal::makeServerFrame(eventKindLabel(event.kind()),
                                       topic.str());

    switch (event.kind())
    {
    case EventKind::messageCreated:
    case EventKind::messageEdited:
    case EventKind::messageDeleted:
    case EventKind::threadReplyCreated:
        j.insert_or_assign("message", internal::toJson(event.message()));
        break;

    case EventKind::reactionAdded:
    case EventKind::reactionRemoved:
        j.insert_or_assign("message_id", event.reaction().messageId);
        j.insert_or_assign("emoji", event.reaction().emoji);
        j.insert_or_assign("identity", event.reaction().identity);
        break;

    case EventKind::messageRead:
        j.insert_or_assign("message_id", event.messageId());
        j.insert_or_assign("identity", event.originator());
        break;

    case EventKind::typingStarted:
    case EventKind::typingStopped:
        j.insert_or_assign("identity", event.originator());
        break;

    case EventKind::presenceDiffed:
        j.insert_or_assign("joins",
                           internal::toJson(event.presenceDiff().joins));
        j.insert_or_assign("leaves",
                           internal::toJson(event.presenceDiff().leaves));
        break;

    default:
        break;
    }

    j.insert_or_assign("seq", event.sequence());
    return internal::dumpFrame(j);
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE std::string encodeOlderMessagesFrame(const TopicUri& topic,
                                                    const MessageList& messages)
{
    auto j = internal::makeServerFrame("older_messages_loaded", topic.str());
    j.insert_or_assign("messages", internal::toJson(messages));
    return internal::dumpFrame(j);
}

} // namespace live
