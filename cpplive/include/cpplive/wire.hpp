/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_WIRE_HPP
#define CPPLIVE_WIRE_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the JSON codec for client and server frames. */
//------------------------------------------------------------------------------

#include <string>
#include <system_error>
#include <vector>
#include "api.hpp"
#include "event.hpp"
#include "livedefs.hpp"
#include "message.hpp"
#include "presence.hpp"
#include "topicuri.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** Enumerates the operations a client may request. */
//------------------------------------------------------------------------------
enum class ClientOp
{
    unknown,
    join,
    leave,
    sendMessage,
    editMessage,
    deleteMessage,
    addReaction,
    removeReaction,
    startThread,
    typingStart,
    typingStop,
    markRead,
    loadOlderMessages,
    updateStatus
};

//------------------------------------------------------------------------------
/** Obtains the wire name of the given operation. */
//------------------------------------------------------------------------------
CPPLIVE_API const std::string& clientOpLabel(ClientOp op);

//------------------------------------------------------------------------------
/** Decoded client frame.
    When decoding fails, `error` is set to LiveErrc::invalid and the
    remaining fields hold whatever could be decoded, so that the rejection
    can be correlated with the offending command. */
//------------------------------------------------------------------------------
struct CPPLIVE_API ClientCommand
{
    bool ok() const {return !error;}

    ClientOp op = ClientOp::unknown;
    std::string opName;       ///< Raw `op` field
    std::string topic;        ///< Raw `topic` field, empty if absent
    std::string clientRef;    ///< Raw `client_ref` field, empty if absent
    std::string content;
    std::vector<std::string> attachments;
    MessageId messageId;      ///< `message_id`, or `before_id` for paging
    MessageId threadId;
    std::string emoji;
    PresenceStatus status = PresenceStatus::online;
    std::error_code error;
};

//------------------------------------------------------------------------------
/** Decodes a JSON client frame. Never throws on malformed input. */
//------------------------------------------------------------------------------
CPPLIVE_API ClientCommand decodeClientFrame(const std::string& text);

//------------------------------------------------------------------------------
/** Encodes the `joined` frame carrying the join-time snapshot. */
//------------------------------------------------------------------------------
CPPLIVE_API std::string encodeJoinedFrame(const TopicUri& topic,
                                          const PresenceMap& presence,
                                          const MessageList& recent);

//------------------------------------------------------------------------------
/** Encodes an `error` frame. The reason is derived from the error code
    via errorCodeToReason. The `client_ref` field is omitted when empty. */
//------------------------------------------------------------------------------
CPPLIVE_API std::string encodeErrorFrame(const std::string& topic,
                                         const std::string& op,
                                         std::error_code ec,
                                         const std::string& clientRef = {});

//------------------------------------------------------------------------------
/** Encodes a published event, including its sequence number. */
//------------------------------------------------------------------------------
CPPLIVE_API std::string encodeEventFrame(const TopicUri& topic,
                                         const Event& event);

//------------------------------------------------------------------------------
/** Encodes the reply to `load_older_messages`. */
//------------------------------------------------------------------------------
CPPLIVE_API std::string encodeOlderMessagesFrame(const TopicUri& topic,
                                                 const MessageList& messages);

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "internal/wire.inl.hpp"
#endif

#endif // CPPLIVE_WIRE_HPP
