/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_HUBOPTIONS_HPP
#define CPPLIVE_HUBOPTIONS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the API used for configuring a hub. */
//------------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <string>
#include "api.hpp"
#include "channeldirectory.hpp"
#include "logging.hpp"
#include "messagestore.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** Contains hub configuration parameters. */
//------------------------------------------------------------------------------
class CPPLIVE_API HubOptions
{
public:
    using Timeout = std::chrono::steady_clock::duration;

    HubOptions(ChannelDirectory::Ptr directory, MessageStore::Ptr store);

    /** Sets how long a typing indicator stays alive without a refresh. */
    HubOptions& withTypingTimeout(Timeout timeout);

    /** Sets the number of frames a session may have pending before it is
        terminated with LiveErrc::backpressure. */
    HubOptions& withOutboundQueueLimit(std::size_t limit);

    /** Sets the bound on each message store call made by a session. */
    HubOptions& withStoreTimeout(Timeout timeout);

    /** Sets the number of messages sent in the join-time backlog. */
    HubOptions& withRecentMessageLimit(std::size_t limit);

    /** Sets the number of messages returned per `load_older_messages`. */
    HubOptions& withOlderMessageLimit(std::size_t limit);

    HubOptions& withLogHandler(LogHandler handler);

    HubOptions& withLogLevel(LogLevel level);

    const ChannelDirectory::Ptr& directory() const;

    const MessageStore::Ptr& store() const;

    Timeout typingTimeout() const;

    std::size_t outboundQueueLimit() const;

    Timeout storeTimeout() const;

    std::size_t recentMessageLimit() const;

    std::size_t olderMessageLimit() const;

    const LogHandler& logHandler() const;

    LogLevel logLevel() const;

private:
    ChannelDirectory::Ptr directory_;
    MessageStore::Ptr store_;
    LogHandler logHandler_;
    Timeout typingTimeout_ = std::chrono::seconds(5);
    Timeout storeTimeout_ = std::chrono::seconds(5);
    std::size_t outboundQueueLimit_ = 256;
    std::size_t recentMessageLimit_ = 50;
    std::size_t olderMessageLimit_ = 20;
    LogLevel logLevel_ = LogLevel::warning;
};

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "internal/huboptions.inl.hpp"
#endif

#endif // CPPLIVE_HUBOPTIONS_HPP
