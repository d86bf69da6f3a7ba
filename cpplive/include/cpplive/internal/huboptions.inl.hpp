/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../huboptions.hpp"
#include <utility>
#include "../api.hpp"
#include "../exceptions.hpp"

namespace live
{

CPPLIVE_INLINE HubOptions::HubOptions(ChannelDirectory::Ptr directory,
                                      MessageStore::Ptr store)
    : directory_(std::move(directory)),
      store_(std::move(store))
{
    CPPLIVE_LOGIC_CHECK(directory_ != nullptr, "Null ChannelDirectory");
    CPPLIVE_LOGIC_CHECK(store_ != nullptr, "Null MessageStore");
}

CPPLIVE_INLINE HubOptions& HubOptions::withTypingTimeout(Timeout timeout)
{
    CPPLIVE_LOGIC_CHECK(timeout.count() > 0, "Typing timeout must be positive");
    typingTimeout_ = timeout;
    return *this;
}

CPPLIVE_INLINE HubOptions& HubOptions::withOutboundQueueLimit(std::size_t limit)
{
    CPPLIVE_LOGIC_CHECK(limit > 0, "Outbound queue limit must be positive");
    outboundQueueLimit_ = limit;
    return *this;
}

CPPLIVE_INLINE HubOptions& HubOptions::withStoreTimeout(Timeout timeout)
{
    CPPLIVE_LOGIC_CHECK(timeout.count() > 0, "Store timeout must be positive");
    storeTimeout_ = timeout;
    return *this;
}

CPPLIVE_INLINE HubOptions& HubOptions::withRecentMessageLimit(std::size_t limit)
{
    recentMessageLimit_ = limit;
    return *this;
}

CPPLIVE_INLINE HubOptions& HubOptions::withOlderMessageLimit(std::size_t limit)
{
    olderMessageLimit_ = limit;
    return *this;
}

CPPLIVE_INLINE HubOptions& HubOptions::withLogHandler(LogHandler handler)
{
    logHandler_ = std::move(handler);
    return *this;
}

CPPLIVE_INLINE HubOptions& HubOptions::withLogLevel(LogLevel level)
{
    logLevel_ = level;
    return *this;
}

CPPLIVE_INLINE const ChannelDirectory::Ptr& HubOptions::directory() const
{
    return directory_;
}

CPPLIVE_INLINE const MessageStore::Ptr& HubOptions::store() const
{
    return store_;
}

CPPLIVE_INLINE HubOptions::Timeout HubOptions::typingTimeout() const
{
    return typingTimeout_;
}

CPPLIVE_INLINE std::size_t HubOptions::outboundQueueLimit() const
{
    return outboundQueueLimit_;
}

CPPLIVE_INLINE HubOptions::Timeout HubOptions::storeTimeout() const
{
    return storeTimeout_;
}

CPPLIVE_INLINE std::size_t HubOptions::recentMessageLimit() const
{
    return recentMessageLimit_;
}

CPPLIVE_INLINE std::size_t HubOptions::olderMessageLimit() const
{
    return olderMessageLimit_;
}

CPPLIVE_INLINE const LogHandler& HubOptions::logHandler() const
{
    return logHandler_;
}

CPPLIVE_INLINE LogLevel HubOptions::logLevel() const {return logLevel_;}

} // namespace live
