/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_HUB_HPP
#define CPPLIVE_HUB_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the Hub API, the entry point of the real-time layer. */
//------------------------------------------------------------------------------

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include "api.hpp"
#include "asiodefs.hpp"
#include "connection.hpp"
#include "huboptions.hpp"
#include "logging.hpp"
#include "topicuri.hpp"
#include "traits.hpp"
#include "transport.hpp"

namespace live
{

namespace internal { class HubImpl; }

//------------------------------------------------------------------------------
/** Keeps the clients connected to it informed, in order, of the message,
    presence and typing events of the topics they join.
    Topics are opened lazily by their first joining session and closed when
    their last session leaves. */
//------------------------------------------------------------------------------
class CPPLIVE_API Hub
{
public:
    /** Executor type used for I/O operations. */
    using Executor = AnyIoExecutor;

    /** Constructor taking an executor. */
    Hub(Executor exec, HubOptions options);

    /** Constructor taking an execution context. */
    template <typename E, CPPLIVE_NEEDS(isExecutionContext<E>()) = 0>
    Hub(E& context, HubOptions options)
        : Hub(context.get_executor(), std::move(options))
    {}

    /// @name Move-only
    /// @{
    Hub(const Hub&) = delete;
    Hub(Hub&&) = default;
    Hub& operator=(const Hub&) = delete;
    Hub& operator=(Hub&&) = default;
    /// @}

    /** Attaches a client whose transport handshake has completed. */
    Connection connect(Transport::Ptr transport, ClientInfo info);

    /** Discards the presence and typing state of a topic, forcing every
        session attached to it to join again.
        @returns false if the topic is not currently open. */
    bool resetTopic(const TopicUri& topic);

    /** Parses the topic name before resetting the topic. */
    bool resetTopic(const std::string& topicName);

    /** Obtains the number of currently open topics. */
    std::size_t topicCount() const;

    /** Obtains the number of sessions attached to open topics. */
    std::size_t sessionCount() const;

    LogLevel logLevel() const;

    void setLogLevel(LogLevel level);

    void log(LogEntry entry);

    const Executor& executor() const;

private:
    std::shared_ptr<internal::HubImpl> impl_;
};

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "internal/hub.inl.hpp"
#endif

#endif // CPPLIVE_HUB_HPP
