/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../hub.hpp"
#include <utility>
#include "../api.hpp"
#include "../exceptions.hpp"
#include "connectionimpl.hpp"
#include "hubimpl.hpp"

namespace live
{

//******************************************************************************
// Hub
//******************************************************************************

CPPLIVE_INLINE Hub::Hub(Executor exec, HubOptions options)
    : impl_(internal::HubImpl::create(std::move(exec), std::move(options)))
{}

CPPLIVE_INLINE Connection Hub::connect(Transport::Ptr transport,
                                       ClientInfo info)
{
    CPPLIVE_LOGIC_CHECK(transport != nullptr, "Null Transport");
    CPPLIVE_LOGIC_CHECK(!info.identity.empty(), "Blank client identity");
    return Connection{internal::ConnectionImpl::create(
        impl_, std::move(transport), std::move(info))};
}

CPPLIVE_INLINE bool Hub::resetTopic(const TopicUri& topic)
{
    return impl_->resetTopic(topic);
}

CPPLIVE_INLINE bool Hub::resetTopic(const std::string& topicName)
{
    auto uri = TopicUri::parse(topicName);
    if (!uri)
        return false;
    return impl_->resetTopic(*uri);
}

CPPLIVE_INLINE std::size_t Hub::topicCount() const
{
    return impl_->topicCount();
}

CPPLIVE_INLINE std::size_t Hub::sessionCount() const
{
    return impl_->sessionCount();
}

CPPLIVE_INLINE LogLevel Hub::logLevel() const {return impl_->logLevel();}

CPPLIVE_INLINE void Hub::setLogLevel(LogLevel level)
{
    impl_->setLogLevel(level);
}

CPPLIVE_INLINE void Hub::log(LogEntry entry) {impl_->log(std::move(entry));}

CPPLIVE_INLINE const Hub::Executor& Hub::executor() const
{
    return impl_->executor();
}

} // namespace live
