/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../connection.hpp"
#include <utility>
#include "../api.hpp"
#include "../errorcodes.hpp"
#include "../exceptions.hpp"
#include "connectionimpl.hpp"

namespace live
{

CPPLIVE_INLINE Connection::Connection() = default;

CPPLIVE_INLINE Connection::operator bool() const {return impl_ != nullptr;}

CPPLIVE_INLINE bool Connection::isOpen() const
{
    return impl_ && impl_->isOpen();
}

CPPLIVE_INLINE const ClientInfo& Connection::info() const
{
    CPPLIVE_LOGIC_CHECK(impl_ != nullptr, "Empty Connection handle");
    return impl_->info();
}

CPPLIVE_INLINE std::size_t Connection::sessionCount() const
{
    return impl_ ? impl_->sessionCount() : 0;
}

CPPLIVE_INLINE void Connection::receive(std::string frame)
{
    CPPLIVE_LOGIC_CHECK(impl_ != nullptr, "Empty Connection handle");
    impl_->receive(std::move(frame));
}

CPPLIVE_INLINE void Connection::disconnect()
{
    if (impl_)
        impl_->disconnect(make_error_code(LiveErrc::disconnected));
}

CPPLIVE_INLINE void Connection::close()
{
    if (impl_)
        impl_->close();
}

CPPLIVE_INLINE Connection::Connection(
    std::shared_ptr<internal::ConnectionImpl> impl)
    : impl_(std::move(impl))
{}

} // namespace live
