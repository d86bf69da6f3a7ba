/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../errorcodes.hpp"
#include <array>
#include <cstddef>
#include <sstream>
#include "../api.hpp"

namespace live
{

namespace internal
{

//------------------------------------------------------------------------------
template <typename TEnum, std::size_t N>
std::string lookupErrorMessage(const char* categoryName, int errorCodeValue,
                               const std::array<const char*, N>& table)
{
    static_assert(N == static_cast<unsigned>(TEnum::count), "");
    if (errorCodeValue >= 0 && errorCodeValue < static_cast<int>(N))
        return table.at(errorCodeValue);
    return std::string(categoryName) + ':' + std::to_string(errorCodeValue);
}

} // namespace internal


//------------------------------------------------------------------------------
CPPLIVE_INLINE std::string briefErrorCodeString(std::error_code ec)
{
    std::ostringstream oss;
    oss << ec;
    return oss.str();
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE std::string detailedErrorCodeString(std::error_code ec)
{
    std::ostringstream oss;
    oss << ec << " (" << ec.message() << ")";
    return oss.str();
}


//------------------------------------------------------------------------------
// Real-time Layer Error Codes
//------------------------------------------------------------------------------

CPPLIVE_INLINE const char* LiveCategory::name() const noexcept
{
    return "live::LiveCategory";
}

CPPLIVE_INLINE std::string LiveCategory::message(int ev) const
{
    static constexpr auto count = static_cast<unsigned>(LiveErrc::count);

    static const std::array<const char*, count> msg =
    {
/* success        */ "Operation successful",

/* unauthorized   */ "Not authorized to perform the action",
/* notFound       */ "The target entity does not exist",
/* invalid        */ "Malformed command or missing required field",
/* storeFailure   */ "The message store operation failed",
/* backpressure   */ "Session outbound queue overflowed",

/* archived       */ "The channel is archived",
/* noSuchTopic    */ "No topic exists with the given name",
/* noSuchMessage  */ "No message exists with the given ID",
/* noSuchReaction */ "No matching reaction exists",
/* noSuchMeta     */ "No presence meta exists for the device",
/* notJoined      */ "The targeted topic has not been joined",
/* alreadyJoined  */ "The topic has already been joined",
/* storeTimeout   */ "The message store operation timed out",

/* internalFault  */ "An unhandled fault occurred",
/* topicRestarted */ "The topic owner was restarted",
/* sessionClosed  */ "Session closed normally",
/* disconnected   */ "The client connection was lost",
    };

    return internal::lookupErrorMessage<LiveErrc>("live::LiveCategory", ev,
                                                  msg);
}

CPPLIVE_INLINE bool LiveCategory::equivalent(const std::error_code& code,
                                             int condition) const noexcept
{
    if (code.category() == liveCategory())
    {
        if (code.value() == condition)
            return true;

        auto value = static_cast<LiveErrc>(code.value());
        switch (static_cast<LiveErrc>(condition))
        {
        case LiveErrc::unauthorized:
            return value == LiveErrc::archived;

        case LiveErrc::notFound:
            return value == LiveErrc::noSuchTopic ||
                   value == LiveErrc::noSuchMessage ||
                   value == LiveErrc::noSuchReaction ||
                   value == LiveErrc::noSuchMeta;

        case LiveErrc::invalid:
            return value == LiveErrc::notJoined ||
                   value == LiveErrc::alreadyJoined;

        case LiveErrc::storeFailure:
            return value == LiveErrc::storeTimeout;

        default: return false;
        }
    }
    else if (condition == static_cast<int>(LiveErrc::success))
        return !code;
    else if (condition == static_cast<int>(LiveErrc::storeFailure))
        return static_cast<bool>(code);
    else
        return false;
}

CPPLIVE_INLINE LiveCategory::LiveCategory() = default;

CPPLIVE_INLINE LiveCategory& liveCategory()
{
    static LiveCategory instance;
    return instance;
}

CPPLIVE_INLINE std::error_code make_error_code(LiveErrc errc)
{
    return {static_cast<int>(errc), liveCategory()};
}

CPPLIVE_INLINE std::error_condition make_error_condition(LiveErrc errc)
{
    return {static_cast<int>(errc), liveCategory()};
}

namespace internal
{

//------------------------------------------------------------------------------
inline const std::array<const std::string,
                        static_cast<unsigned>(LiveErrc::count)>& reasonTable()
{
    static const std::array<const std::string,
                            static_cast<unsigned>(LiveErrc::count)> table =
    {{
        "ok",
        "unauthorized",
        "not_found",
        "invalid",
        "store_failure",
        "backpressure",
        "archived",
        "not_found",
        "not_found",
        "not_found",
        "not_found",
        "not_joined",
        "already_joined",
        "store_timeout",
        "internal_error",
        "topic_restarted",
        "closed",
        "disconnected"
    }};
    return table;
}

} // namespace internal

CPPLIVE_INLINE const std::string& errorCodeToReason(LiveErrc errc)
{
    static const std::string unknown = "unknown";
    auto n = static_cast<unsigned>(errc);
    const auto& table = internal::reasonTable();
    if (n >= table.size())
        return unknown;
    return table[n];
}

CPPLIVE_INLINE std::string errorCodeToReason(std::error_code ec)
{
    if (!ec)
        return errorCodeToReason(LiveErrc::success);
    if (ec.category() == liveCategory())
        return errorCodeToReason(static_cast<LiveErrc>(ec.value()));
    return errorCodeToReason(LiveErrc::storeFailure);
}

CPPLIVE_INLINE LiveErrc reasonToErrorCode(const std::string& reason)
{
    // The first match wins, so that taxonomy codes take precedence over
    // refinements sharing the same reason.
    const auto& table = internal::reasonTable();
    for (unsigned i = 0; i < table.size(); ++i)
    {
        if (table[i] == reason)
            return static_cast<LiveErrc>(i);
    }
    return LiveErrc::count;
}

} // namespace live
