/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../presence.hpp"
#include <algorithm>
#include <array>
#include <utility>
#include "../api.hpp"
#include "../errorcodes.hpp"

namespace live
{

namespace internal
{

inline const std::array<std::string, 5>& presenceStatusLabels()
{
    static const std::array<std::string, 5> labels =
    {{
        "online",
        "away",
        "busy",
        "do_not_disturb",
        "offline"
    }};
    return labels;
}

inline void removeMetaOfDevice(PresenceMetaList& metas, const DeviceId& device)
{
    auto iter = std::remove_if(
        metas.begin(), metas.end(),
        [&device](const PresenceMeta& m) {return m.deviceId == device;});
    metas.erase(iter, metas.end());
}

} // namespace internal

//------------------------------------------------------------------------------
CPPLIVE_INLINE const std::string& presenceStatusLabel(PresenceStatus status)
{
    return internal::presenceStatusLabels().at(static_cast<unsigned>(status));
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE ErrorOr<PresenceStatus> parsePresenceStatus(
    const std::string& label)
{
    const auto& labels = internal::presenceStatusLabels();
    auto found = std::find(labels.begin(), labels.end(), label);
    if (found == labels.end())
        return makeUnexpectedError(LiveErrc::invalid);
    return static_cast<PresenceStatus>(found - labels.begin());
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE PresenceMeta::PresenceMeta() = default;

CPPLIVE_INLINE PresenceMeta::PresenceMeta(DeviceId deviceId,
                                          PresenceStatus status,
                                          TimePoint joinedAt)
    : deviceId(std::move(deviceId)),
      status(status),
      joinedAt(joinedAt)
{}

CPPLIVE_INLINE bool operator==(const PresenceMeta& lhs,
                               const PresenceMeta& rhs)
{
    return lhs.deviceId == rhs.deviceId && lhs.status == rhs.status &&
           lhs.joinedAt == rhs.joinedAt;
}

CPPLIVE_INLINE bool operator!=(const PresenceMeta& lhs,
                               const PresenceMeta& rhs)
{
    return !(lhs == rhs);
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE bool PresenceDiff::empty() const
{
    return joins.empty() && leaves.empty();
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE void applyPresenceDiff(PresenceMap& map,
                                      const PresenceDiff& diff)
{
    for (const auto& left: diff.leaves)
    {
        auto found = map.find(left.first);
        if (found == map.end())
            continue;
        for (const auto& meta: left.second)
            internal::removeMetaOfDevice(found->second, meta.deviceId);
        if (found->second.empty())
            map.erase(found);
    }

    for (const auto& joined: diff.joins)
    {
        auto& metas = map[joined.first];
        for (const auto& meta: joined.second)
        {
            internal::removeMetaOfDevice(metas, meta.deviceId);
            metas.push_back(meta);
        }
        if (metas.empty())
            map.erase(joined.first);
    }
}

//------------------------------------------------------------------------------
CPPLIVE_INLINE std::size_t countPresenceMetas(const PresenceMap& map)
{
    std::size_t n = 0;
    for (const auto& kv: map)
        n += kv.second.size();
    return n;
}

} // namespace live
