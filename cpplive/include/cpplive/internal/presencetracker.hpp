/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_INTERNAL_PRESENCETRACKER_HPP
#define CPPLIVE_INTERNAL_PRESENCETRACKER_HPP

#include <algorithm>
#include <utility>
#include "../errorcodes.hpp"
#include "../erroror.hpp"
#include "../event.hpp"
#include "../presence.hpp"
#include "topicbroadcaster.hpp"

namespace live
{

namespace internal
{

//------------------------------------------------------------------------------
// Presence map of one topic, keyed by (identity, device). Every mutation
// publishes its diff as a presenceDiffed event before returning it.
// Not thread-safe; owned by the topic's TopicRoom.
//------------------------------------------------------------------------------
class PresenceTracker
{
public:
    explicit PresenceTracker(TopicBroadcaster& broadcaster)
        : broadcaster_(broadcaster)
    {}

    PresenceTracker(const PresenceTracker&) = delete;
    PresenceTracker& operator=(const PresenceTracker&) = delete;

    // Tracking an already tracked device replaces its meta, reporting the
    // old meta as a leave and the new one as a join.
    PresenceDiff track(const Identity& identity, PresenceMeta meta)
    {
        PresenceDiff diff;
        auto& metas = map_[identity];
        auto found = findMeta(metas, meta.deviceId);
        if (found != metas.end())
        {
            diff.leaves[identity].push_back(*found);
            *found = meta;
        }
        else
        {
            metas.push_back(meta);
        }
        diff.joins[identity].push_back(std::move(meta));
        publish(identity, diff);
        return diff;
    }

    // Untracking an unknown device is a no-op returning an empty diff,
    // and publishes nothing.
    PresenceDiff untrack(const Identity& identity, const DeviceId& deviceId)
    {
        PresenceDiff diff;
        auto entry = map_.find(identity);
        if (entry == map_.end())
            return diff;

        auto& metas = entry->second;
        auto found = findMeta(metas, deviceId);
        if (found == metas.end())
            return diff;

        diff.leaves[identity].push_back(*found);
        metas.erase(found);
        if (metas.empty())
            map_.erase(entry);
        publish(identity, diff);
        return diff;
    }

    ErrorOr<PresenceDiff> updateStatus(const Identity& identity,
                                       const DeviceId& deviceId,
                                       PresenceStatus status)
    {
        auto entry = map_.find(identity);
        if (entry == map_.end())
            return makeUnexpectedError(LiveErrc::noSuchMeta);
        auto found = findMeta(entry->second, deviceId);
        if (found == entry->second.end())
            return makeUnexpectedError(LiveErrc::noSuchMeta);

        PresenceDiff diff;
        diff.leaves[identity].push_back(*found);
        found->status = status;
        diff.joins[identity].push_back(*found);
        publish(identity, diff);
        return diff;
    }

    const PresenceMap& snapshot() const {return map_;}

    bool contains(const Identity& identity, const DeviceId& deviceId) const
    {
        auto entry = map_.find(identity);
        if (entry == map_.end())
            return false;
        const auto& metas = entry->second;
        return std::any_of(metas.begin(), metas.end(),
                           [&deviceId](const PresenceMeta& m)
                               {return m.deviceId == deviceId;});
    }

    // Discards all state without publishing anything.
    void reset() {map_.clear();}

private:
    static PresenceMetaList::iterator findMeta(PresenceMetaList& metas,
                                               const DeviceId& deviceId)
    {
        return std::find_if(metas.begin(), metas.end(),
                            [&deviceId](const PresenceMeta& m)
                                {return m.deviceId == deviceId;});
    }

    void publish(const Identity& identity, const PresenceDiff& diff)
    {
        broadcaster_.publish(Event::presenceDiffed(diff, identity));
    }

    TopicBroadcaster& broadcaster_;
    PresenceMap map_;
};

} // namespace internal

} // namespace live

#endif // CPPLIVE_INTERNAL_PRESENCETRACKER_HPP
