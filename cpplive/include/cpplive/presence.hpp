/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_PRESENCE_HPP
#define CPPLIVE_PRESENCE_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains presence-related value types and the presence diff
           application algorithm. */
//------------------------------------------------------------------------------

#include <map>
#include <string>
#include <vector>
#include "api.hpp"
#include "erroror.hpp"
#include "livedefs.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** Enumerates the statuses a user can advertise on a device. */
//------------------------------------------------------------------------------
enum class PresenceStatus
{
    online,
    away,
    busy,
    doNotDisturb,
    offline
};

//------------------------------------------------------------------------------
/** Obtains the wire label of the given status (`do_not_disturb` for
    PresenceStatus::doNotDisturb). */
//------------------------------------------------------------------------------
CPPLIVE_API const std::string& presenceStatusLabel(PresenceStatus status);

//------------------------------------------------------------------------------
/** Parses a wire status label.
    @returns LiveErrc::invalid if the label is unknown. */
//------------------------------------------------------------------------------
CPPLIVE_API ErrorOr<PresenceStatus> parsePresenceStatus(
    const std::string& label);

//------------------------------------------------------------------------------
/** One device's presence record for an identity within a topic. */
//------------------------------------------------------------------------------
struct CPPLIVE_API PresenceMeta
{
    PresenceMeta();

    PresenceMeta(DeviceId deviceId, PresenceStatus status,
                 TimePoint joinedAt);

    DeviceId deviceId;
    PresenceStatus status = PresenceStatus::online;
    TimePoint joinedAt;
};

/** @relates PresenceMeta */
CPPLIVE_API bool operator==(const PresenceMeta& lhs, const PresenceMeta& rhs);

/** @relates PresenceMeta */
CPPLIVE_API bool operator!=(const PresenceMeta& lhs, const PresenceMeta& rhs);

/** Ordered sequence of metas held by one identity. */
using PresenceMetaList = std::vector<PresenceMeta>;

/** Mapping of identity to its metas. An identity appears only while it
    holds at least one meta. */
using PresenceMap = std::map<Identity, PresenceMetaList>;

/** An identity together with its metas. */
using PresenceEntry = PresenceMap::value_type;

//------------------------------------------------------------------------------
/** Delta emitted when topic occupancy changes. */
//------------------------------------------------------------------------------
struct CPPLIVE_API PresenceDiff
{
    /** Returns true if the diff carries neither joins nor leaves. */
    bool empty() const;

    PresenceMap joins;  ///< Metas added, per identity
    PresenceMap leaves; ///< Metas removed, per identity
};

//------------------------------------------------------------------------------
/** Applies a diff to a presence map: leaves are removed first, then joins
    are added. A join replaces any meta of the same device. Entries left
    without metas are erased. */
//------------------------------------------------------------------------------
CPPLIVE_API void applyPresenceDiff(PresenceMap& map, const PresenceDiff& diff);

//------------------------------------------------------------------------------
/** Counts the metas held across all identities of a presence map. */
//------------------------------------------------------------------------------
CPPLIVE_API std::size_t countPresenceMetas(const PresenceMap& map);

} // namespace live

#ifndef CPPLIVE_COMPILED_LIB
#include "internal/presence.inl.hpp"
#endif

#endif // CPPLIVE_PRESENCE_HPP
