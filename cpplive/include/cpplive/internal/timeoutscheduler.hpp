/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_INTERNAL_TIMEOUT_SCHEDULER_HPP
#define CPPLIVE_INTERNAL_TIMEOUT_SCHEDULER_HPP

#include <cassert>
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <set>
#include <tuple>
#include <utility>
#include <vector>
#include <boost/asio/steady_timer.hpp>
#include "../asiodefs.hpp"

namespace live
{

namespace internal
{

//------------------------------------------------------------------------------
template <typename TKey>
struct TimeoutRecord
{
    using Key = TKey;
    using Clock = std::chrono::steady_clock;
    using Duration = Clock::duration;
    using Timepoint = Clock::time_point;

    TimeoutRecord() = default;

    TimeoutRecord(Key key, Duration timeout)
        : key(std::move(key)),
          deadline(clampedDeadline(timeout))
    {}

    bool operator<(const TimeoutRecord& rhs) const
    {
        return std::tie(deadline, key) < std::tie(rhs.deadline, rhs.key);
    }

    Key key = {};
    Timepoint deadline;

private:
    static Timepoint clampedDeadline(Duration timeout)
    {
        using Limits = std::numeric_limits<typename Duration::rep>;
        auto now = Clock::now().time_since_epoch().count();
        auto ticks = timeout.count();
        if (ticks > 0)
        {
            auto limit = Limits::max() - now;
            if (ticks > limit)
                ticks = limit;
        }
        else
        {
            ticks = 0;
        }
        return Timepoint{Duration{now + ticks}};
    }
};

//------------------------------------------------------------------------------
/** Keyed set of deadlines served by a single timer. The timeout handler is
    invoked via the strand given at creation, once per expired key. */
//------------------------------------------------------------------------------
template <typename TKey>
class TimeoutScheduler
    : public std::enable_shared_from_this<TimeoutScheduler<TKey>>
{
public:
    using Key = TKey;
    using Clock = std::chrono::steady_clock;
    using Duration = Clock::duration;
    using Timepoint = Clock::time_point;
    using TimeoutHandler = std::function<void (Key)>;

    using Ptr = std::shared_ptr<TimeoutScheduler>;

    static Ptr create(IoStrand strand)
    {
        return Ptr(new TimeoutScheduler(std::move(strand)));
    }

    ~TimeoutScheduler()
    {
        deadlines_.clear();
        byKey_.clear();
        timeoutHandler_ = nullptr;
    }

    void listen(TimeoutHandler handler)
    {
        timeoutHandler_ = std::move(handler);
    }

    void unlisten() {timeoutHandler_ = nullptr;}

    bool empty() const {return deadlines_.empty();}

    std::size_t size() const {return deadlines_.size();}

    bool contains(const Key& key) const {return byKey_.count(key) != 0;}

    // Obtains the deadline for the given key, or a default-constructed
    // time point if there is none.
    Timepoint deadlineOf(const Key& key) const
    {
        auto found = byKey_.find(key);
        return found == byKey_.end() ? Timepoint{} : found->second->deadline;
    }

    // Inserting a key that is already scheduled moves its deadline.
    void insert(Key key, Duration timeout)
    {
        if (contains(key))
            return update(std::move(key), timeout);

        // The first record contains the deadline being waited on
        // by the timer.
        Record rec{key, timeout};
        bool preemptsCurrentDeadline =
            deadlines_.empty() || (rec < *deadlines_.begin());

        auto inserted = deadlines_.insert(std::move(rec));
        assert(inserted.second);
        auto emplaced = byKey_.emplace(std::move(key), inserted.first);
        assert(emplaced.second);
        (void)emplaced;
        if (preemptsCurrentDeadline)
            processNextDeadline();
    }

    void update(Key key, Duration timeout)
    {
        auto found = byKey_.find(key);
        if (found == byKey_.end())
            return;
        auto iter = found->second;
        bool invalidatesCurrentDeadline = (iter == deadlines_.begin());
        deadlines_.erase(iter);

        Record rec{key, timeout};
        invalidatesCurrentDeadline =
            invalidatesCurrentDeadline || deadlines_.empty() ||
            (rec < *deadlines_.begin());
        auto inserted = deadlines_.insert(std::move(rec));
        assert(inserted.second);
        found->second = inserted.first;

        if (invalidatesCurrentDeadline)
            processNextDeadline();
    }

    void erase(const Key& key)
    {
        auto found = byKey_.find(key);
        if (found == byKey_.end())
            return;
        auto iter = found->second;
        bool wasCurrent = (iter == deadlines_.begin());
        deadlines_.erase(iter);
        byKey_.erase(found);
        if (!wasCurrent)
            return;
        if (deadlines_.empty())
            disarm();
        else
            processNextDeadline();
    }

    void clear()
    {
        deadlines_.clear();
        byKey_.clear();
        disarm();
    }

private:
    using WeakPtr = std::weak_ptr<TimeoutScheduler>;
    using Record = TimeoutRecord<Key>;
    using RecordSet = std::set<Record>;

    explicit TimeoutScheduler(IoStrand strand)
        : timer_(std::move(strand))
    {}

    // Each wait is tagged with a generation number, so that stale
    // completions of cancelled waits are recognized and ignored.
    void processNextDeadline()
    {
        ++generation_;
        timer_.expires_at(deadlines_.begin()->deadline);
        WeakPtr self(this->shared_from_this());
        auto gen = generation_;
        timer_.async_wait([self, gen](boost::system::error_code ec)
        {
            auto ptr = self.lock();
            if (ptr)
                ptr->onTimer(ec, gen);
        });
    }

    void disarm()
    {
        ++generation_;
        timer_.cancel();
    }

    void onTimer(boost::system::error_code ec, uint64_t gen)
    {
        if (ec || gen != generation_)
            return;

        // Collect first, as handlers are free to insert or erase keys.
        std::vector<Key> expired;
        auto now = Clock::now();
        while (!deadlines_.empty() && deadlines_.begin()->deadline <= now)
        {
            auto top = deadlines_.begin();
            byKey_.erase(top->key);
            expired.push_back(top->key);
            deadlines_.erase(top);
        }

        for (auto& key: expired)
        {
            if (timeoutHandler_)
                timeoutHandler_(std::move(key));
        }

        if (!deadlines_.empty())
            processNextDeadline();
    }

    // std::map<Timepoint, Key> cannot be used because deadlines are
    // not guaranteed to be unique.
    RecordSet deadlines_;
    std::map<Key, typename RecordSet::iterator> byKey_;
    boost::asio::steady_timer timer_;
    TimeoutHandler timeoutHandler_;
    uint64_t generation_ = 0;
};

} // namespace internal

} // namespace live

#endif // CPPLIVE_INTERNAL_TIMEOUT_SCHEDULER_HPP
