/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_INTERNAL_TYPINGCOORDINATOR_HPP
#define CPPLIVE_INTERNAL_TYPINGCOORDINATOR_HPP

#include <chrono>
#include <utility>
#include "../asiodefs.hpp"
#include "../event.hpp"
#include "../livedefs.hpp"
#include "timeoutscheduler.hpp"
#include "topicbroadcaster.hpp"

namespace live
{

namespace internal
{

//------------------------------------------------------------------------------
// Debounced typing indicators of one topic. At most one typing state exists
// per identity; it lives until stopped or until the timeout elapses without
// a refresh. Must only be used from within the given strand, which is also
// where expiry is processed.
//------------------------------------------------------------------------------
class TypingCoordinator
{
public:
    using Scheduler = TimeoutScheduler<Identity>;
    using Duration = Scheduler::Duration;

    TypingCoordinator(IoStrand strand, TopicBroadcaster& broadcaster,
                      Duration timeout)
        : scheduler_(Scheduler::create(std::move(strand))),
          broadcaster_(broadcaster),
          timeout_(timeout)
    {
        scheduler_->listen([this](Identity identity) {onExpired(identity);});
    }

    ~TypingCoordinator()
    {
        scheduler_->unlisten();
        scheduler_->clear();
    }

    TypingCoordinator(const TypingCoordinator&) = delete;
    TypingCoordinator& operator=(const TypingCoordinator&) = delete;

    // Publishes typingStarted only if the identity was not already typing;
    // otherwise silently extends the expiry. Returns true if an event was
    // published.
    bool start(const Identity& identity)
    {
        if (scheduler_->contains(identity))
        {
            if (!hasLapsed(identity))
            {
                scheduler_->update(identity, timeout_);
                return false;
            }

            // The deadline passed but the timer has yet to fire.
            scheduler_->erase(identity);
            broadcaster_.publish(Event::typingStopped(identity));
        }

        scheduler_->insert(identity, timeout_);
        broadcaster_.publish(Event::typingStarted(identity));
        return true;
    }

    // Publishes typingStopped only if the identity was typing. Returns true
    // if an event was published.
    bool stop(const Identity& identity)
    {
        if (!scheduler_->contains(identity))
            return false;
        scheduler_->erase(identity);
        broadcaster_.publish(Event::typingStopped(identity));
        return true;
    }

    bool isTyping(const Identity& identity) const
    {
        return scheduler_->contains(identity) && !hasLapsed(identity);
    }

    std::size_t activeCount() const {return scheduler_->size();}

    Duration timeout() const {return timeout_;}

    // Discards all typing states without publishing anything.
    void reset() {scheduler_->clear();}

private:
    bool hasLapsed(const Identity& identity) const
    {
        return scheduler_->deadlineOf(identity) <= Scheduler::Clock::now();
    }

    void onExpired(const Identity& identity)
    {
        broadcaster_.publish(Event::typingStopped(identity));
    }

    Scheduler::Ptr scheduler_;
    TopicBroadcaster& broadcaster_;
    Duration timeout_;
};

} // namespace internal

} // namespace live

#endif // CPPLIVE_INTERNAL_TYPINGCOORDINATOR_HPP
