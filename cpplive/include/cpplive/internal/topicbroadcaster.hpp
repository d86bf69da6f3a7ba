/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_INTERNAL_TOPICBROADCASTER_HPP
#define CPPLIVE_INTERNAL_TOPICBROADCASTER_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <utility>
#include <vector>
#include "../event.hpp"
#include "../livedefs.hpp"

namespace live
{

namespace internal
{

//------------------------------------------------------------------------------
// Receives the events published to a topic. Called from within the topic's
// strand; implementations must only enqueue and return promptly.
//------------------------------------------------------------------------------
class EventSubscriber
{
public:
    using Ptr = std::shared_ptr<EventSubscriber>;
    using WeakPtr = std::weak_ptr<EventSubscriber>;

    virtual ~EventSubscriber() = default;

    // Returns false if the subscriber's bounded queue is full, in which case
    // the subscriber is expected to terminate itself.
    virtual bool deliver(const EventPtr& event) = 0;
};

//------------------------------------------------------------------------------
struct BroadcastSubscription
{
    BroadcastSubscription() = default;

    BroadcastSubscription(EventSubscriber::WeakPtr s, SequenceNumber from)
        : subscriber(std::move(s)),
          fromSeq(from)
    {}

    EventSubscriber::WeakPtr subscriber;
    SequenceNumber fromSeq = nullSequence();
};

//------------------------------------------------------------------------------
// Ordered event stream of one topic. Not thread-safe; it is owned by the
// topic's TopicRoom and only accessed via its strand.
//------------------------------------------------------------------------------
class TopicBroadcaster
{
public:
    using DropHandler = std::function<void (SubscriptionId)>;

    TopicBroadcaster() = default;

    TopicBroadcaster(const TopicBroadcaster&) = delete;
    TopicBroadcaster& operator=(const TopicBroadcaster&) = delete;

    // Invoked for each subscription removed because its subscriber refused
    // an event or no longer exists.
    void onDrop(DropHandler handler) {dropHandler_ = std::move(handler);}

    // Assigns the next sequence number and delivers the event, in
    // subscription order, to every subscriber. Subscribers that refuse
    // the event are unsubscribed without affecting delivery to others.
    SequenceNumber publish(Event event)
    {
        event.sequence_ = ++lastSeq_;
        EventPtr shared = std::make_shared<const Event>(std::move(event));
        auto seq = shared->sequence();

        std::vector<SubscriptionId> dropped;
        for (const auto& kv: subscriptions_)
        {
            const auto& sub = kv.second;
            if (seq <= sub.fromSeq)
                continue;
            auto subscriber = sub.subscriber.lock();
            if (!subscriber || !subscriber->deliver(shared))
                dropped.push_back(kv.first);
        }

        for (auto id: dropped)
        {
            subscriptions_.erase(id);
            if (dropHandler_)
                dropHandler_(id);
        }

        return seq;
    }

    // Registers a subscriber for events having a sequence number greater
    // than fromSeq. History is never replayed.
    SubscriptionId subscribe(EventSubscriber::WeakPtr subscriber,
                             SequenceNumber fromSeq)
    {
        auto id = ++lastSubscriptionId_;
        subscriptions_.emplace(
            id, BroadcastSubscription{std::move(subscriber), fromSeq});
        return id;
    }

    SubscriptionId subscribeAtTail(EventSubscriber::WeakPtr subscriber)
    {
        return subscribe(std::move(subscriber), lastSeq_);
    }

    // Idempotent.
    bool unsubscribe(SubscriptionId id) {return subscriptions_.erase(id) != 0;}

    // Drops all subscriptions while preserving the sequence counter.
    void clear() {subscriptions_.clear();}

    bool isSubscribed(SubscriptionId id) const
    {
        return subscriptions_.count(id) != 0;
    }

    std::size_t subscriberCount() const {return subscriptions_.size();}

    SequenceNumber tail() const {return lastSeq_;}

private:
    std::map<SubscriptionId, BroadcastSubscription> subscriptions_;
    DropHandler dropHandler_;
    SequenceNumber lastSeq_ = nullSequence();
    SubscriptionId lastSubscriptionId_ = nullSubscription();
};

} // namespace internal

} // namespace live

#endif // CPPLIVE_INTERNAL_TOPICBROADCASTER_HPP
