/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_INTERNAL_TOPICROOM_HPP
#define CPPLIVE_INTERNAL_TOPICROOM_HPP

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include "../asiodefs.hpp"
#include "../errorcodes.hpp"
#include "../event.hpp"
#include "../hublogger.hpp"
#include "../livedefs.hpp"
#include "../logging.hpp"
#include "../presence.hpp"
#include "../topicuri.hpp"
#include "presencetracker.hpp"
#include "topicbroadcaster.hpp"
#include "typingcoordinator.hpp"

namespace live
{

namespace internal
{

//------------------------------------------------------------------------------
// Subscriber attached to a TopicRoom.
//------------------------------------------------------------------------------
class RoomMember : public EventSubscriber
{
public:
    using Ptr = std::shared_ptr<RoomMember>;
    using WeakPtr = std::weak_ptr<RoomMember>;

    // Called from within the room's strand after the room discarded all of
    // its state. The member is expected to join again.
    virtual void onTopicRestart(std::error_code reason) = 0;
};

//------------------------------------------------------------------------------
struct RoomJoined
{
    PresenceMap presence;
    SubscriptionId subscription = nullSubscription();
    SequenceNumber tail = nullSequence();
};

//------------------------------------------------------------------------------
// Serialized owner of the presence, typing and broadcast state of one topic.
// Every operation is dispatched to the room's strand, and every completion
// handler is invoked from within that strand.
//------------------------------------------------------------------------------
class TopicRoom : public std::enable_shared_from_this<TopicRoom>
{
public:
    using Ptr = std::shared_ptr<TopicRoom>;
    using WeakPtr = std::weak_ptr<TopicRoom>;
    using Duration = TypingCoordinator::Duration;
    using JoinHandler = std::function<void (RoomJoined)>;
    using StatusHandler = std::function<void (std::error_code)>;

    static Ptr create(const AnyIoExecutor& exec, TopicUri uri,
                      Duration typingTimeout, HubLogger::Ptr logger)
    {
        return Ptr(new TopicRoom(exec, std::move(uri), typingTimeout,
                                 std::move(logger)));
    }

    const TopicUri& uri() const {return uri_;}

    const IoStrand& strand() const {return strand_;}

    std::size_t memberCount() const {return memberCount_.load();}

    // Tracks the member's presence meta, then subscribes it at the current
    // tail, then takes the presence snapshot, all in one step.
    void join(SessionKey key, Identity identity, PresenceMeta meta,
              RoomMember::WeakPtr member, JoinHandler handler)
    {
        struct Dispatched
        {
            Ptr self;
            SessionKey key;
            Identity identity;
            PresenceMeta meta;
            RoomMember::WeakPtr member;
            JoinHandler handler;

            void operator()()
            {
                auto& me = *self;
                me.guarded([this, &me]()
                {
                    me.joinMember(key, std::move(identity), std::move(meta),
                                  std::move(member), handler);
                });
            }
        };

        safelyDispatch<Dispatched>(key, std::move(identity), std::move(meta),
                                   std::move(member), std::move(handler));
    }

    // Idempotent.
    void leave(SessionKey key)
    {
        struct Dispatched
        {
            Ptr self;
            SessionKey key;

            void operator()()
            {
                auto& me = *self;
                auto k = key;
                me.guarded([&me, k]() {me.leaveMember(k);});
            }
        };

        safelyDispatch<Dispatched>(key);
    }

    void typingStart(SessionKey key)
    {
        struct Dispatched
        {
            Ptr self;
            SessionKey key;

            void operator()()
            {
                auto& me = *self;
                auto k = key;
                me.guarded([&me, k]() {me.startTyping(k);});
            }
        };

        safelyDispatch<Dispatched>(key);
    }

    void typingStop(SessionKey key)
    {
        struct Dispatched
        {
            Ptr self;
            SessionKey key;

            void operator()()
            {
                auto& me = *self;
                auto k = key;
                me.guarded([&me, k]() {me.stopTyping(k);});
            }
        };

        safelyDispatch<Dispatched>(key);
    }

    void updateStatus(SessionKey key, PresenceStatus status,
                      StatusHandler handler)
    {
        struct Dispatched
        {
            Ptr self;
            SessionKey key;
            PresenceStatus status;
            StatusHandler handler;

            void operator()()
            {
                auto& me = *self;
                bool ok = me.guarded([this, &me]()
                {
                    me.changeStatus(key, status, handler);
                });
                if (!ok && handler)
                    handler(make_error_code(LiveErrc::internalFault));
            }
        };

        safelyDispatch<Dispatched>(key, status, std::move(handler));
    }

    void publish(Event event)
    {
        struct Dispatched
        {
            Ptr self;
            Event event;

            void operator()()
            {
                auto& me = *self;
                me.guarded([this, &me]()
                {
                    me.broadcaster_.publish(std::move(event));
                });
            }
        };

        safelyDispatch<Dispatched>(std::move(event));
    }

    // Discards all presence and typing state, drops every subscription,
    // and asks every attached member to join again.
    void reset(std::error_code reason)
    {
        struct Dispatched
        {
            Ptr self;
            std::error_code reason;
            void operator()() {self->resetRoom(reason);}
        };

        safelyDispatch<Dispatched>(reason);
    }

private:
    struct Member
    {
        Identity identity;
        DeviceId deviceId;
        RoomMember::WeakPtr member;
        SubscriptionId subscription = nullSubscription();
        bool ownsTyping = false;
    };

    using MemberMap = std::map<SessionKey, Member>;

    TopicRoom(const AnyIoExecutor& exec, TopicUri&& uri,
              Duration typingTimeout, HubLogger::Ptr&& logger)
        : strand_(boost::asio::make_strand(exec)),
          uri_(std::move(uri)),
          logSuffix_(" (Topic " + uri_.str() + ")"),
          logger_(std::move(logger)),
          presence_(broadcaster_),
          typing_(strand_, broadcaster_, typingTimeout)
    {
        broadcaster_.onDrop(
            [this](SubscriptionId id) {onSubscriptionDropped(id);});
    }

    void joinMember(SessionKey key, Identity&& identity, PresenceMeta&& meta,
                    RoomMember::WeakPtr&& member, const JoinHandler& handler)
    {
        auto found = members_.find(key);
        if (found != members_.end())
            broadcaster_.unsubscribe(found->second.subscription);

        // Registered before tracking, so that a fault while announcing the
        // member still asks it to rejoin.
        auto& m = members_[key];
        m = Member{};
        m.identity = identity;
        m.deviceId = meta.deviceId;
        m.member = member;
        memberCount_.store(members_.size());

        presence_.track(identity, std::move(meta));
        auto subscription = broadcaster_.subscribeAtTail(std::move(member));
        m.subscription = subscription;

        RoomJoined joined;
        joined.presence = presence_.snapshot();
        joined.subscription = subscription;
        joined.tail = broadcaster_.tail();

        log({LogLevel::debug, "Session " + std::to_string(key) + " (" +
                              identity + ") joined"});
        handler(std::move(joined));
    }

    void leaveMember(SessionKey key)
    {
        auto found = members_.find(key);
        if (found == members_.end())
            return;

        // Copied because the member must be erased last.
        const Member m = found->second;
        if (m.ownsTyping)
            typing_.stop(m.identity);
        if (!deviceHeldByOther(key, m.identity, m.deviceId))
            presence_.untrack(m.identity, m.deviceId);
        broadcaster_.unsubscribe(m.subscription);
        members_.erase(key);
        memberCount_.store(members_.size());

        log({LogLevel::debug, "Session " + std::to_string(key) + " (" +
                              m.identity + ") left"});
    }

    void startTyping(SessionKey key)
    {
        auto found = members_.find(key);
        if (found == members_.end())
            return;

        const auto& identity = found->second.identity;
        for (auto& kv: members_)
        {
            if (kv.second.identity == identity)
                kv.second.ownsTyping = false;
        }
        found->second.ownsTyping = true;
        typing_.start(identity);
    }

    void stopTyping(SessionKey key)
    {
        auto found = members_.find(key);
        if (found == members_.end())
            return;

        const auto& identity = found->second.identity;
        for (auto& kv: members_)
        {
            if (kv.second.identity == identity)
                kv.second.ownsTyping = false;
        }
        typing_.stop(identity);
    }

    void changeStatus(SessionKey key, PresenceStatus status,
                      const StatusHandler& handler)
    {
        std::error_code ec = make_error_code(LiveErrc::notJoined);
        auto found = members_.find(key);
        if (found != members_.end())
        {
            const auto& m = found->second;
            auto diff = presence_.updateStatus(m.identity, m.deviceId, status);
            ec = diff ? std::error_code{} : diff.error();
        }
        if (handler)
            handler(ec);
    }

    bool deviceHeldByOther(SessionKey key, const Identity& identity,
                           const DeviceId& deviceId) const
    {
        return std::any_of(
            members_.begin(), members_.end(),
            [&](const MemberMap::value_type& kv)
            {
                return kv.first != key && kv.second.identity == identity &&
                       kv.second.deviceId == deviceId;
            });
    }

    void onSubscriptionDropped(SubscriptionId id)
    {
        auto found = std::find_if(
            members_.begin(), members_.end(),
            [id](const MemberMap::value_type& kv)
                {return kv.second.subscription == id;});
        if (found == members_.end())
            return;

        found->second.subscription = nullSubscription();

        // A member refusing an event terminates itself and leaves on its
        // own. A vanished member must be removed here, outside of the
        // ongoing publish.
        if (found->second.member.expired())
        {
            boost::asio::post(strand_,
                              Dropped{shared_from_this(), found->first});
        }
    }

    struct Dropped
    {
        Ptr self;
        SessionKey key;

        void operator()()
        {
            auto& me = *self;
            auto k = key;
            me.guarded([&me, k]() {me.leaveMember(k);});
        }
    };

    void resetRoom(std::error_code reason)
    {
        MemberMap members;
        members.swap(members_);
        memberCount_.store(0);
        typing_.reset();
        presence_.reset();
        broadcaster_.clear();

        log({LogLevel::warning,
             "Topic state discarded; " + std::to_string(members.size()) +
                " session(s) must rejoin", reason});

        for (auto& kv: members)
        {
            auto member = kv.second.member.lock();
            if (member)
                member->onTopicRestart(reason);
        }
    }

    // Returns false if the action faulted and the room was reset.
    template <typename F>
    bool guarded(F&& action)
    {
        try
        {
            action();
            return true;
        }
        catch (const std::exception& e)
        {
            log({LogLevel::critical,
                 std::string("Fault in topic owner: ") + e.what()});
            resetRoom(make_error_code(LiveErrc::topicRestarted));
        }
        return false;
    }

    void log(LogEntry&& e)
    {
        e.append(logSuffix_);
        logger_->log(std::move(e));
    }

    template <typename F, typename... Ts>
    void safelyDispatch(Ts&&... args)
    {
        boost::asio::dispatch(
            strand_, F{shared_from_this(), std::forward<Ts>(args)...});
    }

    IoStrand strand_;
    TopicUri uri_;
    std::string logSuffix_;
    HubLogger::Ptr logger_;
    MemberMap members_;
    std::atomic<std::size_t> memberCount_{0};
    TopicBroadcaster broadcaster_;
    PresenceTracker presence_;
    TypingCoordinator typing_;
};

} // namespace internal

} // namespace live

#endif // CPPLIVE_INTERNAL_TOPICROOM_HPP
