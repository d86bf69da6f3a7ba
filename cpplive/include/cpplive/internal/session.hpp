/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_INTERNAL_SESSION_HPP
#define CPPLIVE_INTERNAL_SESSION_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include "../asiodefs.hpp"
#include "../errorcodes.hpp"
#include "../erroror.hpp"
#include "../event.hpp"
#include "../livedefs.hpp"
#include "../logging.hpp"
#include "../messagestore.hpp"
#include "../presence.hpp"
#include "../topicuri.hpp"
#include "../transport.hpp"
#include "../wire.hpp"
#include "hubimpl.hpp"
#include "topicroom.hpp"

namespace live
{

namespace internal
{

//------------------------------------------------------------------------------
// Relay between one client connection and one topic.
// Commands are processed in the session's own strand. Broadcast events are
// accepted from the room's strand into a bounded queue of pending frames,
// which also holds the session's own replies. Overflow terminates the
// session with LiveErrc::backpressure.
//------------------------------------------------------------------------------
class Session : public RoomMember, public std::enable_shared_from_this<Session>
{
public:
    using Ptr = std::shared_ptr<Session>;
    using WeakPtr = std::weak_ptr<Session>;
    using TerminationHandler = std::function<void (SessionKey,
                                                   std::error_code)>;

    static Ptr create(HubImpl::Ptr hub, Transport::Ptr transport,
                      ClientInfo client, std::string topicName,
                      TerminationHandler handler)
    {
        return Ptr(new Session(std::move(hub), std::move(transport),
                               std::move(client), std::move(topicName),
                               std::move(handler)));
    }

    SessionKey key() const {return key_;}

    SessionState state() const {return state_.load();}

    const std::string& topicName() const {return topicName_;}

    const ClientInfo& client() const {return client_;}

    void join(std::string clientRef)
    {
        struct Dispatched
        {
            Ptr self;
            std::string clientRef;

            void operator()()
            {
                auto& me = *self;
                const auto& ref = clientRef;
                me.guarded(clientOpLabel(ClientOp::join), ref,
                           [&me, &ref]() {me.startJoin(ref);});
            }
        };

        safelyDispatch<Dispatched>(std::move(clientRef));
    }

    void command(ClientCommand cmd)
    {
        struct Dispatched
        {
            Ptr self;
            ClientCommand cmd;

            void operator()()
            {
                auto& me = *self;
                const auto& c = cmd;
                me.guarded(c.opName, c.clientRef,
                           [&me, &c]() {me.handleCommand(c);});
            }
        };

        safelyDispatch<Dispatched>(std::move(cmd));
    }

    void terminate(std::error_code reason)
    {
        safelyDispatch<Terminated>(reason);
    }

    bool deliver(const EventPtr& event) override
    {
        if (terminated_.load())
            return true;

        if (event->isTyping() && event->originator() == client_.identity)
            return true;

        if (pending_.load() >= limit_)
        {
            boost::asio::post(
                strand_,
                Terminated{shared_from_this(),
                           make_error_code(LiveErrc::backpressure)});
            return false;
        }

        ++pending_;
        boost::asio::post(strand_, Delivered{shared_from_this(), event});
        return true;
    }

    void onTopicRestart(std::error_code reason) override
    {
        struct Restarted
        {
            Ptr self;
            std::error_code reason;

            void operator()()
            {
                auto& me = *self;
                auto ec = reason;
                me.guarded(clientOpLabel(ClientOp::join), me.joinRef_,
                           [&me, ec]() {me.rejoin(ec);});
            }
        };

        boost::asio::post(strand_, Restarted{shared_from_this(), reason});
    }

private:
    struct Outbound
    {
        std::string frame;
        bool counted;
    };

    template <typename T>
    using StoreInvoker =
        std::function<void (MessageStore&, std::function<void (ErrorOr<T>)>)>;

    // A MessageStore request racing against its timeout. Only accessed
    // from within the session's strand.
    template <typename T>
    struct StoreCall
    {
        using Handler = std::function<void (ErrorOr<T>, bool late)>;

        StoreCall(const IoStrand& strand, Handler h)
            : timer(strand),
              handler(std::move(h))
        {}

        SteadyTimer timer;
        Handler handler;
        bool done = false;
    };

    template <typename T>
    struct StoreCompleted
    {
        std::shared_ptr<StoreCall<T>> call;
        ErrorOr<T> result;

        void operator()()
        {
            bool late = call->done;
            call->done = true;
            if (!late)
                call->timer.cancel();
            call->handler(std::move(result), late);
        }
    };

    struct Terminated
    {
        Ptr self;
        std::error_code reason;
        void operator()() {self->doTerminate(reason);}
    };

    struct Delivered
    {
        Ptr self;
        EventPtr event;

        void operator()()
        {
            auto& me = *self;
            const auto& ev = event;
            me.guarded(clientOpLabel(ClientOp::join), me.joinRef_,
                       [&me, &ev]() {me.onEvent(ev);});
        }
    };

    struct Sent
    {
        Ptr self;

        void operator()(std::error_code ec)
        {
            auto me = self;
            boost::asio::post(me->strand_,
                              [me, ec]() {me->onSent(ec);});
        }
    };

    struct LocalError
    {
        Ptr self;
        std::string op;
        std::error_code ec;
        std::string clientRef;
        void operator()() {self->pushError(op, ec, clientRef);}
    };

    Session(HubImpl::Ptr&& hub, Transport::Ptr&& transport,
            ClientInfo&& client, std::string&& topicName,
            TerminationHandler&& handler)
        : hub_(std::move(hub)),
          transport_(std::move(transport)),
          client_(std::move(client)),
          topicName_(std::move(topicName)),
          terminationHandler_(std::move(handler)),
          strand_(boost::asio::make_strand(hub_->executor())),
          logSuffix_(" [Session " + client_.identity + "/" +
                     client_.deviceId + "@" + topicName_ + "]"),
          limit_(hub_->options().outboundQueueLimit()),
          key_(hub_->nextSessionKey()),
          state_(SessionState::connecting),
          terminated_(false),
          pending_(0)
    {}

    void startJoin(const std::string& clientRef)
    {
        if (state_.load() != SessionState::connecting)
        {
            pushError(clientOpLabel(ClientOp::join), LiveErrc::alreadyJoined,
                      clientRef);
            return;
        }

        state_.store(SessionState::joining);
        joinRef_ = clientRef;

        auto uri = TopicUri::parse(topicName_);
        if (!uri)
            return rejectJoin(uri.error());
        topic_ = *uri;
        attach();
    }

    void attach()
    {
        auto auth = hub_->gate().authorize(client_.identity, topic_);
        if (!auth)
            return rejectJoin(auth.error());

        if (!room_)
            room_ = hub_->acquireRoom(topic_);

        discardHeldBack();
        awaitingBacklog_ = true;
        auto gen = ++joinGen_;

        Ptr self = shared_from_this();
        PresenceMeta meta{client_.deviceId, status_,
                          std::chrono::system_clock::now()};
        room_->join(
            key_, client_.identity, std::move(meta), self,
            [self, gen](RoomJoined joined)
            {
                auto me = self;
                auto g = gen;
                auto j = std::make_shared<RoomJoined>(std::move(joined));
                boost::asio::post(me->strand_, [me, g, j]()
                {
                    me->guarded(clientOpLabel(ClientOp::join), me->joinRef_,
                                [&me, g, &j]() {me->onRoomJoined(g, *j);});
                });
            });
    }

    void onRoomJoined(uint64_t gen, RoomJoined& joined)
    {
        if (terminated_.load() || gen != joinGen_)
            return;

        snapshot_ = std::move(joined.presence);
        auto topic = topic_;
        auto limit = hub_->options().recentMessageLimit();
        Ptr self = shared_from_this();

        callStore<MessageList>(
            [topic, limit](MessageStore& store, MessageStore::ListHandler h)
            {
                store.listRecent(topic, limit, std::move(h));
            },
            [self, gen](ErrorOr<MessageList> recent, bool late)
            {
                if (late)
                    return;
                self->guarded(
                    clientOpLabel(ClientOp::join), self->joinRef_,
                    [&self, gen, &recent]() {self->onBacklog(gen, recent);});
            });
    }

    void onBacklog(uint64_t gen, ErrorOr<MessageList>& recent)
    {
        if (terminated_.load() || gen != joinGen_)
            return;

        MessageList messages;
        if (recent)
            messages = std::move(*recent);
        else
            log({LogLevel::warning, "Could not load recent messages",
                 recent.error()});

        state_.store(SessionState::joined);
        awaitingBacklog_ = false;
        enqueue(encodeJoinedFrame(topic_, snapshot_, messages));
        snapshot_.clear();
        if (terminated_.load())
            return;

        // Messages created while the backlog was being fetched may already
        // be part of it.
        std::set<MessageId> loaded;
        for (const auto& m: messages)
            loaded.insert(m.id);

        std::vector<EventPtr> held;
        held.swap(heldBack_);
        for (const auto& event: held)
        {
            if (event->kind() == EventKind::messageCreated &&
                loaded.count(event->message().id) != 0)
            {
                --pending_;
                continue;
            }
            enqueueEvent(*event);
        }

        log({LogLevel::debug, "Joined"});
    }

    void rejectJoin(std::error_code ec)
    {
        pushError(clientOpLabel(ClientOp::join), ec, joinRef_);
        doTerminate(ec);
    }

    void rejoin(std::error_code reason)
    {
        if (terminated_.load())
            return;
        log({LogLevel::info, "Rejoining after topic restart", reason});
        state_.store(SessionState::joining);
        attach();
    }

    void handleCommand(const ClientCommand& cmd)
    {
        if (cmd.op == ClientOp::join)
            return pushError(cmd, LiveErrc::alreadyJoined);
        if (cmd.op == ClientOp::leave)
            return doTerminate(make_error_code(LiveErrc::sessionClosed));
        if (state_.load() != SessionState::joined)
            return pushError(cmd, LiveErrc::notJoined);

        const auto& identity = client_.identity;
        const auto& topic = topic_;

        switch (cmd.op)
        {
        case ClientOp::sendMessage:
            if (cmd.threadId.empty())
            {
                relayToStore(cmd, [identity, topic, cmd](
                    MessageStore& s, MessageStore::EventHandler h)
                {
                    s.createMessage(identity, topic, cmd.content,
                                    cmd.attachments, std::move(h));
                });
            }
            else
            {
                relayToStore(cmd, [identity, topic, cmd](
                    MessageStore& s, MessageStore::EventHandler h)
                {
                    s.createThreadReply(identity, topic, cmd.threadId,
                                        cmd.content, cmd.attachments,
                                        std::move(h));
                });
            }
            break;

        case ClientOp::startThread:
            relayToStore(cmd, [identity, topic, cmd](
                MessageStore& s, MessageStore::EventHandler h)
            {
                s.createThreadReply(identity, topic, cmd.messageId,
                                    cmd.content, cmd.attachments,
                                    std::move(h));
            });
            break;

        case ClientOp::editMessage:
            relayToStore(cmd, [identity, topic, cmd](
                MessageStore& s, MessageStore::EventHandler h)
            {
                s.editMessage(identity, topic, cmd.messageId, cmd.content,
                              std::move(h));
            });
            break;

        case ClientOp::deleteMessage:
            relayToStore(cmd, [identity, topic, cmd](
                MessageStore& s, MessageStore::EventHandler h)
            {
                s.deleteMessage(identity, topic, cmd.messageId, std::move(h));
            });
            break;

        case ClientOp::addReaction:
            relayToStore(cmd, [identity, topic, cmd](
                MessageStore& s, MessageStore::EventHandler h)
            {
                s.addReaction(identity, topic, cmd.messageId, cmd.emoji,
                              std::move(h));
            });
            break;

        case ClientOp::removeReaction:
            relayToStore(cmd, [identity, topic, cmd](
                MessageStore& s, MessageStore::EventHandler h)
            {
                s.removeReaction(identity, topic, cmd.messageId, cmd.emoji,
                                 std::move(h));
            });
            break;

        case ClientOp::markRead:
            relayToStore(cmd, [identity, topic, cmd](
                MessageStore& s, MessageStore::EventHandler h)
            {
                s.markRead(identity, topic, cmd.messageId, std::move(h));
            });
            break;

        case ClientOp::typingStart:
            room_->typingStart(key_);
            break;

        case ClientOp::typingStop:
            room_->typingStop(key_);
            break;

        case ClientOp::updateStatus:
            changeStatus(cmd);
            break;

        case ClientOp::loadOlderMessages:
            loadOlderMessages(cmd);
            break;

        default:
            pushError(cmd, LiveErrc::invalid);
            break;
        }
    }

    // Successful outcomes reach this session, like every other, through
    // the room's broadcast. Failures are reported to this connection only.
    void relayToStore(const ClientCommand& cmd, StoreInvoker<Event> invoke)
    {
        Ptr self = shared_from_this();
        std::string op = cmd.opName;
        std::string ref = cmd.clientRef;

        callStore<Event>(
            invoke,
            [self, op, ref](ErrorOr<Event> result, bool late)
            {
                if (result)
                    self->publishOutcome(std::move(*result));
                else if (!late)
                    self->pushError(op, result.error(), ref);
            });
    }

    // The room that was joined may have been closed and replaced since the
    // store request was made.
    void publishOutcome(Event&& event)
    {
        auto room = hub_->findRoom(topic_);
        if (room)
            room->publish(std::move(event));
        else
            log({LogLevel::debug, "Discarded store outcome for closed topic"});
    }

    void changeStatus(const ClientCommand& cmd)
    {
        status_ = cmd.status;
        Ptr self = shared_from_this();
        std::string op = cmd.opName;
        std::string ref = cmd.clientRef;

        room_->updateStatus(
            key_, cmd.status,
            [self, op, ref](std::error_code ec)
            {
                if (ec)
                {
                    boost::asio::post(self->strand_,
                                      LocalError{self, op, ec, ref});
                }
            });
    }

    void loadOlderMessages(const ClientCommand& cmd)
    {
        Ptr self = shared_from_this();
        auto topic = topic_;
        auto beforeId = cmd.messageId;
        auto limit = hub_->options().olderMessageLimit();
        std::string op = cmd.opName;
        std::string ref = cmd.clientRef;

        callStore<MessageList>(
            [topic, beforeId, limit](MessageStore& s,
                                     MessageStore::ListHandler h)
            {
                s.listBefore(topic, beforeId, limit, std::move(h));
            },
            [self, op, ref](ErrorOr<MessageList> older, bool late)
            {
                if (late)
                    return;
                self->guarded(op, ref, [&self, &op, &ref, &older]()
                {
                    if (!older)
                        return self->pushError(op, older.error(), ref);
                    if (!self->terminated_.load())
                    {
                        self->enqueue(encodeOlderMessagesFrame(self->topic_,
                                                               *older));
                    }
                });
            });
    }

    template <typename T>
    void callStore(const StoreInvoker<T>& invoke,
                   typename StoreCall<T>::Handler handler)
    {
        using Call = StoreCall<T>;
        auto call = std::make_shared<Call>(strand_, std::move(handler));

        call->timer.expires_after(hub_->options().storeTimeout());
        call->timer.async_wait(
            [call](boost::system::error_code ec)
            {
                if (ec == boost::asio::error::operation_aborted || call->done)
                    return;
                call->done = true;
                call->handler(makeUnexpectedError(LiveErrc::storeTimeout),
                              false);
            });

        auto strand = strand_;
        try
        {
            invoke(*hub_->store(),
                   [strand, call](ErrorOr<T> result)
                   {
                       boost::asio::post(
                           strand, StoreCompleted<T>{call, std::move(result)});
                   });
        }
        catch (const std::exception&)
        {
            call->done = true;
            call->timer.cancel();
            throw;
        }
    }

    void onEvent(const EventPtr& event)
    {
        if (terminated_.load())
            return;
        if (awaitingBacklog_)
            return heldBack_.push_back(event);
        enqueueEvent(*event);
    }

    void discardHeldBack()
    {
        pending_.fetch_sub(heldBack_.size());
        heldBack_.clear();
    }

    void pushError(const ClientCommand& cmd, LiveErrc errc)
    {
        pushError(cmd.opName, make_error_code(errc), cmd.clientRef);
    }

    void pushError(const std::string& op, LiveErrc errc,
                   const std::string& clientRef)
    {
        pushError(op, make_error_code(errc), clientRef);
    }

    void pushError(const std::string& op, std::error_code ec,
                   const std::string& clientRef)
    {
        if (terminated_.load())
            return;
        enqueue(encodeErrorFrame(topicName_, op, ec, clientRef));
    }

    // Locally generated frames count against the same limit as events.
    void enqueue(std::string frame)
    {
        if (pending_.load() >= limit_)
            return doTerminate(make_error_code(LiveErrc::backpressure));
        ++pending_;
        push(Outbound{std::move(frame), true});
    }

    // The event was already counted by deliver().
    void enqueueEvent(const Event& event)
    {
        push(Outbound{encodeEventFrame(topic_, event), true});
    }

    void push(Outbound&& item)
    {
        outbound_.push_back(std::move(item));
        pump();
    }

    void clearOutbound()
    {
        for (const auto& item: outbound_)
        {
            if (item.counted)
                --pending_;
        }
        outbound_.clear();
    }

    void pump()
    {
        if (sending_ || transportFailed_ || outbound_.empty())
            return;

        sending_ = true;
        Outbound item = std::move(outbound_.front());
        outbound_.pop_front();
        if (item.counted)
            --pending_;
        transport_->send(std::move(item.frame), Sent{shared_from_this()});
    }

    void onSent(std::error_code ec)
    {
        sending_ = false;
        if (ec)
        {
            transportFailed_ = true;
            clearOutbound();
            log({LogLevel::debug, "Transport send failed", ec});
            doTerminate(make_error_code(LiveErrc::disconnected));
            return;
        }
        pump();
    }

    // Runs the cleanup exactly once, whatever the cause.
    void doTerminate(std::error_code reason)
    {
        if (terminated_.exchange(true))
            return;

        state_.store(SessionState::terminated);
        ++joinGen_;
        discardHeldBack();
        awaitingBacklog_ = false;

        if (room_)
        {
            room_->leave(key_);
            hub_->releaseRoom(room_);
            room_.reset();
        }

        if (reason == make_error_code(LiveErrc::backpressure))
        {
            clearOutbound();
            push(Outbound{encodeErrorFrame(topicName_,
                                           clientOpLabel(ClientOp::join),
                                           reason),
                          false});
            log({LogLevel::warning, "Terminated due to a full outbound queue",
                 reason});
        }
        else
        {
            log({LogLevel::debug, "Terminated", reason});
        }

        TerminationHandler handler;
        handler.swap(terminationHandler_);
        if (handler)
            handler(key_, reason);
    }

    template <typename F>
    void guarded(const std::string& op, const std::string& clientRef,
                 F&& action)
    {
        try
        {
            action();
        }
        catch (const std::exception& e)
        {
            onFault(op, clientRef, e);
        }
    }

    void onFault(const std::string& op, const std::string& clientRef,
                 const std::exception& e)
    {
        log({LogLevel::critical,
             "Fault while handling '" + op + "': " + e.what()});
        pushError(op, LiveErrc::internalFault, clientRef);
        doTerminate(make_error_code(LiveErrc::internalFault));
    }

    void log(LogEntry&& e)
    {
        e.append(logSuffix_);
        hub_->log(std::move(e));
    }

    template <typename F, typename... Ts>
    void safelyDispatch(Ts&&... args)
    {
        boost::asio::dispatch(
            strand_, F{shared_from_this(), std::forward<Ts>(args)...});
    }

    HubImpl::Ptr hub_;
    Transport::Ptr transport_;
    ClientInfo client_;
    std::string topicName_;
    TerminationHandler terminationHandler_;
    IoStrand strand_;
    std::string logSuffix_;
    std::string joinRef_;
    TopicUri topic_;
    TopicRoom::Ptr room_;
    PresenceMap snapshot_;
    std::deque<Outbound> outbound_;
    std::vector<EventPtr> heldBack_;
    std::size_t limit_ = 0;
    uint64_t joinGen_ = 0;
    SessionKey key_ = 0;
    PresenceStatus status_ = PresenceStatus::online;
    std::atomic<SessionState> state_;
    std::atomic<bool> terminated_;
    std::atomic<std::size_t> pending_;
    bool sending_ = false;
    bool awaitingBacklog_ = false;
    bool transportFailed_ = false;
};

} // namespace internal

} // namespace live

#endif // CPPLIVE_INTERNAL_SESSION_HPP
