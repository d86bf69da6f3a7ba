/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_INTERNAL_CONNECTIONIMPL_HPP
#define CPPLIVE_INTERNAL_CONNECTIONIMPL_HPP

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include "../asiodefs.hpp"
#include "../errorcodes.hpp"
#include "../livedefs.hpp"
#include "../logging.hpp"
#include "../topicuri.hpp"
#include "../transport.hpp"
#include "../wire.hpp"
#include "hubimpl.hpp"
#include "session.hpp"

namespace live
{

namespace internal
{

//------------------------------------------------------------------------------
// Supervises the sessions of one client connection, one per topic, and
// routes decoded client frames to them.
//------------------------------------------------------------------------------
class ConnectionImpl : public std::enable_shared_from_this<ConnectionImpl>
{
public:
    using Ptr = std::shared_ptr<ConnectionImpl>;
    using WeakPtr = std::weak_ptr<ConnectionImpl>;

    static Ptr create(HubImpl::Ptr hub, Transport::Ptr transport,
                      ClientInfo info)
    {
        if (info.deviceId.empty())
            info.deviceId = hub->generateDeviceId();
        return Ptr(new ConnectionImpl(std::move(hub), std::move(transport),
                                      std::move(info)));
    }

    const ClientInfo& info() const {return info_;}

    bool isOpen() const {return isOpen_.load();}

    std::size_t sessionCount() const {return sessionCount_.load();}

    void receive(std::string frame)
    {
        struct Dispatched
        {
            Ptr self;
            std::string frame;
            void operator()() {self->onFrame(frame);}
        };

        safelyDispatch<Dispatched>(std::move(frame));
    }

    void disconnect(std::error_code reason)
    {
        struct Dispatched
        {
            Ptr self;
            std::error_code reason;
            void operator()() {self->closeSessions(reason);}
        };

        safelyDispatch<Dispatched>(reason);
    }

    void close()
    {
        struct Dispatched
        {
            Ptr self;

            void operator()()
            {
                self->closeSessions(make_error_code(LiveErrc::sessionClosed));
                self->transport_->close();
            }
        };

        safelyDispatch<Dispatched>();
    }

private:
    using SessionMap = std::map<std::string, Session::Ptr>;

    ConnectionImpl(HubImpl::Ptr&& hub, Transport::Ptr&& transport,
                   ClientInfo&& info)
        : hub_(std::move(hub)),
          transport_(std::move(transport)),
          info_(std::move(info)),
          strand_(boost::asio::make_strand(hub_->executor())),
          logSuffix_(" [Connection " + info_.identity + "/" +
                     info_.deviceId + "]"),
          sessionCount_(0),
          isOpen_(true)
    {}

    void onFrame(const std::string& frame)
    {
        if (!isOpen_.load())
            return;

        auto cmd = decodeClientFrame(frame);
        if (!cmd.ok())
        {
            log({LogLevel::debug, "Rejected malformed frame", cmd.error});
            return sendError(cmd.topic, cmd.opName, cmd.error, cmd.clientRef);
        }

        if (cmd.op == ClientOp::join)
            return joinTopic(cmd);

        auto session = route(cmd.topic);
        if (!session || !accepts(*session, cmd.op))
        {
            return sendError(cmd.topic, cmd.opName,
                             make_error_code(LiveErrc::notJoined),
                             cmd.clientRef);
        }
        session->command(std::move(cmd));
    }

    void joinTopic(const ClientCommand& cmd)
    {
        auto key = canonicalTopicName(cmd.topic);
        auto found = sessions_.find(key);
        if (found != sessions_.end())
        {
            auto state = found->second->state();
            if (state == SessionState::connecting)
                return found->second->join(cmd.clientRef);
            if (state != SessionState::terminated)
            {
                return sendError(cmd.topic, cmd.opName,
                                 make_error_code(LiveErrc::alreadyJoined),
                                 cmd.clientRef);
            }
            sessions_.erase(found);
        }

        auto session = spawnSession(key);
        session->join(cmd.clientRef);
    }

    Session::Ptr spawnSession(const std::string& topicName)
    {
        WeakPtr weak = shared_from_this();
        auto session = Session::create(
            hub_, transport_, info_, topicName,
            [weak, topicName](SessionKey key, std::error_code reason)
            {
                auto self = weak.lock();
                if (!self)
                    return;
                boost::asio::post(
                    self->strand_,
                    SessionEnded{self, topicName, key, reason});
            });
        sessions_[topicName] = session;
        sessionCount_.store(sessions_.size());
        return session;
    }

    struct SessionEnded
    {
        Ptr self;
        std::string topicName;
        SessionKey key;
        std::error_code reason;

        void operator()() {self->onSessionEnded(topicName, key, reason);}
    };

    void onSessionEnded(const std::string& topicName, SessionKey key,
                        std::error_code reason)
    {
        auto found = sessions_.find(topicName);
        if (found == sessions_.end() || found->second->key() != key)
            return;

        // A faulted session is replaced by a fresh one awaiting a new join.
        if (isOpen_.load() &&
            reason == make_error_code(LiveErrc::internalFault))
        {
            log({LogLevel::warning, "Restarting session for topic '" +
                                    topicName + "'", reason});
            sessions_.erase(found);
            spawnSession(topicName);
            return;
        }

        sessions_.erase(found);
        sessionCount_.store(sessions_.size());
    }

    Session::Ptr route(const std::string& topic) const
    {
        if (topic.empty())
        {
            if (sessions_.size() != 1)
                return nullptr;
            return sessions_.begin()->second;
        }

        auto found = sessions_.find(canonicalTopicName(topic));
        if (found == sessions_.end())
            return nullptr;
        return found->second;
    }

    // A session may be left while it is still joining.
    static bool accepts(const Session& session, ClientOp op)
    {
        auto state = session.state();
        if (op == ClientOp::leave)
            return state == SessionState::joining ||
                   state == SessionState::joined;
        return state == SessionState::joined;
    }

    void closeSessions(std::error_code reason)
    {
        if (!isOpen_.exchange(false))
            return;

        SessionMap sessions;
        sessions.swap(sessions_);
        sessionCount_.store(0);
        for (auto& kv: sessions)
            kv.second->terminate(reason);
        log({LogLevel::debug, "Disconnected", reason});
    }

    void sendError(const std::string& topic, const std::string& op,
                   std::error_code ec, const std::string& clientRef)
    {
        WeakPtr weak = shared_from_this();
        transport_->send(
            encodeErrorFrame(topic, op, ec, clientRef),
            [weak](std::error_code sendEc)
            {
                auto self = weak.lock();
                if (self && sendEc)
                {
                    self->log({LogLevel::debug, "Could not send error frame",
                               sendEc});
                }
            });
    }

    static std::string canonicalTopicName(const std::string& name)
    {
        auto uri = TopicUri::parse(name);
        return uri ? uri->str() : name;
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
    ClientInfo info_;
    IoStrand strand_;
    std::string logSuffix_;
    SessionMap sessions_;
    std::atomic<std::size_t> sessionCount_;
    std::atomic<bool> isOpen_;
};

} // namespace internal

} // namespace live

#endif // CPPLIVE_INTERNAL_CONNECTIONIMPL_HPP
