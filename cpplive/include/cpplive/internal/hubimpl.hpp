/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_INTERNAL_HUBIMPL_HPP
#define CPPLIVE_INTERNAL_HUBIMPL_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include "../asiodefs.hpp"
#include "../authorizationgate.hpp"
#include "../errorcodes.hpp"
#include "../hublogger.hpp"
#include "../huboptions.hpp"
#include "../livedefs.hpp"
#include "../logging.hpp"
#include "../messagestore.hpp"
#include "../topicuri.hpp"
#include "topicroom.hpp"

namespace live
{

namespace internal
{

//------------------------------------------------------------------------------
// Process-wide registry of topic rooms. Rooms are created by the first
// session attaching to a topic and forgotten when the last one detaches.
//------------------------------------------------------------------------------
class HubImpl : public std::enable_shared_from_this<HubImpl>
{
public:
    using Ptr = std::shared_ptr<HubImpl>;
    using Executor = AnyIoExecutor;

    static Ptr create(Executor exec, HubOptions options)
    {
        return Ptr(new HubImpl(std::move(exec), std::move(options)));
    }

    const Executor& executor() const {return executor_;}

    const HubOptions& options() const {return options_;}

    const AuthorizationGate& gate() const {return gate_;}

    const MessageStore::Ptr& store() const {return options_.store();}

    HubLogger::Ptr logger() const {return logger_;}

    TopicRoom::Ptr acquireRoom(const TopicUri& uri)
    {
        TopicRoom::Ptr room;
        bool created = false;

        {
            const MutexGuard guard(roomsMutex_);
            auto& record = rooms_[uri];
            if (!record.room)
            {
                record.room = TopicRoom::create(
                    executor_, uri, options_.typingTimeout(), logger_);
                created = true;
            }
            ++record.attachedCount;
            room = record.room;
        }

        if (created)
            inform("Opened topic '" + uri.str() + "'");
        return room;
    }

    void releaseRoom(const TopicRoom::Ptr& room)
    {
        bool erased = false;

        {
            const MutexGuard guard(roomsMutex_);
            auto found = rooms_.find(room->uri());
            if (found == rooms_.end() || found->second.room != room)
                return;
            auto& record = found->second;
            if (record.attachedCount > 0)
                --record.attachedCount;
            if (record.attachedCount == 0)
            {
                rooms_.erase(found);
                erased = true;
            }
        }

        if (erased)
            inform("Closed topic '" + room->uri().str() + "'");
    }

    // Returns the room currently open for the topic, if any.
    TopicRoom::Ptr findRoom(const TopicUri& uri) const
    {
        const MutexGuard guard(roomsMutex_);
        auto found = rooms_.find(uri);
        if (found == rooms_.end())
            return nullptr;
        return found->second.room;
    }

    bool resetTopic(const TopicUri& uri)
    {
        TopicRoom::Ptr room;

        {
            const MutexGuard guard(roomsMutex_);
            auto found = rooms_.find(uri);
            if (found != rooms_.end())
                room = found->second.room;
        }

        if (!room)
        {
            warn("Attempting to reset non-existent topic '" + uri.str() + "'");
            return false;
        }

        room->reset(make_error_code(LiveErrc::topicRestarted));
        return true;
    }

    std::size_t topicCount() const
    {
        const MutexGuard guard(roomsMutex_);
        return rooms_.size();
    }

    std::size_t sessionCount() const
    {
        const MutexGuard guard(roomsMutex_);
        std::size_t count = 0;
        for (const auto& kv: rooms_)
            count += kv.second.attachedCount;
        return count;
    }

    SessionKey nextSessionKey() {return ++nextSessionKey_;}

    DeviceId generateDeviceId()
    {
        return "conn-" + std::to_string(++nextConnectionIndex_);
    }

    LogLevel logLevel() const {return logger_->level();}

    void setLogLevel(LogLevel level) {logger_->setLevel(level);}

    void log(LogEntry entry) {logger_->log(std::move(entry));}

    HubImpl(const HubImpl&) = delete;
    HubImpl(HubImpl&&) = delete;
    HubImpl& operator=(const HubImpl&) = delete;
    HubImpl& operator=(HubImpl&&) = delete;

private:
    using MutexGuard = std::lock_guard<std::mutex>;

    struct RoomRecord
    {
        TopicRoom::Ptr room;
        std::size_t attachedCount = 0;
    };

    using RoomMap = std::map<TopicUri, RoomRecord>;

    HubImpl(Executor e, HubOptions o)
        : options_(std::move(o)),
          executor_(e),
          gate_(options_.directory()),
          logger_(std::make_shared<HubLogger>(
              std::move(e), options_.logHandler(), options_.logLevel())),
          nextSessionKey_(0),
          nextConnectionIndex_(0)
    {}

    void inform(std::string msg)
    {
        logger_->log({LogLevel::info, std::move(msg)});
    }

    void warn(std::string msg, std::error_code ec = {})
    {
        logger_->log({LogLevel::warning, std::move(msg), ec});
    }

    HubOptions options_;
    AnyIoExecutor executor_;
    AuthorizationGate gate_;
    HubLogger::Ptr logger_;
    RoomMap rooms_;
    mutable std::mutex roomsMutex_;
    std::atomic<SessionKey> nextSessionKey_;
    std::atomic<uint64_t> nextConnectionIndex_;
};

} // namespace internal

} // namespace live

#endif // CPPLIVE_INTERNAL_HUBIMPL_HPP
