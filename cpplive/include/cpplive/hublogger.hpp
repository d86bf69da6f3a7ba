/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_HUBLOGGER_HPP
#define CPPLIVE_HUBLOGGER_HPP

#include <atomic>
#include <memory>
#include <utility>
#include <boost/asio/post.hpp>
#include "asiodefs.hpp"
#include "logging.hpp"

namespace live
{

namespace internal { class HubImpl; }

//------------------------------------------------------------------------------
/** Filters log entries by severity and posts them to the user's handler via
    the hub's executor, so that handlers never run inside a topic strand. */
//------------------------------------------------------------------------------
class HubLogger
{
public:
    using Ptr = std::shared_ptr<HubLogger>;

    HubLogger(AnyIoExecutor e, LogHandler lh, LogLevel lv)
        : executor_(std::move(e)),
          handler_(std::move(lh)),
          level_(lv)
    {}

    LogLevel level() const {return level_.load();}

    void log(LogEntry entry)
    {
        if (handler_ && entry.severity() >= level())
            boost::asio::post(executor_, Posted{handler_, std::move(entry)});
    }

private:
    struct Posted
    {
        LogHandler handler;
        LogEntry entry;
        void operator()() {handler(std::move(entry));}
    };

    void setLevel(LogLevel level) {level_.store(level);}

    AnyIoExecutor executor_;
    LogHandler handler_;
    std::atomic<LogLevel> level_;

    friend class internal::HubImpl;
};

} // namespace live

#endif // CPPLIVE_HUBLOGGER_HPP
