/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_EXAMPLES_TCPLINETRANSPORT_HPP
#define CPPLIVE_EXAMPLES_TCPLINETRANSPORT_HPP

#include <deque>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <utility>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <cpplive/errorcodes.hpp>
#include <cpplive/transport.hpp>

//------------------------------------------------------------------------------
// Newline-delimited text frames over a TCP socket. The socket's executor
// must be a strand, as it serializes reads, writes and the transmit queue.
//------------------------------------------------------------------------------
class TcpLineTransport : public live::Transport,
                         public std::enable_shared_from_this<TcpLineTransport>
{
public:
    using Ptr = std::shared_ptr<TcpLineTransport>;
    using Socket = boost::asio::ip::tcp::socket;
    using LineHandler = std::function<void (std::string)>;
    using EndHandler = std::function<void (std::error_code)>;

    static Ptr create(Socket&& socket)
    {
        return Ptr(new TcpLineTransport(std::move(socket)));
    }

    std::string remoteAddress() const
    {
        boost::system::error_code ec;
        auto ep = socket_.remote_endpoint(ec);
        return ec ? std::string{"?"} : ep.address().to_string();
    }

    // The end handler is invoked once when reading stops for any reason.
    void start(LineHandler onLine, EndHandler onEnd)
    {
        lineHandler_ = std::move(onLine);
        endHandler_ = std::move(onEnd);
        auto self = shared_from_this();
        boost::asio::dispatch(socket_.get_executor(),
                              [self]() {self->receive();});
    }

    void send(std::string frame, SendHandler handler) override
    {
        struct Dispatched
        {
            Ptr self;
            std::string frame;
            SendHandler handler;

            void operator()()
            {
                frame += '\n';
                self->txQueue_.push_back({std::move(frame),
                                          std::move(handler)});
                self->transmit();
            }
        };

        boost::asio::dispatch(socket_.get_executor(),
                              Dispatched{shared_from_this(), std::move(frame),
                                         std::move(handler)});
    }

    void close() override
    {
        auto self = shared_from_this();
        boost::asio::dispatch(socket_.get_executor(),
                              [self]() {self->shutdown();});
    }

private:
    struct Pending
    {
        std::string bytes;
        SendHandler handler;
    };

    explicit TcpLineTransport(Socket&& socket) : socket_(std::move(socket)) {}

    void receive()
    {
        auto self = shared_from_this();
        boost::asio::async_read_until(
            socket_, rxBuffer_, '\n',
            [this, self](boost::system::error_code ec, std::size_t)
            {
                if (ec)
                    return end(live::make_error_code(
                        live::LiveErrc::disconnected));

                std::istream in(&rxBuffer_);
                std::string line;
                std::getline(in, line);
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                if (!line.empty() && lineHandler_)
                    lineHandler_(std::move(line));
                if (socket_.is_open())
                    receive();
            });
    }

    void transmit()
    {
        if (writing_ || txQueue_.empty())
            return;
        if (!socket_.is_open())
            return failQueued();

        writing_ = true;
        auto self = shared_from_this();
        boost::asio::async_write(
            socket_, boost::asio::buffer(txQueue_.front().bytes),
            [this, self](boost::system::error_code netEc, std::size_t)
            {
                writing_ = false;
                auto handler = std::move(txQueue_.front().handler);
                txQueue_.pop_front();
                std::error_code ec;
                if (netEc)
                    ec = live::make_error_code(live::LiveErrc::disconnected);
                if (handler)
                    handler(ec);
                if (ec)
                    return shutdown();
                transmit();
            });
    }

    void shutdown()
    {
        if (socket_.is_open())
        {
            boost::system::error_code ec;
            socket_.shutdown(Socket::shutdown_both, ec);
            socket_.close(ec);
        }
        if (!writing_)
            failQueued();
    }

    void failQueued()
    {
        std::deque<Pending> queue;
        queue.swap(txQueue_);
        for (auto& p: queue)
        {
            if (p.handler)
                p.handler(live::make_error_code(live::LiveErrc::disconnected));
        }
    }

    void end(std::error_code ec)
    {
        EndHandler handler;
        handler.swap(endHandler_);
        lineHandler_ = nullptr;
        if (handler)
            handler(ec);
    }

    Socket socket_;
    boost::asio::streambuf rxBuffer_;
    std::deque<Pending> txQueue_;
    LineHandler lineHandler_;
    EndHandler endHandler_;
    bool writing_ = false;
};

#endif // CPPLIVE_EXAMPLES_TCPLINETRANSPORT_HPP
