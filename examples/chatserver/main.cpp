/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

//******************************************************************************
// Chat server speaking newline-delimited JSON frames over TCP.
// Each client first sends a handshake line of the form `<identity> [device]`,
// then JSON client frames, one per line. For example:
//   alice phone
//   {"op":"join","topic":"channel:general"}
//   {"op":"send_message","topic":"channel:general","content":"hi"}
//******************************************************************************

#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <cpplive/hub.hpp>
#include <cpplive/collaborators/memorychanneldirectory.hpp>
#include <cpplive/collaborators/memorymessagestore.hpp>
#include <cpplive/utils/consolelogger.hpp>
#include "../common/argsparser.hpp"
#include "tcplinetransport.hpp"

//------------------------------------------------------------------------------
live::MemoryChannelDirectory::Ptr makeDemoDirectory()
{
    auto dir = live::MemoryChannelDirectory::create();
    dir->addWorkspace("demo")
        .addWorkspaceMember("demo", "alice")
        .addWorkspaceMember("demo", "bob")
        .addWorkspaceMember("demo", "carol", true)
        .addChannel("general", "demo")
        .addChannel("random", "demo")
        .addChannel("ops", "demo", live::ChannelVisibility::privateChannel)
        .addChannelMember("ops", "carol");
    return dir;
}

//------------------------------------------------------------------------------
class ChatServer : public std::enable_shared_from_this<ChatServer>
{
public:
    using Ptr = std::shared_ptr<ChatServer>;

    static Ptr create(live::IoContext& ioctx, live::Hub& hub,
                      uint_least16_t port)
    {
        return Ptr(new ChatServer(ioctx, hub, port));
    }

    void start()
    {
        hub_.log({live::LogLevel::info,
                  "Listening on port " +
                      std::to_string(acceptor_.local_endpoint().port())});
        accept();
    }

    live::AnyIoExecutor executor() {return acceptor_.get_executor();}

    void stop()
    {
        boost::system::error_code ec;
        acceptor_.close(ec);
        for (auto& kv: clients_)
            kv.second.connection.close();
        clients_.clear();
    }

private:
    using Tcp = boost::asio::ip::tcp;

    struct Client
    {
        TcpLineTransport::Ptr transport;
        live::Connection connection;
    };

    ChatServer(live::IoContext& ioctx, live::Hub& hub, uint_least16_t port)
        : ioctx_(ioctx),
          hub_(hub),
          acceptor_(boost::asio::make_strand(ioctx),
                    Tcp::endpoint{Tcp::v4(), port})
    {}

    void accept()
    {
        auto self = shared_from_this();
        acceptor_.async_accept(
            boost::asio::make_strand(ioctx_),
            [self](boost::system::error_code ec, Tcp::socket socket)
            {
                if (ec == boost::asio::error::operation_aborted)
                    return;
                if (ec)
                {
                    self->hub_.log({live::LogLevel::warning, "Accept failed",
                                    static_cast<std::error_code>(ec)});
                }
                else
                {
                    self->onAccepted(std::move(socket));
                }
                self->accept();
            });
    }

    void onAccepted(Tcp::socket&& socket)
    {
        auto id = ++nextClientId_;
        auto transport = TcpLineTransport::create(std::move(socket));
        hub_.log({live::LogLevel::info,
                  "Accepted client #" + std::to_string(id) + " from " +
                      transport->remoteAddress()});

        std::weak_ptr<ChatServer> weak = shared_from_this();
        transport->start(
            [weak, id](std::string line)
            {
                auto self = weak.lock();
                if (self)
                    self->relay(&ChatServer::onLine, id, std::move(line));
            },
            [weak, id](std::error_code ec)
            {
                auto self = weak.lock();
                if (self)
                    self->relay(&ChatServer::onEnded, id, ec);
            });
        clients_[id] = Client{std::move(transport), live::Connection{}};
    }

    template <typename A>
    void relay(void (ChatServer::*member)(uint64_t, A), uint64_t id, A arg)
    {
        auto self = shared_from_this();
        auto shared = std::make_shared<A>(std::move(arg));
        boost::asio::post(acceptor_.get_executor(),
                          [self, member, id, shared]()
                          {
                              ((*self).*member)(id, std::move(*shared));
                          });
    }

    void onLine(uint64_t id, std::string line)
    {
        auto found = clients_.find(id);
        if (found == clients_.end())
            return;

        auto& client = found->second;
        if (client.connection)
            return client.connection.receive(std::move(line));

        // The first line is the handshake.
        std::istringstream iss{line};
        live::ClientInfo info;
        iss >> info.identity >> info.deviceId;
        if (info.identity.empty())
        {
            client.transport->close();
            clients_.erase(found);
            return;
        }

        client.connection = hub_.connect(client.transport, std::move(info));
        hub_.log({live::LogLevel::info,
                  "Client #" + std::to_string(id) + " identified as " +
                      client.connection.info().identity + "/" +
                      client.connection.info().deviceId});
    }

    void onEnded(uint64_t id, std::error_code ec)
    {
        auto found = clients_.find(id);
        if (found == clients_.end())
            return;
        found->second.connection.disconnect();
        clients_.erase(found);
        hub_.log({live::LogLevel::info,
                  "Client #" + std::to_string(id) + " disconnected", ec});
    }

    live::IoContext& ioctx_;
    live::Hub& hub_;
    Tcp::acceptor acceptor_;
    std::map<uint64_t, Client> clients_;
    uint64_t nextClientId_ = 0;
};

//------------------------------------------------------------------------------
// Usage: cpplive-example-chatserver [port [typing_timeout_ms]] | help
//------------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    try
    {
        ArgsParser args{{{"port", "9100"},
                         {"typing_timeout_ms", "5000"}}};

        uint_least16_t port = 0;
        unsigned typingTimeoutMs = 0;
        if (!args.parse(argc, argv, port, typingTimeoutMs))
            return 0;

        auto loggerOptions =
            live::utils::ConsoleLoggerOptions{}.withOriginLabel("chatserver")
                                               .withColor();
        live::utils::ConsoleLogger logger{std::move(loggerOptions)};

        auto options =
            live::HubOptions(makeDemoDirectory(),
                             live::MemoryMessageStore::create())
                .withTypingTimeout(
                    std::chrono::milliseconds(typingTimeoutMs))
                .withLogHandler(logger)
                .withLogLevel(live::LogLevel::info);

        live::IoContext ioctx;
        live::Hub hub{ioctx, options};
        auto server = ChatServer::create(ioctx, hub, port);
        server->start();

        boost::asio::signal_set signals{ioctx, SIGINT, SIGTERM};
        signals.async_wait(
            [&hub, server](const boost::system::error_code& ec, int sig)
            {
                if (ec)
                    return;
                const char* sigName = (sig == SIGINT)  ? "SIGINT" :
                                      (sig == SIGTERM) ? "SIGTERM" : "unknown";
                hub.log({live::LogLevel::info,
                         std::string("Received ") + sigName + " signal"});
                boost::asio::post(server->executor(),
                                  [server]() {server->stop();});
            });

        ioctx.run();
        logger({live::LogLevel::info, "Chat server exit"});
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unhandled exception: " << e.what() << ", terminating."
                  << std::endl;
        return 1;
    }

    return 0;
}
