/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <chrono>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include <catch2/catch.hpp>
#include <cpplive/huboptions.hpp>
#include <cpplive/internal/connectionimpl.hpp>
#include <cpplive/internal/hubimpl.hpp>
#include <cpplive/internal/topicroom.hpp>
#include "livetesting.hpp"

using namespace live;
using namespace live::internal;
using namespace test;

namespace
{

PresenceMeta meta(const std::string& device)
{
    return PresenceMeta{device, PresenceStatus::online, TimePoint{}};
}

std::string joinFrame()
{
    return R"({"op":"join","topic":"channel:general"})";
}

std::string sendFrame(const std::string& content)
{
    return R"({"op":"send_message","topic":"channel:general","content":")" +
           content + R"("})";
}

} // anonymous namespace

//------------------------------------------------------------------------------
TEST_CASE( "Topic owner faults ask every member to rejoin", "[TopicRoom]" )
{
    IoContext ioctx;
    std::vector<LogEntry> logs;
    auto logger = std::make_shared<HubLogger>(
        ioctx.get_executor(),
        [&logs](LogEntry e) {logs.push_back(std::move(e));},
        LogLevel::warning);
    auto room = TopicRoom::create(ioctx.get_executor(),
                                  TopicUri::channel("general"),
                                  std::chrono::seconds(5), logger);

    unsigned joinCount = 0;
    auto onJoined = [&joinCount](RoomJoined) {++joinCount;};
    auto alice = FaultyMember::create();
    auto bob = FaultyMember::create();
    auto restarted = make_error_code(LiveErrc::topicRestarted);

    room->join(1, "alice", meta("phone"), alice, onJoined);
    drain(ioctx);
    REQUIRE(joinCount == 1);
    REQUIRE(room->memberCount() == 1);

    SECTION("Fault while announcing a joiner")
    {
        alice->faulting = true;
        room->join(2, "bob", meta("desk"), bob, onJoined);
        drain(ioctx);

        CHECK(joinCount == 1);
        CHECK(room->memberCount() == 0);
        REQUIRE(alice->restarts.size() == 1);
        CHECK(alice->restarts[0] == restarted);
        REQUIRE(bob->restarts.size() == 1);
        CHECK(bob->restarts[0] == restarted);
        REQUIRE_FALSE(logs.empty());
        CHECK(logs.front().severity() == LogLevel::critical);

        // The room is usable again once members rejoin.
        alice->faulting = false;
        room->join(1, "alice", meta("phone"), alice, onJoined);
        room->join(2, "bob", meta("desk"), bob, onJoined);
        drain(ioctx);
        CHECK(joinCount == 3);
        CHECK(room->memberCount() == 2);
    }

    SECTION("Fault while changing a status")
    {
        room->join(2, "bob", meta("desk"), bob, onJoined);
        drain(ioctx);
        REQUIRE(joinCount == 2);

        alice->faulting = true;
        bool done = false;
        std::error_code result;
        room->updateStatus(2, PresenceStatus::away,
                           [&done, &result](std::error_code ec)
                           {
                               done = true;
                               result = ec;
                           });
        drain(ioctx);

        REQUIRE(done);
        CHECK(result == make_error_code(LiveErrc::internalFault));
        CHECK(alice->restarts.size() == 1);
        CHECK(bob->restarts.size() == 1);
        CHECK(room->memberCount() == 0);
    }

    SECTION("Members that left are not asked to rejoin")
    {
        room->leave(1);
        drain(ioctx);
        room->reset(restarted);
        drain(ioctx);
        CHECK(alice->restarts.empty());
        CHECK(bob->restarts.empty());
    }
}

//------------------------------------------------------------------------------
TEST_CASE( "Sessions rejoin after a topic owner fault", "[TopicRoom]" )
{
    IoContext ioctx;
    auto hub = HubImpl::create(
        ioctx.get_executor(),
        HubOptions(makeDirectory(), MemoryMessageStore::create()));

    auto aliceTx = FakeTransport::create();
    auto bobTx = FakeTransport::create();
    auto alice = ConnectionImpl::create(hub, aliceTx, {"alice", "phone"});
    auto bob = ConnectionImpl::create(hub, bobTx, {"bob", "desk"});
    alice->receive(joinFrame());
    bob->receive(joinFrame());
    drain(ioctx);
    REQUIRE(aliceTx->events("joined").size() == 1);
    REQUIRE(bobTx->events("joined").size() == 1);

    auto room = hub->findRoom(TopicUri::channel("general"));
    REQUIRE(room != nullptr);
    auto faulty = FaultyMember::create();
    room->join(hub->nextSessionKey(), "carol", meta("monitor"), faulty,
               [](RoomJoined) {});
    drain(ioctx);
    REQUIRE(room->memberCount() == 3);

    faulty->faulting = true;
    alice->receive(sendFrame("hello"));
    drain(ioctx);

    // Both sessions joined the topic again, and the faulty member was
    // merely asked to.
    CHECK(aliceTx->events("joined").size() == 2);
    CHECK(bobTx->events("joined").size() == 2);
    CHECK(faulty->restarts.size() == 1);
    CHECK(room->memberCount() == 2);
    CHECK(hub->findRoom(TopicUri::channel("general")) == room);

    auto rejoined = bobTx->events("joined").back();
    const auto& presence = rejoined.at("snapshot").at("presence");
    CHECK(presence.contains("alice"));
    CHECK(presence.contains("bob"));
    CHECK_FALSE(presence.contains("carol"));

    bobTx->clear();
    alice->receive(sendFrame("again"));
    drain(ioctx);
    auto created = bobTx->events("message_created");
    REQUIRE(created.size() == 1);
    CHECK(created[0].at("message").at("content").as<std::string>() ==
          "again");
}
