/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <algorithm>
#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include <cpplive/hub.hpp>
#include "livetesting.hpp"

using namespace live;
using namespace test;

namespace
{

struct LogRecorder
{
    std::vector<LogEntry> entries;

    LogHandler handler()
    {
        return [this](LogEntry e) {entries.push_back(std::move(e));};
    }

    bool contains(LogLevel level) const
    {
        for (const auto& e: entries)
            if (e.severity() == level)
                return true;
        return false;
    }
};

HubOptions makeOptions(MessageStore::Ptr store, LogRecorder& logs)
{
    return HubOptions(makeDirectory(), std::move(store))
        .withLogHandler(logs.handler())
        .withLogLevel(LogLevel::warning);
}

std::string sendFrame(const std::string& topic, const std::string& content,
                      const std::string& clientRef = {})
{
    Json j(jsoncons::json_object_arg);
    j.insert_or_assign("op", "send_message");
    j.insert_or_assign("topic", topic);
    j.insert_or_assign("content", content);
    if (!clientRef.empty())
        j.insert_or_assign("client_ref", clientRef);
    std::string text;
    j.dump(text);
    return text;
}

uint64_t seqOf(const Json& frame) {return frame.at("seq").as<uint64_t>();}

std::string str(const Json& j, const char* key)
{
    return j.at(key).as<std::string>();
}

} // anonymous namespace

//------------------------------------------------------------------------------
TEST_CASE( "Joining a topic", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    auto store = MemoryMessageStore::create();
    Hub hub{ioctx, makeOptions(store, logs)};

    store->createMessage("bob", TopicUri::channel("general"), "earlier", {},
                         [](ErrorOr<Event>) {});

    TestClient alice{hub, "alice", "phone"};
    alice.join("channel:general");
    drain(ioctx);

    auto joined = alice.transport->events("joined");
    REQUIRE(joined.size() == 1);
    CHECK(str(joined[0], "topic") == "channel:general");
    const auto& snapshot = joined[0].at("snapshot");
    const auto& metas = snapshot.at("presence").at("alice");
    REQUIRE(metas.size() == 1);
    CHECK(str(metas[0], "device_id") == "phone");
    CHECK(str(metas[0], "status") == "online");
    const auto& recent = snapshot.at("recent_messages");
    REQUIRE(recent.size() == 1);
    CHECK(str(recent[0], "content") == "earlier");

    CHECK(alice.connection.sessionCount() == 1);
    CHECK(hub.topicCount() == 1);
    CHECK(hub.sessionCount() == 1);

    SECTION("Later joiners are announced to present ones")
    {
        TestClient bob{hub, "bob", "desk"};
        bob.join("channel:general");
        drain(ioctx);

        auto diffs = alice.transport->events("presence_diff");
        REQUIRE(diffs.size() == 1);
        CHECK(str(diffs[0].at("joins").at("bob")[0], "device_id") == "desk");
        CHECK(diffs[0].at("leaves").empty());

        auto bobJoined = bob.transport->events("joined");
        REQUIRE(bobJoined.size() == 1);
        const auto& presence = bobJoined[0].at("snapshot").at("presence");
        CHECK(presence.contains("alice"));
        CHECK(presence.contains("bob"));
        CHECK(bob.transport->events("presence_diff").empty());
        CHECK(hub.sessionCount() == 2);
    }

    SECTION("Joining an already joined topic")
    {
        alice.send(R"({"op":"join","topic":"channel:general",)"
                   R"("client_ref":"again"})");
        drain(ioctx);
        auto errors = alice.transport->events("error");
        REQUIRE(errors.size() == 1);
        CHECK(str(errors[0], "reason") == "already_joined");
        CHECK(str(errors[0], "op") == "join");
        CHECK(str(errors[0], "client_ref") == "again");
        CHECK(alice.transport->events("joined").size() == 1);
    }

    SECTION("Generated device IDs")
    {
        TestClient anon{hub, "bob"};
        CHECK_FALSE(anon.connection.info().deviceId.empty());
        anon.join("channel:general");
        drain(ioctx);
        auto diffs = alice.transport->events("presence_diff");
        REQUIRE(diffs.size() == 1);
        CHECK(str(diffs[0].at("joins").at("bob")[0], "device_id") ==
              anon.connection.info().deviceId);
    }
}

//------------------------------------------------------------------------------
TEST_CASE( "Join authorization", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    Hub hub{ioctx, makeOptions(MemoryMessageStore::create(), logs)};

    struct Case
    {
        std::string identity;
        std::string topic;
        std::string reason;
    };

    const std::vector<Case> denied =
    {
        {"dave",  "channel:general",  "unauthorized"},
        {"dave",  "workspace:acme",   "unauthorized"},
        {"bob",   "channel:secret",   "unauthorized"},
        {"alice", "channel:old",      "archived"},
        {"alice", "channel:nope",     "not_found"},
        {"alice", "workspace:nope",   "not_found"},
        {"alice", "room:general",     "not_found"}
    };

    for (const auto& c: denied)
    {
        INFO("Identity " << c.identity << " joining " << c.topic);
        TestClient client{hub, c.identity};
        client.send(R"({"op":"join","topic":")" + c.topic +
                    R"(","client_ref":"j1"})");
        drain(ioctx);

        auto errors = client.transport->events("error");
        REQUIRE(errors.size() == 1);
        CHECK(str(errors[0], "reason") == c.reason);
        CHECK(str(errors[0], "op") == "join");
        CHECK(str(errors[0], "client_ref") == "j1");
        CHECK(client.transport->events("joined").empty());
        CHECK(client.connection.sessionCount() == 0);
    }

    CHECK(hub.topicCount() == 0);
    CHECK(hub.sessionCount() == 0);

    const std::vector<Case> granted =
    {
        {"alice", "channel:secret",  ""},
        {"carol", "channel:old",     ""},
        {"bob",   "workspace:acme",  ""},
        {"carol", "channel:general", ""}
    };

    for (const auto& c: granted)
    {
        INFO("Identity " << c.identity << " joining " << c.topic);
        TestClient client{hub, c.identity};
        client.join(c.topic);
        drain(ioctx);
        CHECK(client.transport->events("joined").size() == 1);
        CHECK(client.transport->events("error").empty());
    }
}

//------------------------------------------------------------------------------
TEST_CASE( "Typing, messages and ordering", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    Hub hub{ioctx, makeOptions(MemoryMessageStore::create(), logs)
                       .withTypingTimeout(ms(150))};

    TestClient alice{hub, "alice", "phone"};
    TestClient bob{hub, "bob", "desk"};
    alice.join("channel:general");
    bob.join("channel:general");
    drain(ioctx);
    REQUIRE(alice.transport->events("joined").size() == 1);
    REQUIRE(bob.transport->events("joined").size() == 1);

    for (int i = 0; i < 3; ++i)
    {
        alice.send(R"({"op":"typing_start","topic":"channel:general"})");
        drain(ioctx);
    }

    auto started = bob.transport->events("typing_started");
    REQUIRE(started.size() == 1);
    CHECK(str(started[0], "identity") == "alice");
    CHECK(alice.transport->events("typing_started").empty());

    alice.send(sendFrame("channel:general", "hi", "c1"));
    drain(ioctx);

    auto created = bob.transport->events("message_created");
    REQUIRE(created.size() == 1);
    CHECK(str(created[0].at("message"), "content") == "hi");
    CHECK(str(created[0].at("message"), "author") == "alice");
    CHECK(seqOf(created[0]) > seqOf(started[0]));
    CHECK(alice.transport->events("message_created").size() == 1);

    runFor(ioctx, ms(500));
    auto stopped = bob.transport->events("typing_stopped");
    REQUIRE(stopped.size() == 1);
    CHECK(str(stopped[0], "identity") == "alice");
    CHECK(seqOf(stopped[0]) > seqOf(created[0]));
    CHECK(alice.transport->events("typing_stopped").empty());

    // Every subscriber observes the same gap-free sequence from the point
    // it joined.
    std::vector<uint64_t> seqs;
    for (const auto& f: bob.transport->parsed())
        if (f.contains("seq"))
            seqs.push_back(seqOf(f));
    for (std::size_t i = 1; i < seqs.size(); ++i)
        CHECK(seqs[i] == seqs[i - 1] + 1);
}

//------------------------------------------------------------------------------
TEST_CASE( "Typing across devices of one identity", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    Hub hub{ioctx, makeOptions(MemoryMessageStore::create(), logs)};

    TestClient phone{hub, "alice", "phone"};
    TestClient laptop{hub, "alice", "laptop"};
    TestClient bob{hub, "bob", "desk"};
    phone.join("channel:general");
    laptop.join("channel:general");
    bob.join("channel:general");
    drain(ioctx);

    phone.send(R"({"op":"typing_start","topic":"channel:general"})");
    drain(ioctx);
    laptop.send(R"({"op":"typing_start","topic":"channel:general"})");
    drain(ioctx);
    CHECK(bob.transport->events("typing_started").size() == 1);
    CHECK(phone.transport->events("typing_started").empty());
    CHECK(laptop.transport->events("typing_started").empty());

    SECTION("Explicit stop")
    {
        laptop.send(R"({"op":"typing_stop","topic":"channel:general"})");
        drain(ioctx);
        CHECK(bob.transport->events("typing_stopped").size() == 1);
    }

    SECTION("Leaving device that last typed stops typing")
    {
        laptop.send(R"({"op":"leave","topic":"channel:general"})");
        drain(ioctx);
        CHECK(bob.transport->events("typing_stopped").size() == 1);
    }

    SECTION("Leaving device that did not type last")
    {
        phone.send(R"({"op":"leave","topic":"channel:general"})");
        drain(ioctx);
        CHECK(bob.transport->events("typing_stopped").empty());
    }
}

//------------------------------------------------------------------------------
TEST_CASE( "Command routing", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    Hub hub{ioctx, makeOptions(MemoryMessageStore::create(), logs)};

    TestClient alice{hub, "alice", "phone"};

    SECTION("Commands before joining")
    {
        alice.send(sendFrame("channel:general", "early", "e1"));
        drain(ioctx);
        auto errors = alice.transport->events("error");
        REQUIRE(errors.size() == 1);
        CHECK(str(errors[0], "reason") == "not_joined");
        CHECK(str(errors[0], "op") == "send_message");
        CHECK(str(errors[0], "client_ref") == "e1");
    }

    SECTION("Malformed frames")
    {
        alice.send("garbage");
        alice.send(R"({"op":"edit_message","topic":"channel:general",)"
                   R"("client_ref":"x"})");
        drain(ioctx);
        auto errors = alice.transport->events("error");
        REQUIRE(errors.size() == 2);
        CHECK(str(errors[0], "reason") == "invalid");
        CHECK(str(errors[1], "reason") == "invalid");
        CHECK(str(errors[1], "op") == "edit_message");
        CHECK(str(errors[1], "client_ref") == "x");
    }

    SECTION("Single joined topic may be implied")
    {
        alice.join("channel:general");
        drain(ioctx);
        alice.send(R"({"op":"send_message","content":"implicit"})");
        drain(ioctx);
        CHECK(alice.transport->events("message_created").size() == 1);
        CHECK(alice.transport->events("error").empty());

        alice.join("workspace:acme");
        drain(ioctx);
        CHECK(alice.connection.sessionCount() == 2);
        alice.send(R"({"op":"send_message","content":"ambiguous"})");
        drain(ioctx);
        CHECK(alice.transport->errorReasons() ==
              std::vector<std::string>{"not_joined"});
    }

    SECTION("Commands to a topic not joined")
    {
        alice.join("channel:general");
        drain(ioctx);
        alice.send(sendFrame("channel:random", "wrong"));
        drain(ioctx);
        CHECK(alice.transport->errorReasons() ==
              std::vector<std::string>{"not_joined"});
    }

    SECTION("Topics are independent")
    {
        TestClient bob{hub, "bob", "desk"};
        alice.join("channel:general");
        alice.join("workspace:acme");
        bob.join("workspace:acme");
        drain(ioctx);

        alice.send(sendFrame("channel:general", "for general"));
        drain(ioctx);
        CHECK(bob.transport->events("message_created").empty());

        alice.send(sendFrame("workspace:acme", "for acme"));
        drain(ioctx);
        auto created = bob.transport->events("message_created");
        REQUIRE(created.size() == 1);
        CHECK(str(created[0], "topic") == "workspace:acme");
        CHECK(hub.topicCount() == 2);
    }
}

//------------------------------------------------------------------------------
TEST_CASE( "Message lifecycle", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    auto store = MemoryMessageStore::create();
    Hub hub{ioctx, makeOptions(store, logs)};

    TestClient alice{hub, "alice", "phone"};
    TestClient bob{hub, "bob", "desk"};
    alice.join("channel:general");
    bob.join("channel:general");
    drain(ioctx);

    alice.send(sendFrame("channel:general", "draft"));
    drain(ioctx);
    auto created = bob.transport->events("message_created");
    REQUIRE(created.size() == 1);
    auto id = str(created[0].at("message"), "id");
    const std::string topicField = R"(","topic":"channel:general"})";

    SECTION("Only the author may edit")
    {
        bob.send(R"({"op":"edit_message","content":"hijack","client_ref":)"
                 R"("b1","message_id":")" + id + topicField);
        drain(ioctx);
        CHECK(bob.transport->errorReasons() ==
              std::vector<std::string>{"unauthorized"});
        CHECK(alice.transport->events("error").empty());
        CHECK(alice.transport->events("message_edited").empty());

        alice.send(R"({"op":"edit_message","content":"final",)"
                   R"("message_id":")" + id + topicField);
        drain(ioctx);
        auto edited = bob.transport->events("message_edited");
        REQUIRE(edited.size() == 1);
        CHECK(str(edited[0].at("message"), "content") == "final");
        CHECK(edited[0].at("message").contains("edited_at"));
    }

    SECTION("Deleting")
    {
        alice.send(R"({"op":"delete_message","message_id":")" + id +
                   topicField);
        drain(ioctx);
        CHECK(bob.transport->events("message_deleted").size() == 1);
        CHECK(store->messageCount() == 0);
    }

    SECTION("Reactions")
    {
        bob.send(R"({"op":"add_reaction","emoji":"+1","message_id":")" + id +
                 topicField);
        drain(ioctx);
        auto added = alice.transport->events("reaction_added");
        REQUIRE(added.size() == 1);
        CHECK(str(added[0], "identity") == "bob");
        CHECK(str(added[0], "emoji") == "+1");

        alice.send(R"({"op":"remove_reaction","emoji":"+1","message_id":")" +
                   id + topicField);
        drain(ioctx);
        CHECK(alice.transport->errorReasons() ==
              std::vector<std::string>{"unauthorized"});

        bob.send(R"({"op":"remove_reaction","emoji":"+1","message_id":")" +
                 id + topicField);
        drain(ioctx);
        CHECK(alice.transport->events("reaction_removed").size() == 1);
    }

    SECTION("Threads")
    {
        bob.send(R"({"op":"start_thread","content":"reply","message_id":")" +
                 id + topicField);
        drain(ioctx);
        auto replies = alice.transport->events("thread_reply_created");
        REQUIRE(replies.size() == 1);
        CHECK(str(replies[0].at("message"), "thread_id") == id);

        alice.send(R"({"op":"send_message","content":"more","thread_id":")" +
                   id + topicField);
        drain(ioctx);
        CHECK(bob.transport->events("thread_reply_created").size() == 2);
    }

    SECTION("Read receipts")
    {
        bob.send(R"({"op":"mark_read","message_id":")" + id + topicField);
        drain(ioctx);
        auto reads = alice.transport->events("message_read");
        REQUIRE(reads.size() == 1);
        CHECK(str(reads[0], "identity") == "bob");
        CHECK(store->lastRead("bob", TopicUri::channel("general")) == id);
    }

    SECTION("Unknown messages")
    {
        bob.send(R"({"op":"add_reaction","emoji":"+1","message_id":"zzz",)"
                 R"("topic":"channel:general"})");
        drain(ioctx);
        CHECK(bob.transport->errorReasons() ==
              std::vector<std::string>{"not_found"});
    }
}

//------------------------------------------------------------------------------
TEST_CASE( "Loading older messages", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    auto store = MemoryMessageStore::create();
    Hub hub{ioctx, makeOptions(store, logs)
                       .withRecentMessageLimit(2)
                       .withOlderMessageLimit(2)};

    auto general = TopicUri::channel("general");
    std::vector<MessageId> ids;
    for (int i = 1; i <= 5; ++i)
    {
        store->createMessage(
            "bob", general, "m" + std::to_string(i), {},
            [&ids](ErrorOr<Event> e) {ids.push_back(e->message().id);});
    }
    REQUIRE(ids.size() == 5);

    TestClient alice{hub, "alice", "phone"};
    alice.join("channel:general");
    drain(ioctx);

    auto joined = alice.transport->events("joined");
    REQUIRE(joined.size() == 1);
    const auto& recent = joined[0].at("snapshot").at("recent_messages");
    REQUIRE(recent.size() == 2);
    CHECK(str(recent[0], "content") == "m4");
    CHECK(str(recent[1], "content") == "m5");

    alice.send(R"({"op":"load_older_messages","topic":"channel:general",)"
               R"("before_id":")" + ids[3] + R"("})");
    drain(ioctx);
    auto older = alice.transport->events("older_messages_loaded");
    REQUIRE(older.size() == 1);
    const auto& messages = older[0].at("messages");
    REQUIRE(messages.size() == 2);
    CHECK(str(messages[0], "content") == "m2");
    CHECK(str(messages[1], "content") == "m3");

    alice.send(R"({"op":"load_older_messages","topic":"channel:general",)"
               R"("before_id":"nope","client_ref":"p2"})");
    drain(ioctx);
    auto errors = alice.transport->events("error");
    REQUIRE(errors.size() == 1);
    CHECK(str(errors[0], "reason") == "not_found");
    CHECK(str(errors[0], "op") == "load_older_messages");
    CHECK(str(errors[0], "client_ref") == "p2");
}

//------------------------------------------------------------------------------
TEST_CASE( "Updating presence status", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    Hub hub{ioctx, makeOptions(MemoryMessageStore::create(), logs)};

    TestClient alice{hub, "alice", "phone"};
    TestClient bob{hub, "bob", "desk"};
    alice.join("channel:general");
    bob.join("channel:general");
    drain(ioctx);
    bob.transport->clear();

    alice.send(R"({"op":"update_status","topic":"channel:general",)"
               R"("status":"away"})");
    drain(ioctx);

    auto diffs = bob.transport->events("presence_diff");
    REQUIRE(diffs.size() == 1);
    CHECK(str(diffs[0].at("leaves").at("alice")[0], "status") == "online");
    CHECK(str(diffs[0].at("joins").at("alice")[0], "status") == "away");

    alice.send(R"({"op":"update_status","topic":"channel:general",)"
               R"("status":"asleep"})");
    drain(ioctx);
    CHECK(alice.transport->errorReasons() ==
          std::vector<std::string>{"invalid"});
}

//------------------------------------------------------------------------------
TEST_CASE( "Store failures are reported to the requester only", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;

    SECTION("Foreign store error")
    {
        auto store = FailingStore::create(
            std::make_error_code(std::errc::io_error));
        Hub hub{ioctx, makeOptions(store, logs)};
        TestClient alice{hub, "alice", "phone"};
        TestClient bob{hub, "bob", "desk"};
        alice.join("channel:general");
        bob.join("channel:general");
        drain(ioctx);

        alice.send(sendFrame("channel:general", "lost", "c9"));
        drain(ioctx);
        auto errors = alice.transport->events("error");
        REQUIRE(errors.size() == 1);
        CHECK(str(errors[0], "reason") == "store_failure");
        CHECK(str(errors[0], "op") == "send_message");
        CHECK(str(errors[0], "client_ref") == "c9");
        CHECK(bob.transport->events("error").empty());
        CHECK(bob.transport->events("message_created").empty());

        // The session survives.
        alice.send(R"({"op":"typing_start"})");
        drain(ioctx);
        CHECK(bob.transport->events("typing_started").size() == 1);
    }

    SECTION("Store timeout")
    {
        auto store = StallingStore::create();
        Hub hub{ioctx, makeOptions(store, logs).withStoreTimeout(ms(50))};
        TestClient alice{hub, "alice", "phone"};
        TestClient bob{hub, "bob", "desk"};
        alice.join("channel:general");
        bob.join("channel:general");
        drain(ioctx);

        alice.send(sendFrame("channel:general", "slow", "t1"));
        drain(ioctx);
        CHECK(store->withheldCount() == 1);
        CHECK(alice.transport->events("error").empty());

        runFor(ioctx, ms(200));
        auto errors = alice.transport->events("error");
        REQUIRE(errors.size() == 1);
        CHECK(str(errors[0], "reason") == "store_timeout");
        CHECK(str(errors[0], "client_ref") == "t1");

        // A late success is still broadcast.
        store->release();
        drain(ioctx);
        CHECK(bob.transport->events("message_created").size() == 1);
        CHECK(alice.transport->events("message_created").size() == 1);
        CHECK(alice.transport->events("error").size() == 1);
    }
}

//------------------------------------------------------------------------------
TEST_CASE( "Session faults are isolated", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    Hub hub{ioctx, makeOptions(ThrowingStore::create(), logs)};

    TestClient alice{hub, "alice", "phone"};
    TestClient bob{hub, "bob", "desk"};
    alice.join("channel:general");
    bob.join("channel:general");
    drain(ioctx);
    bob.transport->clear();

    alice.send(sendFrame("channel:general", "boom", "f1"));
    drain(ioctx);

    auto errors = alice.transport->events("error");
    REQUIRE(errors.size() == 1);
    CHECK(str(errors[0], "reason") == "internal_error");
    CHECK(str(errors[0], "op") == "send_message");
    CHECK(str(errors[0], "client_ref") == "f1");
    CHECK(logs.contains(LogLevel::critical));

    // The faulted session left the topic, and was replaced by one awaiting
    // a new join.
    auto diffs = bob.transport->events("presence_diff");
    REQUIRE(diffs.size() == 1);
    CHECK(diffs[0].at("leaves").contains("alice"));
    CHECK(alice.connection.sessionCount() == 1);
    CHECK(hub.sessionCount() == 1);

    alice.send(sendFrame("channel:general", "too soon"));
    drain(ioctx);
    CHECK(alice.transport->errorReasons().back() == "not_joined");

    alice.join("channel:general");
    drain(ioctx);
    CHECK(alice.transport->events("joined").size() == 2);

    alice.send(sendFrame("channel:general", "fine"));
    drain(ioctx);
    CHECK(bob.transport->events("message_created").size() == 1);
}

//------------------------------------------------------------------------------
TEST_CASE( "Slow consumers are terminated in isolation", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    Hub hub{ioctx, makeOptions(MemoryMessageStore::create(), logs)
                       .withOutboundQueueLimit(4)};

    TestClient alice{hub, "alice", "phone"};
    TestClient bob{hub, "bob", "desk"};
    alice.join("channel:general");
    bob.join("channel:general");
    drain(ioctx);
    REQUIRE(alice.transport->events("joined").size() == 1);
    REQUIRE(bob.transport->events("joined").size() == 1);
    bob.transport->clear();

    alice.transport->stall();
    for (int i = 0; i < 12; ++i)
    {
        bob.send(sendFrame("channel:general", "msg" + std::to_string(i)));
        drain(ioctx);
    }

    CHECK(alice.connection.sessionCount() == 0);
    CHECK(bob.connection.sessionCount() == 1);
    CHECK(hub.sessionCount() == 1);
    CHECK(logs.contains(LogLevel::warning));

    CHECK(bob.transport->events("message_created").size() == 12);
    CHECK(bob.transport->events("error").empty());
    auto diffs = bob.transport->events("presence_diff");
    REQUIRE(diffs.size() == 1);
    CHECK(diffs[0].at("leaves").contains("alice"));

    // The overflowed connection remains usable.
    CHECK(alice.connection.isOpen());
}

//------------------------------------------------------------------------------
TEST_CASE( "Replies to a stalled client count against the outbound limit",
           "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    Hub hub{ioctx, makeOptions(MemoryMessageStore::create(), logs)
                       .withOutboundQueueLimit(4)};

    TestClient alice{hub, "alice", "phone"};
    TestClient bob{hub, "bob", "desk"};
    alice.join("channel:general");
    bob.join("channel:general");
    drain(ioctx);
    alice.transport->clear();
    bob.transport->clear();

    alice.transport->stall();
    for (int i = 0; i < 10; ++i)
    {
        alice.send(R"({"op":"delete_message","message_id":"zzz",)"
                   R"("topic":"channel:general"})");
        drain(ioctx);
    }

    CHECK(alice.connection.sessionCount() == 0);
    CHECK(hub.sessionCount() == 1);
    CHECK(logs.contains(LogLevel::warning));
    auto diffs = bob.transport->events("presence_diff");
    REQUIRE(diffs.size() == 1);
    CHECK(diffs[0].at("leaves").contains("alice"));

    // The first reply reached the stalled transport and the next four filled
    // the queue. Later commands are answered by the connection itself.
    auto reasons = alice.transport->errorReasons();
    REQUIRE(reasons.size() == 5);
    CHECK(reasons[0] == "not_found");
    CHECK(std::count(reasons.begin(), reasons.end(), "not_joined") == 4);
    CHECK(alice.connection.isOpen());
}

//------------------------------------------------------------------------------
TEST_CASE( "Events published while a joiner loads its backlog", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    auto store = BacklogStallingStore::create();
    Hub hub{ioctx, makeOptions(store, logs)};

    TestClient bob{hub, "bob", "desk"};
    bob.join("channel:general");
    drain(ioctx);
    bob.send(sendFrame("channel:general", "earlier"));
    drain(ioctx);

    store->stall();
    TestClient alice{hub, "alice", "phone"};
    alice.join("channel:general");
    drain(ioctx);
    REQUIRE(store->withheldCount() == 1);

    bob.send(sendFrame("channel:general", "during"));
    drain(ioctx);
    bob.send(R"({"op":"typing_start","topic":"channel:general"})");
    drain(ioctx);
    CHECK(alice.transport->frames().empty());

    store->release();
    drain(ioctx);

    // The backlog already holds the message created meanwhile, so only the
    // typing event follows the joined frame.
    auto frames = alice.transport->parsed();
    REQUIRE(frames.size() == 2);
    CHECK(str(frames[0], "event") == "joined");
    const auto& recent = frames[0].at("snapshot").at("recent_messages");
    REQUIRE(recent.size() == 2);
    CHECK(str(recent[0], "content") == "earlier");
    CHECK(str(recent[1], "content") == "during");
    CHECK(str(frames[1], "event") == "typing_started");
    CHECK(str(frames[1], "identity") == "bob");

    bob.send(sendFrame("channel:general", "after"));
    drain(ioctx);
    auto created = alice.transport->events("message_created");
    REQUIRE(created.size() == 1);
    CHECK(str(created[0].at("message"), "content") == "after");
}

//------------------------------------------------------------------------------
TEST_CASE( "Late store outcomes reach a reopened topic", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    auto store = StallingStore::create();
    Hub hub{ioctx, makeOptions(store, logs)};

    TestClient alice{hub, "alice", "phone"};
    alice.join("channel:general");
    drain(ioctx);
    alice.send(sendFrame("channel:general", "parting words"));
    drain(ioctx);
    REQUIRE(store->withheldCount() == 1);

    alice.send(R"({"op":"leave","topic":"channel:general"})");
    drain(ioctx);
    CHECK(hub.topicCount() == 0);

    TestClient bob{hub, "bob", "desk"};
    bob.join("channel:general");
    drain(ioctx);
    REQUIRE(bob.transport->events("joined").size() == 1);
    CHECK(hub.topicCount() == 1);

    store->release();
    drain(ioctx);
    auto created = bob.transport->events("message_created");
    REQUIRE(created.size() == 1);
    CHECK(str(created[0].at("message"), "content") == "parting words");
}

//------------------------------------------------------------------------------
TEST_CASE( "Resetting a topic", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    Hub hub{ioctx, makeOptions(MemoryMessageStore::create(), logs)};

    CHECK_FALSE(hub.resetTopic("channel:general"));
    CHECK_FALSE(hub.resetTopic("garbage"));

    TestClient alice{hub, "alice", "phone"};
    TestClient bob{hub, "bob", "desk"};
    alice.join("channel:general");
    bob.join("channel:general");
    drain(ioctx);

    alice.send(R"({"op":"typing_start"})");
    alice.send(sendFrame("channel:general", "before"));
    drain(ioctx);
    auto before = bob.transport->events("message_created");
    REQUIRE(before.size() == 1);
    alice.transport->clear();
    bob.transport->clear();

    CHECK(hub.resetTopic(TopicUri::channel("general")));
    drain(ioctx);

    CHECK(alice.transport->events("joined").size() == 1);
    CHECK(bob.transport->events("joined").size() == 1);
    CHECK(hub.topicCount() == 1);
    CHECK(hub.sessionCount() == 2);
    CHECK(logs.contains(LogLevel::warning));

    // Typing state is discarded without a typing_stopped event.
    CHECK(bob.transport->events("typing_stopped").empty());

    alice.send(sendFrame("channel:general", "after"));
    drain(ioctx);
    auto after = bob.transport->events("message_created");
    REQUIRE(after.size() == 1);
    CHECK(seqOf(after[0]) > seqOf(before[0]));
}

//------------------------------------------------------------------------------
TEST_CASE( "Leaving and disconnecting", "[Hub]" )
{
    IoContext ioctx;
    LogRecorder logs;
    Hub hub{ioctx, makeOptions(MemoryMessageStore::create(), logs)};

    TestClient phone{hub, "alice", "phone"};
    TestClient laptop{hub, "alice", "laptop"};
    TestClient bob{hub, "bob", "desk"};
    phone.join("channel:general");
    laptop.join("channel:general");
    bob.join("channel:general");
    drain(ioctx);
    CHECK(hub.sessionCount() == 3);
    bob.transport->clear();

    phone.send(R"({"op":"leave","topic":"channel:general"})");
    drain(ioctx);
    auto diffs = bob.transport->events("presence_diff");
    REQUIRE(diffs.size() == 1);
    const auto& left = diffs[0].at("leaves").at("alice");
    REQUIRE(left.size() == 1);
    CHECK(str(left[0], "device_id") == "phone");
    CHECK(phone.connection.sessionCount() == 0);
    CHECK(hub.sessionCount() == 2);

    // Leaving again has no effect besides an error.
    phone.send(R"({"op":"leave","topic":"channel:general"})");
    drain(ioctx);
    CHECK(phone.transport->errorReasons() ==
          std::vector<std::string>{"not_joined"});
    CHECK(bob.transport->events("presence_diff").size() == 1);

    laptop.connection.disconnect();
    drain(ioctx);
    diffs = bob.transport->events("presence_diff");
    REQUIRE(diffs.size() == 2);
    CHECK(str(diffs[1].at("leaves").at("alice")[0], "device_id") == "laptop");
    CHECK_FALSE(laptop.connection.isOpen());
    CHECK(hub.sessionCount() == 1);

    bob.connection.close();
    drain(ioctx);
    CHECK(bob.transport->isClosed());
    CHECK(hub.sessionCount() == 0);
    CHECK(hub.topicCount() == 0);

    // The topic is created afresh by the next join.
    TestClient carol{hub, "carol"};
    carol.join("channel:general");
    drain(ioctx);
    auto joined = carol.transport->events("joined");
    REQUIRE(joined.size() == 1);
    const auto& presence = joined[0].at("snapshot").at("presence");
    CHECK(presence.size() == 1);
    CHECK(presence.contains("carol"));
}
