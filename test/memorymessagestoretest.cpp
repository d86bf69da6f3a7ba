/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include <cpplive/collaborators/memorymessagestore.hpp>
#include "livetesting.hpp"

using namespace live;
using namespace test;

namespace
{

// The in-memory store completes synchronously.
struct Outcome
{
    ErrorOr<Event> result;
    bool done = false;

    MessageStore::EventHandler handler()
    {
        return [this](ErrorOr<Event> r) {result = std::move(r); done = true;};
    }
};

std::vector<std::string> contentsOf(const MessageList& list)
{
    std::vector<std::string> contents;
    for (const auto& m: list)
        contents.push_back(m.content);
    return contents;
}

MessageList listRecent(MessageStore& store, const TopicUri& topic,
                       std::size_t limit)
{
    MessageList list;
    store.listRecent(topic, limit,
                     [&list](ErrorOr<MessageList> r) {list = r.value();});
    return list;
}

MessageId post(MessageStore& store, const TopicUri& topic,
               const std::string& author, const std::string& content)
{
    Outcome out;
    store.createMessage(author, topic, content, {}, out.handler());
    REQUIRE(out.done);
    REQUIRE(out.result.has_value());
    return out.result->message().id;
}

} // anonymous namespace

//------------------------------------------------------------------------------
TEST_CASE( "Creating messages", "[MessageStore]" )
{
    auto store = MemoryMessageStore::create();
    auto general = TopicUri::channel("general");

    Outcome out;
    store->createMessage("alice", general, "hello", {"pic.png"},
                         out.handler());
    REQUIRE(out.done);
    REQUIRE(out.result.has_value());
    CHECK(out.result->kind() == EventKind::messageCreated);
    CHECK(out.result->originator() == "alice");
    const auto& msg = out.result->message();
    CHECK_FALSE(msg.id.empty());
    CHECK(msg.author == "alice");
    CHECK(msg.topic == general);
    CHECK(msg.attachments == std::vector<std::string>{"pic.png"});
    CHECK_FALSE(msg.isThreadReply());
    CHECK_FALSE(msg.isEdited());
    CHECK(store->find(msg.id).has_value());

    SECTION("Blank content without attachments is invalid")
    {
        Outcome blank;
        store->createMessage("alice", general, "  \t", {}, blank.handler());
        REQUIRE_FALSE(blank.result.has_value());
        CHECK(blank.result.error() == LiveErrc::invalid);
        CHECK(store->messageCount() == 1);
    }

    SECTION("Attachment-only messages are accepted")
    {
        Outcome attached;
        store->createMessage("bob", general, "", {"doc.pdf"},
                             attached.handler());
        CHECK(attached.result.has_value());
    }
}

//------------------------------------------------------------------------------
TEST_CASE( "Message ownership", "[MessageStore]" )
{
    auto store = MemoryMessageStore::create();
    auto general = TopicUri::channel("general");
    auto id = post(*store, general, "alice", "original");

    SECTION("Author edits")
    {
        Outcome out;
        store->editMessage("alice", general, id, "revised", out.handler());
        REQUIRE(out.result.has_value());
        CHECK(out.result->kind() == EventKind::messageEdited);
        CHECK(out.result->message().content == "revised");
        CHECK(out.result->message().isEdited());
    }

    SECTION("Others cannot edit or delete")
    {
        Outcome edit;
        store->editMessage("bob", general, id, "hijack", edit.handler());
        REQUIRE_FALSE(edit.result.has_value());
        CHECK(edit.result.error() == LiveErrc::unauthorized);

        Outcome del;
        store->deleteMessage("bob", general, id, del.handler());
        REQUIRE_FALSE(del.result.has_value());
        CHECK(del.result.error() == LiveErrc::unauthorized);
        CHECK(store->messageCount() == 1);
    }

    SECTION("Author deletes")
    {
        Outcome out;
        store->deleteMessage("alice", general, id, out.handler());
        REQUIRE(out.result.has_value());
        CHECK(out.result->kind() == EventKind::messageDeleted);
        CHECK(out.result->messageId() == id);
        CHECK(store->messageCount() == 0);
        CHECK(listRecent(*store, general, 10).empty());
    }

    SECTION("Messages are scoped to their topic")
    {
        Outcome out;
        store->editMessage("alice", TopicUri::channel("random"), id, "x",
                           out.handler());
        REQUIRE_FALSE(out.result.has_value());
        CHECK(out.result.error() == LiveErrc::noSuchMessage);
        CHECK(out.result.error() == LiveErrc::notFound);
    }
}

//------------------------------------------------------------------------------
TEST_CASE( "Reactions", "[MessageStore]" )
{
    auto store = MemoryMessageStore::create();
    auto general = TopicUri::channel("general");
    auto id = post(*store, general, "alice", "react to me");

    Outcome added;
    store->addReaction("bob", general, id, "+1", added.handler());
    REQUIRE(added.result.has_value());
    CHECK(added.result->kind() == EventKind::reactionAdded);
    CHECK(added.result->reaction() == ReactionRecord{id, "+1", "bob"});

    Outcome duplicate;
    store->addReaction("bob", general, id, "+1", duplicate.handler());
    CHECK_FALSE(duplicate.result.has_value());

    Outcome foreign;
    store->removeReaction("carol", general, id, "+1", foreign.handler());
    REQUIRE_FALSE(foreign.result.has_value());
    CHECK(foreign.result.error() == LiveErrc::unauthorized);

    Outcome missing;
    store->removeReaction("carol", general, id, "heart", missing.handler());
    REQUIRE_FALSE(missing.result.has_value());
    CHECK(missing.result.error() == LiveErrc::noSuchReaction);

    Outcome removed;
    store->removeReaction("bob", general, id, "+1", removed.handler());
    REQUIRE(removed.result.has_value());
    CHECK(removed.result->kind() == EventKind::reactionRemoved);
}

//------------------------------------------------------------------------------
TEST_CASE( "Threads and read receipts", "[MessageStore]" )
{
    auto store = MemoryMessageStore::create();
    auto general = TopicUri::channel("general");
    auto root = post(*store, general, "alice", "root");

    Outcome reply;
    store->createThreadReply("bob", general, root, "reply", {},
                             reply.handler());
    REQUIRE(reply.result.has_value());
    CHECK(reply.result->kind() == EventKind::threadReplyCreated);
    CHECK(reply.result->message().threadId == root);

    Outcome nested;
    store->createThreadReply("carol", general, reply.result->message().id,
                             "nested", {}, nested.handler());
    REQUIRE(nested.result.has_value());
    CHECK(nested.result->message().threadId == root);

    Outcome orphan;
    store->createThreadReply("bob", general, "nope", "lost", {},
                             orphan.handler());
    REQUIRE_FALSE(orphan.result.has_value());
    CHECK(orphan.result.error() == LiveErrc::noSuchMessage);

    CHECK(contentsOf(listRecent(*store, general, 10)) ==
          std::vector<std::string>{"root"});

    Outcome read;
    store->markRead("bob", general, root, read.handler());
    REQUIRE(read.result.has_value());
    CHECK(read.result->kind() == EventKind::messageRead);
    CHECK(read.result->originator() == "bob");
    CHECK(store->lastRead("bob", general) == root);
    CHECK(store->lastRead("carol", general).empty());
}

//------------------------------------------------------------------------------
TEST_CASE( "Paging through history", "[MessageStore]" )
{
    auto store = MemoryMessageStore::create();
    auto general = TopicUri::channel("general");
    std::vector<MessageId> ids;
    for (int i = 1; i <= 6; ++i)
        ids.push_back(post(*store, general, "alice", "m" + std::to_string(i)));
    post(*store, TopicUri::channel("random"), "bob", "elsewhere");

    CHECK(contentsOf(listRecent(*store, general, 3)) ==
          std::vector<std::string>{"m4", "m5", "m6"});
    CHECK(listRecent(*store, general, 10).size() == 6);
    CHECK(listRecent(*store, TopicUri::channel("empty"), 10).empty());

    MessageList older;
    store->listBefore(general, ids[3], 2,
                      [&older](ErrorOr<MessageList> r) {older = r.value();});
    CHECK(contentsOf(older) == std::vector<std::string>{"m2", "m3"});

    std::error_code ec;
    store->listBefore(general, "unknown", 2,
                      [&ec](ErrorOr<MessageList> r) {ec = r.error();});
    CHECK(ec == LiveErrc::noSuchMessage);
}
