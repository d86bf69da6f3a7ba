/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <thread>
#include <vector>
#include <catch2/catch.hpp>
#include <cpplive/internal/typingcoordinator.hpp>
#include "livetesting.hpp"

using namespace live;
using namespace live::internal;
using namespace test;
using Kinds = std::vector<EventKind>;

//------------------------------------------------------------------------------
TEST_CASE( "Typing start and stop", "[Typing]" )
{
    IoContext ioctx;
    TopicBroadcaster broadcaster;
    auto recorder = EventRecorder::create();
    broadcaster.subscribeAtTail(recorder);
    TypingCoordinator typing{boost::asio::make_strand(ioctx), broadcaster,
                             ms(5000)};

    SECTION("Repeated starts are debounced")
    {
        CHECK(typing.start("alice"));
        CHECK_FALSE(typing.start("alice"));
        CHECK_FALSE(typing.start("alice"));
        CHECK(typing.isTyping("alice"));
        CHECK(typing.activeCount() == 1);
        CHECK(recorder->kinds() == Kinds{EventKind::typingStarted});
        CHECK(recorder->events.front()->originator() == "alice");
    }

    SECTION("Identities are independent")
    {
        CHECK(typing.start("alice"));
        CHECK(typing.start("bob"));
        CHECK(typing.stop("alice"));
        CHECK_FALSE(typing.isTyping("alice"));
        CHECK(typing.isTyping("bob"));
        CHECK(recorder->kinds() == Kinds{EventKind::typingStarted,
                                         EventKind::typingStarted,
                                         EventKind::typingStopped});
    }

    SECTION("Stopping publishes only when typing")
    {
        CHECK_FALSE(typing.stop("alice"));
        CHECK(recorder->events.empty());

        typing.start("alice");
        CHECK(typing.stop("alice"));
        CHECK_FALSE(typing.stop("alice"));
        CHECK(recorder->count(EventKind::typingStopped) == 1);
        CHECK(typing.activeCount() == 0);
    }

    SECTION("Reset discards states silently")
    {
        typing.start("alice");
        typing.start("bob");
        recorder->events.clear();
        typing.reset();
        CHECK(typing.activeCount() == 0);
        CHECK_FALSE(typing.isTyping("alice"));
        runFor(ioctx, ms(50));
        CHECK(recorder->events.empty());

        CHECK(typing.start("alice"));
        CHECK(recorder->kinds() == Kinds{EventKind::typingStarted});
    }
}

//------------------------------------------------------------------------------
TEST_CASE( "Typing expiry", "[Typing][Timeout]" )
{
    IoContext ioctx;
    TopicBroadcaster broadcaster;
    auto recorder = EventRecorder::create();
    broadcaster.subscribeAtTail(recorder);

    SECTION("Typing lapses after the timeout")
    {
        TypingCoordinator typing{boost::asio::make_strand(ioctx), broadcaster,
                                 ms(50)};
        typing.start("alice");
        runFor(ioctx, ms(200));
        CHECK(recorder->kinds() == Kinds{EventKind::typingStarted,
                                         EventKind::typingStopped});
        CHECK_FALSE(typing.isTyping("alice"));
        CHECK(typing.activeCount() == 0);

        // A subsequent start is a new typing episode.
        CHECK(typing.start("alice"));
    }

    SECTION("Refreshing extends the expiry")
    {
        TypingCoordinator typing{boost::asio::make_strand(ioctx), broadcaster,
                                 ms(300)};
        typing.start("alice");
        runFor(ioctx, ms(200));
        CHECK_FALSE(typing.start("alice"));
        runFor(ioctx, ms(200));
        CHECK(typing.isTyping("alice"));
        CHECK(recorder->kinds() == Kinds{EventKind::typingStarted});

        runFor(ioctx, ms(400));
        CHECK(recorder->kinds() == Kinds{EventKind::typingStarted,
                                         EventKind::typingStopped});
    }

    SECTION("Explicit stop cancels the expiry")
    {
        TypingCoordinator typing{boost::asio::make_strand(ioctx), broadcaster,
                                 ms(50)};
        typing.start("alice");
        typing.stop("alice");
        runFor(ioctx, ms(150));
        CHECK(recorder->count(EventKind::typingStopped) == 1);
    }

    SECTION("Restarting after an unprocessed lapse")
    {
        TypingCoordinator typing{boost::asio::make_strand(ioctx), broadcaster,
                                 ms(20)};
        typing.start("alice");
        std::this_thread::sleep_for(ms(60));
        CHECK_FALSE(typing.isTyping("alice"));

        CHECK(typing.start("alice"));
        CHECK(recorder->kinds() == Kinds{EventKind::typingStarted,
                                         EventKind::typingStopped,
                                         EventKind::typingStarted});

        runFor(ioctx, ms(150));
        CHECK(recorder->kinds() == Kinds{EventKind::typingStarted,
                                         EventKind::typingStopped,
                                         EventKind::typingStarted,
                                         EventKind::typingStopped});
    }
}
