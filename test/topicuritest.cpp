/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <sstream>
#include <catch2/catch.hpp>
#include <cpplive/topicuri.hpp>

using namespace live;

//------------------------------------------------------------------------------
TEST_CASE( "Parsing well-formed topic names", "[TopicUri]" )
{
    auto ws = TopicUri::parse("workspace:acme");
    REQUIRE(ws.has_value());
    CHECK(ws->kind() == TopicKind::workspace);
    CHECK(ws->id() == "acme");
    CHECK(ws->str() == "workspace:acme");
    CHECK(*ws == TopicUri::workspace("acme"));

    auto ch = TopicUri::parse("channel:general");
    REQUIRE(ch.has_value());
    CHECK(ch->kind() == TopicKind::channel);
    CHECK(ch->id() == "general");
    CHECK(*ch == TopicUri::channel("general"));
    CHECK(*ch != TopicUri::workspace("general"));

    std::ostringstream oss;
    oss << *ch;
    CHECK(oss.str() == "channel:general");
}

//------------------------------------------------------------------------------
TEST_CASE( "Rejecting malformed topic names", "[TopicUri]" )
{
    const char* names[] =
    {
        "",
        "general",
        "channel:",
        "channel",
        "room:general",
        "Channel:general",
        "channel:a:b",
        "channel:gen eral",
        "channel:gen\teral",
        ":general"
    };

    for (const char* name: names)
    {
        INFO("Name: '" << name << "'");
        auto uri = TopicUri::parse(name);
        REQUIRE_FALSE(uri.has_value());
        CHECK(uri.error() == LiveErrc::noSuchTopic);
        CHECK(uri.error() == LiveErrc::notFound);
    }
}

//------------------------------------------------------------------------------
TEST_CASE( "TopicUri ordering and emptiness", "[TopicUri]" )
{
    TopicUri blank;
    CHECK(blank.empty());
    CHECK_FALSE(TopicUri::channel("x").empty());

    // Used as map keys, so a strict weak ordering is needed.
    auto a = TopicUri::channel("a");
    auto b = TopicUri::channel("b");
    auto w = TopicUri::workspace("a");
    CHECK(a < b);
    CHECK_FALSE(b < a);
    CHECK_FALSE(a < a);
    CHECK((a < w) != (w < a));
}
