#include <catch2/catch.hpp>
#include "chat_event.hpp"

using namespace streamtap;

static IrcMessage parse(const std::string& line) {
    auto msg = parse_irc_line(line);
    REQUIRE(msg.has_value());
    return *msg;
}

// ── parse_badges_tag ────────────────────────────────────────────

TEST_CASE("parse_badges_tag: set/version pairs in order", "[chat_event]") {
    auto badges = parse_badges_tag("broadcaster/1,subscriber/12,premium/1");
    REQUIRE(badges.size() == 3);
    REQUIRE(badges[0] == BadgeRef{"broadcaster", "1"});
    REQUIRE(badges[1] == BadgeRef{"subscriber", "12"});
    REQUIRE(badges[2] == BadgeRef{"premium", "1"});
}

TEST_CASE("parse_badges_tag: malformed items skipped", "[chat_event]") {
    auto badges = parse_badges_tag("broken,/1,vip/,moderator/1");
    REQUIRE(badges.size() == 1);
    REQUIRE(badges[0].set_id == "moderator");
    REQUIRE(parse_badges_tag("").empty());
}

// ── tokenize_body ───────────────────────────────────────────────

TEST_CASE("tokenize_body: no emotes splits into words", "[chat_event]") {
    auto tokens = tokenize_body("hello  there world", "");
    REQUIRE(tokens.size() == 3);
    REQUIRE(tokens[0].kind == TokenKind::Text);
    REQUIRE(tokens[1].text == "there");
}

TEST_CASE("tokenize_body: emote ranges become emote tokens", "[chat_event]") {
    // "Kappa hi Kappa PogChamp"
    auto tokens = tokenize_body("Kappa hi Kappa PogChamp", "25:0-4,9-13/88:15-22");
    REQUIRE(tokens.size() == 4);
    REQUIRE(tokens[0].kind == TokenKind::Emote);
    REQUIRE(tokens[0].text == "Kappa");
    REQUIRE(tokens[0].emote_id == "25");
    REQUIRE(tokens[1].kind == TokenKind::Text);
    REQUIRE(tokens[1].text == "hi");
    REQUIRE(tokens[2].emote_id == "25");
    REQUIRE(tokens[3].kind == TokenKind::Emote);
    REQUIRE(tokens[3].text == "PogChamp");
    REQUIRE(tokens[3].emote_id == "88");
}

TEST_CASE("tokenize_body: positions count code points", "[chat_event]") {
    // "é Kappa": é is two bytes but one code point.
    auto tokens = tokenize_body("\xc3\xa9 Kappa", "25:2-6");
    REQUIRE(tokens.size() == 2);
    REQUIRE(tokens[0].text == "\xc3\xa9");
    REQUIRE(tokens[1].kind == TokenKind::Emote);
    REQUIRE(tokens[1].text == "Kappa");
}

TEST_CASE("tokenize_body: bad ranges are ignored", "[chat_event]") {
    SECTION("out of range") {
        auto tokens = tokenize_body("hi", "25:0-40");
        REQUIRE(tokens.size() == 1);
        REQUIRE(tokens[0].kind == TokenKind::Text);
    }
    SECTION("overlapping") {
        auto tokens = tokenize_body("Kappa x", "25:0-4/26:2-6");
        REQUIRE(tokens.size() == 2);
        REQUIRE(tokens[0].emote_id == "25");
        REQUIRE(tokens[1].text == "x");
    }
    SECTION("garbage") {
        auto tokens = tokenize_body("a b", "nope:/x:1-a/:0-1");
        REQUIRE(tokens.size() == 2);
    }
}

// ── chat_event_from_privmsg ─────────────────────────────────────

TEST_CASE("chat_event_from_privmsg: full tag set", "[chat_event]") {
    auto msg = parse(
        "@badges=moderator/1,subscriber/6;color=#1E90FF;display-name=Viewer_One;"
        "emotes=25:0-4;id=abc-1;tmi-sent-ts=1700000000123 "
        ":viewer_one!viewer_one@viewer_one.tmi.twitch.tv PRIVMSG #Alpha :Kappa nice");
    auto ev = chat_event_from_privmsg(msg, 42);
    REQUIRE(ev.has_value());
    REQUIRE(ev->id == "abc-1");
    REQUIRE(ev->channel == "alpha");
    REQUIRE(ev->user == "Viewer_One");
    REQUIRE(ev->login == "viewer_one");
    REQUIRE(ev->color == std::optional<std::string>("#1E90FF"));
    REQUIRE(ev->badges.size() == 2);
    REQUIRE(ev->text == "Kappa nice");
    REQUIRE(ev->tokens.size() == 2);
    REQUIRE(ev->tokens[0].kind == TokenKind::Emote);
    REQUIRE(ev->server_timestamp == 1700000000123);
    REQUIRE(ev->received_at == 42);
    REQUIRE_FALSE(ev->action);
}

TEST_CASE("chat_event_from_privmsg: missing tags fall back", "[chat_event]") {
    auto ev = chat_event_from_privmsg(parse(":someone!someone@x PRIVMSG #alpha :hi"), 0);
    REQUIRE(ev.has_value());
    REQUIRE(ev->id.empty());
    REQUIRE(ev->user == "someone");
    REQUIRE_FALSE(ev->color.has_value());
    REQUIRE(ev->badges.empty());
    REQUIRE(ev->server_timestamp == 0);
}

TEST_CASE("chat_event_from_privmsg: /me action", "[chat_event]") {
    auto ev = chat_event_from_privmsg(
        parse("@emotes=25:0-4 :a!a@a PRIVMSG #alpha :\x01" "ACTION Kappa waves\x01"), 0);
    REQUIRE(ev.has_value());
    REQUIRE(ev->action);
    REQUIRE(ev->text == "Kappa waves");
    REQUIRE(ev->tokens[0].kind == TokenKind::Emote);
    REQUIRE(ev->tokens[0].text == "Kappa");
}

TEST_CASE("chat_event_from_privmsg: rejects incomplete messages", "[chat_event]") {
    REQUIRE_FALSE(chat_event_from_privmsg(parse(":a!a@a PRIVMSG #alpha"), 0).has_value());
    REQUIRE_FALSE(chat_event_from_privmsg(parse(":a!a@a PRIVMSG alpha :hi"), 0).has_value());
}
