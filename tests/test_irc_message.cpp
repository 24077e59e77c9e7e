#include <catch2/catch.hpp>
#include "irc_message.hpp"

using namespace streamtap;

// ── parse_irc_line ──────────────────────────────────────────────

TEST_CASE("parse_irc_line: tagged PRIVMSG", "[irc]") {
    auto msg = parse_irc_line(
        "@badge-info=;badges=broadcaster/1;color=#FF4500;display-name=Alpha;"
        "id=b34ccfc7-4977-403a-8a94-33c6bac34fb8;tmi-sent-ts=1507246572675 "
        ":alpha!alpha@alpha.tmi.twitch.tv PRIVMSG #alpha :Hello there Kappa");
    REQUIRE(msg.has_value());
    REQUIRE(msg->command == "PRIVMSG");
    REQUIRE(msg->prefix == "alpha!alpha@alpha.tmi.twitch.tv");
    REQUIRE(msg->nick() == "alpha");
    REQUIRE(msg->params.size() == 2);
    REQUIRE(msg->param(0) == "#alpha");
    REQUIRE(msg->trailing() == "Hello there Kappa");
    REQUIRE(msg->tag("color") == "#FF4500");
    REQUIRE(msg->tag("badges") == "broadcaster/1");
    REQUIRE(msg->has_tag("badge-info"));
    REQUIRE(msg->tag("badge-info").empty());
    REQUIRE_FALSE(msg->has_tag("missing"));
}

TEST_CASE("parse_irc_line: PING without prefix", "[irc]") {
    auto msg = parse_irc_line("PING :tmi.twitch.tv");
    REQUIRE(msg.has_value());
    REQUIRE(msg->command == "PING");
    REQUIRE(msg->prefix.empty());
    REQUIRE(msg->trailing() == "tmi.twitch.tv");
}

TEST_CASE("parse_irc_line: numeric and middle params", "[irc]") {
    auto msg = parse_irc_line(":tmi.twitch.tv 001 justinfan123 :Welcome, GLHF!");
    REQUIRE(msg.has_value());
    REQUIRE(msg->command == "001");
    REQUIRE(msg->nick() == "tmi.twitch.tv");
    REQUIRE(msg->params == std::vector<std::string>{"justinfan123", "Welcome, GLHF!"});
}

TEST_CASE("parse_irc_line: command is upper-cased, no params", "[irc]") {
    auto msg = parse_irc_line(":tmi.twitch.tv reconnect");
    REQUIRE(msg.has_value());
    REQUIRE(msg->command == "RECONNECT");
    REQUIRE(msg->params.empty());
    REQUIRE(msg->trailing().empty());
}

TEST_CASE("parse_irc_line: trailing keeps colons and spaces", "[irc]") {
    auto msg = parse_irc_line(":a!a@a PRIVMSG #c :: multiple  spaces : here");
    REQUIRE(msg.has_value());
    REQUIRE(msg->trailing() == ": multiple  spaces : here");
}

TEST_CASE("parse_irc_line: malformed lines are rejected", "[irc]") {
    REQUIRE_FALSE(parse_irc_line("").has_value());
    REQUIRE_FALSE(parse_irc_line("@tags-only").has_value());
    REQUIRE_FALSE(parse_irc_line(":prefix-only").has_value());
    REQUIRE_FALSE(parse_irc_line("@a=b :prefix").has_value());
    REQUIRE_FALSE(parse_irc_line(std::string(kMaxIrcLineLength + 1, 'A')).has_value());
}

// ── unescape_tag_value ──────────────────────────────────────────

TEST_CASE("unescape_tag_value: IRCv3 escapes", "[irc]") {
    REQUIRE(unescape_tag_value("hello\\sworld") == "hello world");
    REQUIRE(unescape_tag_value("a\\:b") == "a;b");
    REQUIRE(unescape_tag_value("back\\\\slash") == "back\\slash");
    REQUIRE(unescape_tag_value("cr\\rlf\\n") == "cr\rlf\n");
    REQUIRE(unescape_tag_value("unknown\\x") == "unknownx");
    REQUIRE(unescape_tag_value("dangling\\") == "dangling");
}

TEST_CASE("parse_irc_line: tag values are unescaped", "[irc]") {
    auto msg = parse_irc_line("@system-msg=5\\sraiders\\sfrom\\sX :tmi.twitch.tv USERNOTICE #c");
    REQUIRE(msg.has_value());
    REQUIRE(msg->tag("system-msg") == "5 raiders from X");
}

// ── take_irc_lines ──────────────────────────────────────────────

TEST_CASE("take_irc_lines: splits CRLF and keeps the partial tail", "[irc]") {
    std::string buf = "PING :a\r\n:x PRIVMSG #c :hi\r\n:x PRIV";
    auto lines = take_irc_lines(buf);
    REQUIRE(lines == std::vector<std::string>{"PING :a", ":x PRIVMSG #c :hi"});
    REQUIRE(buf == ":x PRIV");

    buf += "MSG #c :rest\n\r\n";
    lines = take_irc_lines(buf);
    REQUIRE(lines == std::vector<std::string>{":x PRIVMSG #c :rest"});
    REQUIRE(buf.empty());
}
