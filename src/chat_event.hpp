#pragma once
#include "irc_message.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace streamtap {

struct BadgeRef {
    std::string set_id;
    std::string version;

    bool operator==(const BadgeRef& o) const {
        return set_id == o.set_id && version == o.version;
    }
};

enum class TokenKind { Text, Emote };

struct ChatToken {
    TokenKind kind = TokenKind::Text;
    std::string text;
    std::string emote_id; // platform emote id, Emote tokens only
};

struct ChatEvent {
    std::string id;                   // server message id, may be empty
    std::string channel;              // lowercase, without '#'
    std::string user;                 // display name, falls back to login
    std::string login;
    std::optional<std::string> color; // "#RRGGBB"
    std::vector<BadgeRef> badges;
    std::vector<ChatToken> tokens;
    std::string text;
    bool action = false;              // "/me" message
    int64_t server_timestamp = 0;     // tmi-sent-ts, ms
    int64_t received_at = 0;          // local epoch ms
};

// "broadcaster/1,subscriber/12" -> refs, in tag order. Malformed items are skipped.
std::vector<BadgeRef> parse_badges_tag(const std::string& value);

// Split the body into Text and Emote tokens. emotes_tag is the platform
// "id:start-end,start-end/id:start-end" tag; positions are code points.
// Out-of-range or overlapping ranges are ignored.
std::vector<ChatToken> tokenize_body(const std::string& text, const std::string& emotes_tag);

// Build an event from a PRIVMSG. nullopt when the line lacks channel or body.
std::optional<ChatEvent> chat_event_from_privmsg(const IrcMessage& msg, int64_t received_at);

} // namespace streamtap
