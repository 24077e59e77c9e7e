#include "chat_event.hpp"
#include "util.hpp"

#include <algorithm>

namespace streamtap {

namespace {

struct EmoteRange {
    size_t start;
    size_t end; // inclusive
    std::string id;
};

// Byte offset of every code point start, plus the total length at the end.
std::vector<size_t> code_point_offsets(const std::string& s) {
    std::vector<size_t> offsets;
    for (size_t i = 0; i < s.size(); ++i) {
        auto c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80) offsets.push_back(i);
    }
    offsets.push_back(s.size());
    return offsets;
}

bool parse_index(const std::string& s, size_t& out) {
    if (s.empty() || s.size() > 9) return false;
    size_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<size_t>(c - '0');
    }
    out = v;
    return true;
}

std::vector<EmoteRange> parse_emote_ranges(const std::string& tag) {
    std::vector<EmoteRange> ranges;
    for (const auto& group : split(tag, '/')) {
        size_t colon = group.find(':');
        if (colon == std::string::npos || colon == 0) continue;
        std::string id = group.substr(0, colon);
        for (const auto& span : split(group.substr(colon + 1), ',')) {
            size_t dash = span.find('-');
            if (dash == std::string::npos) continue;
            EmoteRange r{0, 0, id};
            if (!parse_index(span.substr(0, dash), r.start)) continue;
            if (!parse_index(span.substr(dash + 1), r.end)) continue;
            if (r.end < r.start) continue;
            ranges.push_back(std::move(r));
        }
    }
    std::sort(ranges.begin(), ranges.end(),
              [](const EmoteRange& a, const EmoteRange& b) { return a.start < b.start; });
    return ranges;
}

void append_words(const std::string& text, std::vector<ChatToken>& out) {
    for (const auto& word : split(text, ' ')) {
        if (word.empty()) continue;
        out.push_back(ChatToken{TokenKind::Text, word, {}});
    }
}

} // namespace

std::vector<BadgeRef> parse_badges_tag(const std::string& value) {
    std::vector<BadgeRef> badges;
    for (const auto& item : split(value, ',')) {
        size_t slash = item.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 >= item.size()) continue;
        badges.push_back(BadgeRef{item.substr(0, slash), item.substr(slash + 1)});
    }
    return badges;
}

std::vector<ChatToken> tokenize_body(const std::string& text, const std::string& emotes_tag) {
    std::vector<ChatToken> tokens;
    auto ranges = parse_emote_ranges(emotes_tag);
    if (ranges.empty()) {
        append_words(text, tokens);
        return tokens;
    }

    auto offsets = code_point_offsets(text);
    size_t cp_count = offsets.size() - 1;
    size_t cursor = 0; // next unconsumed code point

    for (const auto& r : ranges) {
        if (r.end >= cp_count) continue;
        if (r.start < cursor) continue; // overlaps the previous emote
        if (r.start > cursor)
            append_words(text.substr(offsets[cursor], offsets[r.start] - offsets[cursor]), tokens);
        tokens.push_back(ChatToken{
            TokenKind::Emote,
            text.substr(offsets[r.start], offsets[r.end + 1] - offsets[r.start]),
            r.id});
        cursor = r.end + 1;
    }
    if (cursor < cp_count)
        append_words(text.substr(offsets[cursor]), tokens);
    return tokens;
}

std::optional<ChatEvent> chat_event_from_privmsg(const IrcMessage& msg, int64_t received_at) {
    if (msg.params.size() < 2) return std::nullopt;
    const std::string& target = msg.params[0];
    if (target.size() < 2 || target[0] != '#') return std::nullopt;

    ChatEvent ev;
    ev.id = msg.tag("id");
    ev.channel = to_lower(target.substr(1));
    ev.login = to_lower(msg.nick());
    ev.user = msg.tag("display-name");
    if (ev.user.empty()) ev.user = ev.login;
    std::string color = msg.tag("color");
    if (!color.empty()) ev.color = color;
    ev.badges = parse_badges_tag(msg.tag("badges"));
    ev.received_at = received_at;

    std::string ts = msg.tag("tmi-sent-ts");
    if (!ts.empty()) {
        try {
            ev.server_timestamp = std::stoll(ts);
        } catch (const std::exception&) {
            ev.server_timestamp = 0;
        }
    }

    std::string body = msg.params[1];
    static const std::string kActionPrefix = "\x01" "ACTION ";
    if (body.size() > kActionPrefix.size() &&
        body.compare(0, kActionPrefix.size(), kActionPrefix) == 0) {
        ev.action = true;
        body = body.substr(kActionPrefix.size());
        if (!body.empty() && body.back() == '\x01') body.pop_back();
    }
    ev.text = body;
    // Emote positions count from the start of the visible text.
    ev.tokens = tokenize_body(body, msg.tag("emotes"));
    return ev;
}

} // namespace streamtap
