#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace streamtap {

// Longest line accepted from the server; longer ones are dropped.
constexpr size_t kMaxIrcLineLength = 16384;

// One IRC line: [@tags] [:prefix] COMMAND [params...] [:trailing]
// The trailing parameter, when present, is the last entry of params.
struct IrcMessage {
    std::unordered_map<std::string, std::string> tags; // values unescaped
    std::string prefix;                                  // without leading ':'
    std::string command;                                 // upper-cased
    std::vector<std::string> params;

    std::string tag(const std::string& key) const;
    bool has_tag(const std::string& key) const { return tags.count(key) != 0; }

    // Nick part of "nick!user@host"; the whole prefix for server prefixes.
    std::string nick() const;

    std::string param(size_t index) const;
    std::string trailing() const { return params.empty() ? std::string() : params.back(); }
};

// Parse a single line (without CR/LF). Returns nullopt for empty, oversized
// or structurally broken lines.
std::optional<IrcMessage> parse_irc_line(const std::string& line);

// IRCv3 tag value unescaping: \: \s \\ \r \n
std::string unescape_tag_value(const std::string& value);

// Move every complete CRLF/LF-terminated line out of buffer. A trailing
// partial line stays in buffer for the next read.
std::vector<std::string> take_irc_lines(std::string& buffer);

} // namespace streamtap
