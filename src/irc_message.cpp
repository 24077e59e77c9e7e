#include "irc_message.hpp"
#include "util.hpp"

#include <cctype>

namespace streamtap {

std::string IrcMessage::tag(const std::string& key) const {
    auto it = tags.find(key);
    return it == tags.end() ? std::string() : it->second;
}

std::string IrcMessage::nick() const {
    size_t bang = prefix.find('!');
    return bang == std::string::npos ? prefix : prefix.substr(0, bang);
}

std::string IrcMessage::param(size_t index) const {
    return index < params.size() ? params[index] : std::string();
}

std::string unescape_tag_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '\\') {
            out += value[i];
            continue;
        }
        if (i + 1 >= value.size()) break; // lone trailing backslash is dropped
        char next = value[++i];
        switch (next) {
            case ':':  out += ';';  break;
            case 's':  out += ' ';  break;
            case '\\': out += '\\'; break;
            case 'r':  out += '\r'; break;
            case 'n':  out += '\n'; break;
            default:   out += next; break;
        }
    }
    return out;
}

static void parse_tags(const std::string& raw,
                       std::unordered_map<std::string, std::string>& tags) {
    size_t pos = 0;
    while (pos <= raw.size()) {
        size_t end = raw.find(';', pos);
        if (end == std::string::npos) end = raw.size();
        std::string item = raw.substr(pos, end - pos);
        if (!item.empty()) {
            size_t eq = item.find('=');
            if (eq == std::string::npos) {
                tags[item] = "";
            } else {
                tags[item.substr(0, eq)] = unescape_tag_value(item.substr(eq + 1));
            }
        }
        pos = end + 1;
    }
}

std::optional<IrcMessage> parse_irc_line(const std::string& line) {
    if (line.empty() || line.size() > kMaxIrcLineLength) return std::nullopt;

    IrcMessage msg;
    size_t pos = 0;

    if (line[pos] == '@') {
        size_t space = line.find(' ', pos);
        if (space == std::string::npos) return std::nullopt;
        parse_tags(line.substr(1, space - 1), msg.tags);
        pos = space + 1;
        while (pos < line.size() && line[pos] == ' ') ++pos;
    }

    if (pos < line.size() && line[pos] == ':') {
        size_t space = line.find(' ', pos);
        if (space == std::string::npos) return std::nullopt;
        msg.prefix = line.substr(pos + 1, space - pos - 1);
        pos = space + 1;
        while (pos < line.size() && line[pos] == ' ') ++pos;
    }

    size_t cmd_end = line.find(' ', pos);
    if (cmd_end == std::string::npos) cmd_end = line.size();
    msg.command = line.substr(pos, cmd_end - pos);
    if (msg.command.empty()) return std::nullopt;
    for (auto& c : msg.command) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    pos = cmd_end;

    while (pos < line.size()) {
        while (pos < line.size() && line[pos] == ' ') ++pos;
        if (pos >= line.size()) break;
        if (line[pos] == ':') {
            msg.params.push_back(line.substr(pos + 1));
            break;
        }
        size_t end = line.find(' ', pos);
        if (end == std::string::npos) end = line.size();
        msg.params.push_back(line.substr(pos, end - pos));
        pos = end;
    }

    return msg;
}

std::vector<std::string> take_irc_lines(std::string& buffer) {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t nl;
    while ((nl = buffer.find('\n', start)) != std::string::npos) {
        std::string line = buffer.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(std::move(line));
        start = nl + 1;
    }
    buffer.erase(0, start);
    return lines;
}

} // namespace streamtap
