#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace streamtap {

struct Emote {
    std::string name;
    std::string url;
};

// Token -> image URL
using EmoteMap = std::unordered_map<std::string, std::string>;

// Later entries win on duplicate names.
EmoteMap to_emote_map(const std::vector<Emote>& emotes);

// CDN image for a platform emote id (the ids carried by the chat "emotes" tag).
std::string platform_emote_url(const std::string& emote_id);

struct Badge {
    std::string set_id;
    std::string version;
    std::string title;
    std::string image_url;
};

class BadgeSet {
public:
    // Replaces an existing entry with the same set/version.
    void add(Badge badge);

    const Badge* find(const std::string& set_id, const std::string& version) const;

    size_t size() const { return badges_.size(); }
    bool empty() const { return badges_.empty(); }

private:
    static std::string key(const std::string& set_id, const std::string& version) {
        return set_id + "/" + version;
    }

    std::unordered_map<std::string, Badge> badges_;
};

// ── Platform response parsers ──────────────────────────────────
// These throw nlohmann::json::exception on malformed JSON and
// std::runtime_error on a well-formed body of the wrong shape.

// Helix /chat/emotes and /chat/emotes/global: data[].name + images.url_2x
std::vector<Emote> parse_helix_emotes(const std::string& body);

// GQL { badges { setID version title imageURL } }
BadgeSet parse_gql_badges(const std::string& body);

// GQL { user { broadcastBadges { ... } } }; a null user is an empty set.
BadgeSet parse_gql_channel_badges(const std::string& body);

} // namespace streamtap
