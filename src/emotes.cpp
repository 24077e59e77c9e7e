#include "emotes.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace streamtap {

EmoteMap to_emote_map(const std::vector<Emote>& emotes) {
    EmoteMap map;
    map.reserve(emotes.size());
    for (const auto& e : emotes) {
        if (e.name.empty() || e.url.empty()) continue;
        map[e.name] = e.url;
    }
    return map;
}

std::string platform_emote_url(const std::string& emote_id) {
    return "https://static-cdn.jtvnw.net/emoticons/v2/" + emote_id + "/default/dark/2.0";
}

void BadgeSet::add(Badge badge) {
    std::string k = key(badge.set_id, badge.version);
    badges_[k] = std::move(badge);
}

const Badge* BadgeSet::find(const std::string& set_id, const std::string& version) const {
    auto it = badges_.find(key(set_id, version));
    return it == badges_.end() ? nullptr : &it->second;
}

std::vector<Emote> parse_helix_emotes(const std::string& body) {
    json j = json::parse(body);
    if (!j.contains("data") || !j["data"].is_array()) {
        throw std::runtime_error("helix emotes: missing data array");
    }

    std::vector<Emote> out;
    for (const auto& item : j["data"]) {
        Emote e;
        e.name = item.value("name", "");
        if (item.contains("images") && item["images"].is_object()) {
            const auto& images = item["images"];
            e.url = images.value("url_2x", "");
            if (e.url.empty()) e.url = images.value("url_1x", "");
        }
        if (e.name.empty() || e.url.empty()) continue;
        out.push_back(std::move(e));
    }
    return out;
}

static void add_gql_badges(const json& list, BadgeSet& set) {
    for (const auto& item : list) {
        if (!item.is_object()) continue;
        Badge b;
        b.set_id = item.value("setID", "");
        b.version = item.value("version", "");
        b.title = item.value("title", "");
        b.image_url = item.value("imageURL", "");
        if (b.set_id.empty() || b.version.empty() || b.image_url.empty()) continue;
        set.add(std::move(b));
    }
}

BadgeSet parse_gql_badges(const std::string& body) {
    json j = json::parse(body);
    if (!j.contains("data") || !j["data"].is_object() ||
        !j["data"].contains("badges") || !j["data"]["badges"].is_array()) {
        throw std::runtime_error("gql badges: missing data.badges");
    }
    BadgeSet set;
    add_gql_badges(j["data"]["badges"], set);
    return set;
}

BadgeSet parse_gql_channel_badges(const std::string& body) {
    json j = json::parse(body);
    if (!j.contains("data") || !j["data"].is_object()) {
        throw std::runtime_error("gql channel badges: missing data");
    }
    BadgeSet set;
    const auto& data = j["data"];
    if (!data.contains("user") || data["user"].is_null()) return set;
    const auto& user = data["user"];
    if (user.contains("broadcastBadges") && user["broadcastBadges"].is_array()) {
        add_gql_badges(user["broadcastBadges"], set);
    }
    return set;
}

} // namespace streamtap
