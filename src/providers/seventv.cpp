#include "seventv.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>

static streamtap::EmoteProviderRegistrar reg_seventv("7tv",
    [](streamtap::HttpClient& http, const streamtap::EmotesConfig& config) {
        return std::make_unique<streamtap::SevenTvProvider>(
            http, static_cast<long>(config.timeout_sec));
    });

using json = nlohmann::json;

namespace streamtap {

namespace {

void add_emotes(const json& list, std::vector<Emote>& out) {
    if (!list.is_array()) return;
    for (const auto& e : list) {
        if (!e.is_object()) continue;
        std::string name = e.value("name", "");
        std::string host;
        if (e.contains("data") && e["data"].is_object() &&
            e["data"].contains("host") && e["data"]["host"].is_object()) {
            host = e["data"]["host"].value("url", "");
        }
        if (name.empty() || host.empty()) continue;
        // host.url is protocol-relative: //cdn.7tv.app/emote/<id>
        out.push_back(Emote{name, "https:" + host + "/2x.webp"});
    }
}

} // namespace

SevenTvProvider::SevenTvProvider(HttpClient& http, long timeout_seconds)
    : http_(http), timeout_seconds_(timeout_seconds) {}

std::vector<Emote> SevenTvProvider::parse_emote_set(const std::string& body) {
    json j = json::parse(body);
    std::vector<Emote> out;
    if (j.contains("emotes")) add_emotes(j["emotes"], out);
    return out;
}

std::vector<Emote> SevenTvProvider::parse_user(const std::string& body) {
    json j = json::parse(body);
    std::vector<Emote> out;
    if (j.contains("emote_set") && j["emote_set"].is_object() &&
        j["emote_set"].contains("emotes")) {
        add_emotes(j["emote_set"]["emotes"], out);
    }
    return out;
}

std::vector<Emote> SevenTvProvider::fetch_global() {
    auto body = provider_get(http_, "https://7tv.io/v3/emote-sets/global", timeout_seconds_);
    return body ? parse_emote_set(*body) : std::vector<Emote>{};
}

std::vector<Emote> SevenTvProvider::fetch_channel(const std::string& channel_id) {
    auto body = provider_get(http_, "https://7tv.io/v3/users/twitch/" + channel_id,
                             timeout_seconds_);
    return body ? parse_user(*body) : std::vector<Emote>{};
}

} // namespace streamtap
