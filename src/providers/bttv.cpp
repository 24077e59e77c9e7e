#include "bttv.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>

static streamtap::EmoteProviderRegistrar reg_bttv("bttv",
    [](streamtap::HttpClient& http, const streamtap::EmotesConfig& config) {
        return std::make_unique<streamtap::BttvProvider>(
            http, static_cast<long>(config.timeout_sec));
    });

using json = nlohmann::json;

namespace streamtap {

static void add_bttv_emotes(const json& list, std::vector<Emote>& out) {
    if (!list.is_array()) return;
    for (const auto& e : list) {
        if (!e.is_object()) continue;
        std::string id = e.value("id", "");
        std::string code = e.value("code", "");
        if (id.empty() || code.empty()) continue;
        out.push_back(Emote{code, BttvProvider::emote_url(id)});
    }
}

BttvProvider::BttvProvider(HttpClient& http, long timeout_seconds)
    : http_(http), timeout_seconds_(timeout_seconds) {}

std::string BttvProvider::emote_url(const std::string& id) {
    return "https://cdn.betterttv.net/emote/" + id + "/2x.webp";
}

std::vector<Emote> BttvProvider::parse_global(const std::string& body) {
    std::vector<Emote> out;
    add_bttv_emotes(json::parse(body), out);
    return out;
}

std::vector<Emote> BttvProvider::parse_channel(const std::string& body) {
    json j = json::parse(body);
    std::vector<Emote> out;
    if (j.contains("channelEmotes")) add_bttv_emotes(j["channelEmotes"], out);
    if (j.contains("sharedEmotes")) add_bttv_emotes(j["sharedEmotes"], out);
    return out;
}

std::vector<Emote> BttvProvider::fetch_global() {
    auto body = provider_get(http_, "https://api.betterttv.net/3/cached/emotes/global",
                             timeout_seconds_);
    return body ? parse_global(*body) : std::vector<Emote>{};
}

std::vector<Emote> BttvProvider::fetch_channel(const std::string& channel_id) {
    auto body = provider_get(http_, "https://api.betterttv.net/3/cached/users/twitch/" + channel_id,
                             timeout_seconds_);
    return body ? parse_channel(*body) : std::vector<Emote>{};
}

} // namespace streamtap
