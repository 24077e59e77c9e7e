#include "ffz.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>

static streamtap::EmoteProviderRegistrar reg_ffz("ffz",
    [](streamtap::HttpClient& http, const streamtap::EmotesConfig& config) {
        return std::make_unique<streamtap::FfzProvider>(
            http, static_cast<long>(config.timeout_sec));
    });

using json = nlohmann::json;

namespace streamtap {

FfzProvider::FfzProvider(HttpClient& http, long timeout_seconds)
    : http_(http), timeout_seconds_(timeout_seconds) {}

std::vector<Emote> FfzProvider::parse_room(const std::string& body) {
    json j = json::parse(body);
    std::vector<Emote> out;
    if (!j.contains("sets") || !j["sets"].is_object()) return out;

    for (const auto& [set_id, set] : j["sets"].items()) {
        if (!set.is_object() || !set.contains("emoticons") || !set["emoticons"].is_array())
            continue;
        for (const auto& e : set["emoticons"]) {
            if (!e.is_object()) continue;
            std::string name = e.value("name", "");
            if (name.empty() || !e.contains("urls") || !e["urls"].is_object()) continue;
            const auto& urls = e["urls"];
            std::string url;
            if (urls.contains("2") && urls["2"].is_string()) {
                url = urls["2"].get<std::string>();
            } else if (urls.contains("1") && urls["1"].is_string()) {
                url = urls["1"].get<std::string>();
            }
            if (url.empty()) continue;
            if (url.compare(0, 4, "http") != 0) url = "https:" + url;
            out.push_back(Emote{name, url});
        }
    }
    return out;
}

std::vector<Emote> FfzProvider::fetch_channel(const std::string& channel_id) {
    auto body = provider_get(http_, "https://api.frankerfacez.com/v1/room/id/" + channel_id,
                             timeout_seconds_);
    return body ? parse_room(*body) : std::vector<Emote>{};
}

} // namespace streamtap
