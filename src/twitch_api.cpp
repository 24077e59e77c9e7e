#include "twitch_api.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace streamtap {

static const char* kGlobalBadgesQuery =
    "query Badges { badges { imageURL(size: DOUBLE) setID title version } }";

static const char* kChannelBadgesQuery =
    "query UserBadges($id: ID) { user(id: $id, lookupType: ALL) { "
    "broadcastBadges { imageURL(size: DOUBLE) setID title version } } }";

TwitchApi::TwitchApi(HttpClient& http, SessionManager& session, EmotesConfig config)
    : http_(http),
      session_(session),
      config_(std::move(config)),
      device_id_(random_digits(32)) {}

std::vector<Header> TwitchApi::helix_headers() const {
    std::vector<Header> headers = {
        {"Client-Id", config_.client_id},
        {"Accept", "application/json"},
    };
    auto user = session_.user();
    if (user) headers.emplace_back("Authorization", "Bearer " + user->access_token);
    return headers;
}

std::vector<Header> TwitchApi::gql_headers() const {
    return {
        {"Client-Id", config_.gql_client_id},
        {"X-Device-Id", device_id_},
        {"Accept", "application/json"},
        {"Content-Type", "application/json"},
        {"Origin", "https://www.twitch.tv"},
        {"Referer", "https://www.twitch.tv/"},
    };
}

std::string TwitchApi::helix_get(const std::string& url) {
    if (config_.client_id.empty()) {
        throw std::runtime_error("helix: no client id configured");
    }
    if (!session_.logged_in()) {
        throw std::runtime_error("helix: sign in required");
    }
    auto resp = http_.get(url, helix_headers(), static_cast<long>(config_.timeout_sec));
    if (resp.status_code < 200 || resp.status_code >= 300) {
        throw std::runtime_error("Helix API error " + std::to_string(resp.status_code) +
                                 ": " + resp.body);
    }
    return resp.body;
}

std::string TwitchApi::gql_post(const std::string& payload) {
    auto resp = http_.post(kGqlUrl, payload, gql_headers(),
                           static_cast<long>(config_.timeout_sec));
    if (resp.status_code < 200 || resp.status_code >= 300) {
        throw std::runtime_error("GQL error " + std::to_string(resp.status_code) +
                                 ": " + resp.body);
    }
    return resp.body;
}

std::vector<Emote> TwitchApi::global_emotes() {
    return parse_helix_emotes(helix_get(std::string(kHelixUrl) + "/chat/emotes/global"));
}

std::vector<Emote> TwitchApi::channel_emotes(const std::string& channel_id) {
    return parse_helix_emotes(
        helix_get(std::string(kHelixUrl) + "/chat/emotes?broadcaster_id=" + channel_id));
}

BadgeSet TwitchApi::global_badges() {
    json payload = {{"query", kGlobalBadgesQuery}, {"variables", json::object()}};
    return parse_gql_badges(gql_post(payload.dump()));
}

BadgeSet TwitchApi::channel_badges(const std::string& channel_id) {
    json payload = {{"query", kChannelBadgesQuery}, {"variables", {{"id", channel_id}}}};
    return parse_gql_channel_badges(gql_post(payload.dump()));
}

} // namespace streamtap
