#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace streamtap {

struct ChatConfig {
    std::string host = "irc.chat.twitch.tv";
    uint16_t port = 6697;
    uint32_t connect_timeout_sec = 10;
    uint32_t reconnect_delay_ms = 2000;
    uint32_t max_reconnect_attempts = 0; // 0 = retry forever while a channel is selected
    uint32_t history_capacity = 200;
    uint32_t dedup_capacity = 500;
    uint32_t ping_interval_sec = 30;     // 0 disables client keepalive
};

struct BridgeConfig {
    std::string user_agent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/131.0.0.0 Safari/537.36";
    std::string referer = "https://www.twitch.tv/";
    uint32_t timeout_sec = 20;
    uint32_t workers = 4;
};

struct EmotesConfig {
    std::string client_id;                  // Helix app client id
    std::string gql_client_id = "kd1unb4b3q4t58fwlpcbzcbnm76a8fp";
    std::vector<std::string> providers = {"7tv", "bttv", "ffz"};
    uint32_t timeout_sec = 15;
};

struct AuthConfig {
    std::string access_token;
    std::string login;
};

struct Config {
    ChatConfig chat;
    BridgeConfig bridge;
    EmotesConfig emotes;
    AuthConfig auth;

    // Load from ~/.streamtap/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build a Config from already-merged JSON (no env overrides)
    static Config from_json(const nlohmann::json& j);
};

} // namespace streamtap
