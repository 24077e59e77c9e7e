#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace streamtap {

nlohmann::json Config::defaults_json() {
    ChatConfig chat;
    BridgeConfig bridge;
    EmotesConfig emotes;
    return {
        {"chat", {
            {"host", chat.host},
            {"port", chat.port},
            {"connect_timeout_sec", chat.connect_timeout_sec},
            {"reconnect_delay_ms", chat.reconnect_delay_ms},
            {"max_reconnect_attempts", chat.max_reconnect_attempts},
            {"history_capacity", chat.history_capacity},
            {"dedup_capacity", chat.dedup_capacity},
            {"ping_interval_sec", chat.ping_interval_sec}
        }},
        {"bridge", {
            {"user_agent", bridge.user_agent},
            {"referer", bridge.referer},
            {"timeout_sec", bridge.timeout_sec},
            {"workers", bridge.workers}
        }},
        {"emotes", {
            {"client_id", ""},
            {"gql_client_id", emotes.gql_client_id},
            {"providers", emotes.providers},
            {"timeout_sec", emotes.timeout_sec}
        }},
        {"auth", {
            {"access_token", ""},
            {"login", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Values outside [min, max of T] keep the default.
template<typename T>
static void read_uint(const nlohmann::json& obj, const char* key, T& out, uint64_t min = 0) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return;
    uint64_t value = obj[key].get<uint64_t>();
    if (value < min || value > std::numeric_limits<T>::max()) {
        std::cerr << "[config] Ignoring out-of-range " << key << ": " << value << "\n";
        return;
    }
    out = static_cast<T>(value);
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("chat") && j["chat"].is_object()) {
        auto& c = j["chat"];
        read_string(c, "host", cfg.chat.host);
        read_uint(c, "port", cfg.chat.port, 1);
        read_uint(c, "connect_timeout_sec", cfg.chat.connect_timeout_sec);
        read_uint(c, "reconnect_delay_ms", cfg.chat.reconnect_delay_ms);
        read_uint(c, "max_reconnect_attempts", cfg.chat.max_reconnect_attempts);
        read_uint(c, "history_capacity", cfg.chat.history_capacity, 1);
        read_uint(c, "dedup_capacity", cfg.chat.dedup_capacity, 1);
        read_uint(c, "ping_interval_sec", cfg.chat.ping_interval_sec);
    }

    if (j.contains("bridge") && j["bridge"].is_object()) {
        auto& b = j["bridge"];
        read_string(b, "user_agent", cfg.bridge.user_agent);
        read_string(b, "referer", cfg.bridge.referer);
        read_uint(b, "timeout_sec", cfg.bridge.timeout_sec);
        read_uint(b, "workers", cfg.bridge.workers, 1);
    }

    if (j.contains("emotes") && j["emotes"].is_object()) {
        auto& e = j["emotes"];
        read_string(e, "client_id", cfg.emotes.client_id);
        read_string(e, "gql_client_id", cfg.emotes.gql_client_id);
        read_uint(e, "timeout_sec", cfg.emotes.timeout_sec);
        if (e.contains("providers") && e["providers"].is_array()) {
            cfg.emotes.providers.clear();
            for (const auto& p : e["providers"])
                if (p.is_string()) cfg.emotes.providers.push_back(p.get<std::string>());
        }
    }

    if (j.contains("auth") && j["auth"].is_object()) {
        auto& a = j["auth"];
        read_string(a, "access_token", cfg.auth.access_token);
        read_string(a, "login", cfg.auth.login);
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.streamtap/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            // Config file is malformed, fall back to defaults
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("STREAMTAP_ACCESS_TOKEN"))
        cfg.auth.access_token = v;
    if (const char* v = std::getenv("STREAMTAP_LOGIN"))
        cfg.auth.login = v;
    if (const char* v = std::getenv("TWITCH_CLIENT_ID"))
        cfg.emotes.client_id = v;
    if (const char* v = std::getenv("STREAMTAP_CHAT_HOST"))
        cfg.chat.host = v;

    return cfg;
}

} // namespace streamtap
