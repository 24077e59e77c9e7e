#include "client.hpp"
#include "irc_transport.hpp"
#include "plugin.hpp"

#include <algorithm>
#include <iostream>

namespace streamtap {

static std::optional<UserSession> session_from_config(const AuthConfig& auth) {
    if (auth.access_token.empty() || auth.login.empty()) return std::nullopt;
    return UserSession{auth.access_token, auth.login};
}

static std::vector<std::shared_ptr<EmoteProvider>> enabled_providers(HttpClient& http,
                                                                     const EmotesConfig& config) {
    std::vector<std::shared_ptr<EmoteProvider>> out;
    for (auto& p : PluginRegistry::instance().create_enabled_providers(http, config)) {
        out.push_back(std::move(p));
    }
    return out;
}

Client::Client(Config config)
    : Client(std::move(config), std::make_unique<PlatformHttpClient>(), nullptr) {}

Client::Client(Config config, std::unique_ptr<HttpClient> http, ChatTransportFactory transports)
    : config_(std::move(config)),
      http_(std::move(http)),
      workers_(std::make_unique<WorkerPool>(std::max<uint32_t>(config_.bridge.workers, 1))),
      session_(session_from_config(config_.auth)),
      api_(*http_, session_, config_.emotes),
      bridge_(*http_, loop_, *workers_, config_.bridge),
      resolver_(loop_, *workers_, api_, enabled_providers(*http_, config_.emotes)),
      chat_(config_.chat, loop_,
            transports ? std::move(transports) : make_irc_transport_factory(config_.chat, loop_),
            session_) {}

Client::~Client() {
    // Running jobs reference the API client, providers and HTTP client.
    workers_->shutdown();
}

void Client::connect_to_chat(const std::string& channel) {
    chat_.select_channel(channel);
}

void Client::leave_chat() {
    chat_.select_channel(std::nullopt);
    resolver_.clear_channel();
}

SendResult Client::send_chat_message(const std::string& text) {
    return chat_.send_message(text);
}

void Client::fetch_playlist(const std::string& url, TextCallback done) {
    bridge_.fetch_text(url, std::move(done));
}

void Client::fetch_segment_bytes(const std::string& url, BytesCallback done) {
    bridge_.fetch_bytes(url, std::move(done));
}

std::unique_ptr<Loader> Client::create_loader() {
    return std::make_unique<BridgeLoader>(bridge_);
}

LoaderFactory Client::loader_factory() {
    return make_bridge_loader_factory(bridge_);
}

void Client::load_global_emotes() {
    resolver_.load_global();
}

void Client::load_channel_emotes(const std::string& channel_id) {
    resolver_.load_channel(channel_id);
}

void Client::set_user_session(UserSession user) {
    session_.set_user(std::move(user));
    std::cerr << "[session] signed in as " << session_.user()->login << "\n";
    chat_.restart();
}

void Client::clear_user_session() {
    session_.clear_user();
    std::cerr << "[session] signed out\n";
    chat_.restart();
}

} // namespace streamtap
