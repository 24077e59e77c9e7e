#pragma once
#include "bridge.hpp"
#include "chat_engine.hpp"
#include "config.hpp"
#include "emote_resolver.hpp"
#include "event_loop.hpp"
#include "hls_loader.hpp"
#include "http.hpp"
#include "session.hpp"
#include "twitch_api.hpp"
#include <memory>
#include <optional>
#include <string>

namespace streamtap {

// Owns the loop, the worker pool and every component, and exposes the
// commands the presentation layer issues. Commands must be called on the
// loop thread (or before run()).
class Client {
public:
    // Platform HTTP client and the TLS IRC transport.
    explicit Client(Config config);

    // Injected HTTP client; a null transport factory selects the TLS IRC one.
    Client(Config config, std::unique_ptr<HttpClient> http, ChatTransportFactory transports);

    ~Client();
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // ── Chat ──
    void connect_to_chat(const std::string& channel);
    void leave_chat();
    SendResult send_chat_message(const std::string& text);

    // ── Bridge ──
    void fetch_playlist(const std::string& url, TextCallback done);
    void fetch_segment_bytes(const std::string& url, BytesCallback done);
    std::unique_ptr<Loader> create_loader();
    LoaderFactory loader_factory();

    // ── Emotes & badges ──
    void load_global_emotes();
    void load_channel_emotes(const std::string& channel_id);

    // ── Session ──
    // Chat reconnects under the new identity when a channel is selected.
    void set_user_session(UserSession user);
    void clear_user_session();

    // ── Loop ──
    void run() { loop_.run(); }
    void stop() { loop_.stop(); }

    EventLoop& loop() { return loop_; }
    ChatEngine& chat() { return chat_; }
    EmoteResolver& resolver() { return resolver_; }
    SessionManager& session() { return session_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    EventLoop loop_;
    std::unique_ptr<HttpClient> http_;
    std::unique_ptr<WorkerPool> workers_;
    SessionManager session_;
    TwitchApi api_;
    HttpBridge bridge_;
    EmoteResolver resolver_;
    ChatEngine chat_;
};

} // namespace streamtap
