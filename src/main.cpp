#include "client.hpp"
#include "config.hpp"
#include "hls_loader.hpp"
#include "http.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: streamtap [options]\n"
              << "\n"
              << "Options:\n"
              << "  --channel NAME       Join a chat channel and print messages\n"
              << "  --channel-id ID      Numeric channel id, loads channel emotes and badges\n"
              << "  -m, --message MSG    Send one chat message once connected (needs sign-in)\n"
              << "  --playlist URL       Fetch a playlist through the loader and print it\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  STREAMTAP_ACCESS_TOKEN  OAuth access token of the signed-in user\n"
              << "  STREAMTAP_LOGIN         Login name belonging to the token\n"
              << "  TWITCH_CLIENT_ID        Helix application client id\n"
              << "  STREAMTAP_CHAT_HOST     Override the chat server host\n";
}

// Re-arms itself until a signal arrives, then stops the loop.
static void watch_shutdown(streamtap::Client& client) {
    client.loop().schedule(std::chrono::milliseconds(200), [&client] {
        if (g_shutdown.load()) {
            client.stop();
            return;
        }
        watch_shutdown(client);
    });
}

namespace {

class ConsolePrinter : public streamtap::ChatListener {
public:
    ConsolePrinter(streamtap::Client& client, std::string message)
        : client_(client), message_(std::move(message)) {}

    void on_chat_message(const streamtap::ChatEvent& event) override {
        std::cout << streamtap::format_plain(client_.resolver().render(event)) << "\n" << std::flush;
    }

    void on_chat_state(streamtap::ChatState state) override {
        std::cerr << "[chat] state: " << streamtap::to_string(state) << "\n";
        if (state == streamtap::ChatState::Connected && !message_.empty()) {
            auto result = client_.send_chat_message(message_);
            std::cerr << "[chat] send: " << streamtap::to_string(result) << "\n";
            message_.clear();
        }
    }

    void on_chat_notice(const std::string& channel, const std::string& text) override {
        std::cout << "* #" << channel << ": " << text << "\n" << std::flush;
    }

    void on_login_success() override {
        std::cerr << "[chat] signed in\n";
    }

private:
    streamtap::Client& client_;
    std::string message_;
};

} // namespace

static int run_playlist(streamtap::Client& client, const std::string& url) {
    int rc = 1;
    auto loader = client.create_loader();

    streamtap::LoaderCallbacks callbacks;
    callbacks.on_success = [&](const streamtap::LoaderResponse& resp,
                               const streamtap::LoaderStats& stats,
                               const streamtap::LoaderContext& /*ctx*/) {
        if (resp.is_text()) {
            std::cout << resp.text();
        } else {
            std::cout << resp.size() << " bytes\n";
        }
        std::cerr << "[loader] " << stats.loaded << " bytes in "
                  << (stats.loading.end - stats.loading.start) << " ms\n";
        rc = 0;
        client.stop();
    };
    callbacks.on_error = [&](const streamtap::LoaderError& err,
                             const streamtap::LoaderContext& ctx,
                             const streamtap::LoaderStats& /*stats*/) {
        std::cerr << "Error: " << ctx.url << ": " << err.text << "\n";
        client.stop();
    };
    callbacks.on_abort = [&](const streamtap::LoaderStats& /*stats*/,
                             const streamtap::LoaderContext& /*ctx*/) {
        client.stop();
    };

    streamtap::LoaderContext ctx;
    ctx.url = url;
    loader->load(ctx, streamtap::LoaderConfiguration{}, std::move(callbacks));
    client.run();
    if (g_shutdown.load()) loader->abort();
    return rc;
}

static int run_chat(streamtap::Client& client, const std::string& channel,
                    const std::string& channel_id, const std::string& message) {
    ConsolePrinter printer(client, message);
    client.chat().set_listener(&printer);

    client.load_global_emotes();
    if (!channel_id.empty()) client.load_channel_emotes(channel_id);
    client.connect_to_chat(channel);
    client.run();

    client.chat().set_listener(nullptr);
    std::cerr << "[chat] Shutting down.\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string channel;
    std::string channel_id;
    std::string message;
    std::string playlist;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--channel") == 0 && i + 1 < argc) {
            channel = argv[++i];
        } else if (std::strcmp(argv[i], "--channel-id") == 0 && i + 1 < argc) {
            channel_id = argv[++i];
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--playlist") == 0 && i + 1 < argc) {
            playlist = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (channel.empty() && playlist.empty()) {
        print_usage();
        return 1;
    }

    // Initialize
    streamtap::http_init();
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);
    streamtap::http_set_abort_flag(&g_shutdown);

    auto config = streamtap::Config::load();
    int rc;
    {
        streamtap::Client client(config);
        watch_shutdown(client);
        rc = playlist.empty() ? run_chat(client, channel, channel_id, message)
                              : run_playlist(client, playlist);
    }
    streamtap::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
