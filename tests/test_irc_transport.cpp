#include <catch2/catch.hpp>
#include "irc_transport.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

using namespace streamtap;
using namespace std::chrono_literals;

// ── Helpers ─────────────────────────────────────────────────────

namespace {

// Plain-TCP IRC server on 127.0.0.1 with an ephemeral port.
struct LoopbackServer {
    int listen_fd = -1;
    int client_fd = -1;
    std::string port;

    LoopbackServer() {
        listen_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        int opt = 1;
        ::setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        struct sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_port = 0;
        sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ::bind(listen_fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa));
        ::listen(listen_fd, 4);
        socklen_t len = sizeof(sa);
        ::getsockname(listen_fd, reinterpret_cast<sockaddr*>(&sa), &len);
        port = std::to_string(ntohs(sa.sin_port));
    }

    ~LoopbackServer() {
        close_client();
        if (listen_fd >= 0) ::close(listen_fd);
    }

    bool accept_client(int timeout_ms = 2000) {
        struct pollfd pfd{listen_fd, POLLIN, 0};
        if (::poll(&pfd, 1, timeout_ms) <= 0) return false;
        client_fd = ::accept(listen_fd, nullptr, nullptr);
        return client_fd >= 0;
    }

    void send(const std::string& data) {
        ::send(client_fd, data.data(), data.size(), MSG_NOSIGNAL);
    }

    // Read until the received text ends with suffix or the timeout passes.
    std::string read_until(const std::string& suffix, int timeout_ms = 2000) {
        std::string got;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (got.size() >= suffix.size() &&
                got.compare(got.size() - suffix.size(), suffix.size(), suffix) == 0) {
                break;
            }
            struct pollfd pfd{client_fd, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            char buf[512];
            ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            got.append(buf, static_cast<size_t>(n));
        }
        return got;
    }

    void close_client() {
        if (client_fd >= 0) ::close(client_fd);
        client_fd = -1;
    }
};

Endpoint loopback(const LoopbackServer& server) {
    Endpoint ep;
    ep.tls = false;
    ep.host = "127.0.0.1";
    ep.port = server.port;
    return ep;
}

// Records transport events; the ones named in stop_on end the loop run.
struct Recorder {
    EventLoop& loop;
    int opens = 0;
    int closes = 0;
    std::string close_reason;
    std::vector<std::string> lines;
    size_t stop_after_lines = 0;

    explicit Recorder(EventLoop& l) : loop(l) {}

    ChatTransportHandlers handlers() {
        ChatTransportHandlers h;
        h.on_open = [this] {
            opens++;
            loop.stop();
        };
        h.on_line = [this](const std::string& line) {
            lines.push_back(line);
            if (stop_after_lines && lines.size() >= stop_after_lines) loop.stop();
        };
        h.on_close = [this](const std::string& reason) {
            closes++;
            close_reason = reason;
            loop.stop();
        };
        return h;
    }
};

} // namespace

// ── Connect & send ──────────────────────────────────────────────

TEST_CASE("TlsIrcTransport: send_line reaches a silent server without blocking", "[irc_transport]") {
    LoopbackServer server;
    EventLoop loop;
    Recorder rec(loop);
    TlsIrcTransport transport(loopback(server), 5, loop);

    transport.open(rec.handlers());
    REQUIRE(server.accept_client());
    loop.run_for(3000ms);
    REQUIRE(rec.opens == 1);

    auto start = std::chrono::steady_clock::now();
    REQUIRE(transport.send_line("CAP REQ :twitch.tv/tags twitch.tv/commands"));
    REQUIRE(transport.send_line("NICK justinfan12345"));
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed < 200ms);

    std::string got = server.read_until("NICK justinfan12345\r\n");
    REQUIRE(got == "CAP REQ :twitch.tv/tags twitch.tv/commands\r\nNICK justinfan12345\r\n");
    REQUIRE(rec.closes == 0);
}

TEST_CASE("TlsIrcTransport: send_line before connect is refused", "[irc_transport]") {
    LoopbackServer server;
    EventLoop loop;
    TlsIrcTransport transport(loopback(server), 5, loop);
    REQUIRE_FALSE(transport.send_line("PING :x"));
}

// ── Receive framing ─────────────────────────────────────────────

TEST_CASE("TlsIrcTransport: lines split across reads are framed", "[irc_transport]") {
    LoopbackServer server;
    EventLoop loop;
    Recorder rec(loop);
    TlsIrcTransport transport(loopback(server), 5, loop);

    transport.open(rec.handlers());
    REQUIRE(server.accept_client());
    loop.run_for(3000ms);
    REQUIRE(rec.opens == 1);

    rec.stop_after_lines = 2;
    server.send("PING :tmi.twitch.tv\r\n:a!a@a PRIV");
    std::this_thread::sleep_for(50ms);
    server.send("MSG #alpha :hello\r\n");
    loop.run_for(3000ms);

    REQUIRE(rec.lines == std::vector<std::string>{"PING :tmi.twitch.tv",
                                                  ":a!a@a PRIVMSG #alpha :hello"});
}

// ── Close ───────────────────────────────────────────────────────

TEST_CASE("TlsIrcTransport: nothing is delivered after close", "[irc_transport]") {
    LoopbackServer server;
    EventLoop loop;
    Recorder rec(loop);
    TlsIrcTransport transport(loopback(server), 5, loop);

    transport.open(rec.handlers());
    REQUIRE(server.accept_client());
    loop.run_for(3000ms);
    REQUIRE(rec.opens == 1);

    transport.close();
    REQUIRE_FALSE(transport.send_line("PING :x"));
    server.send("PING :late\r\n");
    server.close_client();
    loop.run_for(500ms);

    REQUIRE(rec.lines.empty());
    REQUIRE(rec.closes == 0);
}

TEST_CASE("TlsIrcTransport: server close reports on_close once", "[irc_transport]") {
    LoopbackServer server;
    EventLoop loop;
    Recorder rec(loop);
    TlsIrcTransport transport(loopback(server), 5, loop);

    transport.open(rec.handlers());
    REQUIRE(server.accept_client());
    loop.run_for(3000ms);
    REQUIRE(rec.opens == 1);

    server.close_client();
    loop.run_for(3000ms);
    REQUIRE(rec.closes == 1);
    REQUIRE(rec.close_reason == "connection closed by server");

    loop.run_for(300ms);
    REQUIRE(rec.closes == 1);
    REQUIRE_FALSE(transport.send_line("PING :x"));
}

TEST_CASE("TlsIrcTransport: refused connect reports on_close", "[irc_transport]") {
    std::string port;
    {
        LoopbackServer gone;
        port = gone.port;
    }
    EventLoop loop;
    Recorder rec(loop);
    Endpoint ep;
    ep.tls = false;
    ep.host = "127.0.0.1";
    ep.port = port;
    TlsIrcTransport transport(ep, 2, loop);

    transport.open(rec.handlers());
    loop.run_for(3000ms);
    REQUIRE(rec.opens == 0);
    REQUIRE(rec.closes == 1);
    REQUIRE(rec.close_reason.find("failed") != std::string::npos);
}
