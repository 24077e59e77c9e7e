#include "irc_transport.hpp"
#include "irc_message.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace streamtap {

TlsIrcTransport::Link::~Link() {
    if (wake_pipe[0] >= 0) ::close(wake_pipe[0]);
    if (wake_pipe[1] >= 0) ::close(wake_pipe[1]);
}

bool TlsIrcTransport::Link::post(Task task) {
    std::lock_guard<std::mutex> lock(post_mutex);
    if (closed) return false;
    loop->post(std::move(task));
    return true;
}

bool TlsIrcTransport::Link::is_closed() {
    std::lock_guard<std::mutex> lock(post_mutex);
    return closed;
}

void TlsIrcTransport::Link::wake() {
    char b = 0;
    // A full pipe already guarantees a wakeup.
    if (::write(wake_pipe[1], &b, 1) < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        std::cerr << "[chat] wakeup write failed: errno " << errno << "\n";
    }
}

void TlsIrcTransport::Link::drain_wake() {
    char buf[64];
    while (::read(wake_pipe[0], buf, sizeof(buf)) > 0) {}
}

void TlsIrcTransport::post_close(const std::shared_ptr<Link>& link, const std::string& reason) {
    // The posted task re-checks: close() may have run in between.
    link->post([self = link, reason] {
        {
            std::lock_guard<std::mutex> lock(self->post_mutex);
            if (self->closed) return;
            self->closed = true;
        }
        self->abort.store(true);
        if (self->handlers.on_close) self->handlers.on_close(reason);
    });
}

TlsIrcTransport::TlsIrcTransport(Endpoint endpoint, long connect_timeout_sec, Scheduler& loop)
    : link_(std::make_shared<Link>()) {
    link_->endpoint = std::move(endpoint);
    link_->connect_timeout_sec = connect_timeout_sec;
    link_->loop = &loop;
    link_->conn.abort_flag = &link_->abort;

    if (::pipe(link_->wake_pipe) != 0) {
        throw std::runtime_error("irc transport: failed to create wakeup pipe");
    }
    for (int fd : link_->wake_pipe) {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

TlsIrcTransport::~TlsIrcTransport() {
    close();
}

void TlsIrcTransport::open(ChatTransportHandlers handlers) {
    if (opened_) throw std::logic_error("TlsIrcTransport::open called twice");
    opened_ = true;
    link_->handlers = std::move(handlers);
    std::thread(io_main, link_).detach();
}

bool TlsIrcTransport::send_line(const std::string& line) {
    if (link_->is_closed() || !link_->connected.load()) return false;
    {
        std::lock_guard<std::mutex> lock(link_->out_mutex);
        if (link_->outbox.size() >= kMaxQueuedLines) {
            std::cerr << "[chat] outbound queue full, dropping line\n";
            return false;
        }
        link_->outbox.push_back(line + "\r\n");
    }
    link_->wake();
    return true;
}

void TlsIrcTransport::close() {
    {
        std::lock_guard<std::mutex> lock(link_->post_mutex);
        link_->closed = true;
    }
    link_->abort.store(true);
    link_->wake();
}

void TlsIrcTransport::io_main(std::shared_ptr<Link> link) {
    Connection& conn = link->conn;
    if (!conn.connect(link->endpoint, link->connect_timeout_sec) || !conn.set_nonblocking()) {
        post_close(link, "connect to " + link->endpoint.host + ":" +
                         link->endpoint.port + " failed");
        return;
    }
    link->connected.store(true);

    link->post([link] {
        if (link->is_closed()) return;
        if (link->handlers.on_open) link->handlers.on_open();
    });

    std::string pending;  // outbound bytes not yet accepted by the socket
    std::string buffer;   // inbound bytes not yet framed into lines
    char chunk[4096];

    while (!link->abort.load()) {
        {
            std::lock_guard<std::mutex> lock(link->out_mutex);
            while (!link->outbox.empty()) {
                pending += link->outbox.front();
                link->outbox.pop_front();
            }
        }
        if (!pending.empty()) {
            ssize_t n = conn.write_some(pending.data(), pending.size());
            if (n == -1) {
                post_close(link, "write error");
                return;
            }
            if (n > 0) pending.erase(0, static_cast<size_t>(n));
        }

        if (!conn.has_buffered()) {
            struct pollfd fds[2];
            fds[0].fd = conn.fd;
            fds[0].events = POLLIN;
            if (!pending.empty() || conn.wants_write()) fds[0].events |= POLLOUT;
            fds[0].revents = 0;
            fds[1].fd = link->wake_pipe[0];
            fds[1].events = POLLIN;
            fds[1].revents = 0;

            int ret = ::poll(fds, 2, 1000);
            if (ret < 0 && errno != EINTR) {
                post_close(link, "poll failed");
                return;
            }
            if (ret <= 0) continue;
            if (fds[1].revents & POLLIN) link->drain_wake();
            if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        }

        // Drain everything readable without blocking.
        while (true) {
            ssize_t n = conn.read_available(chunk, sizeof(chunk));
            if (n == Connection::kWouldBlock) break;
            if (n <= 0) {
                post_close(link, n == 0 ? "connection closed by server" : "read error");
                return;
            }
            buffer.append(chunk, static_cast<size_t>(n));
            for (auto& line : take_irc_lines(buffer)) {
                link->post([link, line = std::move(line)] {
                    if (link->is_closed()) return;
                    if (link->handlers.on_line) link->handlers.on_line(line);
                });
            }
            if (buffer.size() > kMaxIrcLineLength) {
                std::cerr << "[chat] dropping oversized partial line (" << buffer.size() << " bytes)\n";
                buffer.clear();
            }
        }
    }
}

ChatTransportFactory make_irc_transport_factory(const ChatConfig& config, Scheduler& loop) {
    Endpoint endpoint;
    endpoint.tls = true;
    endpoint.host = config.host;
    endpoint.port = std::to_string(config.port);
    long timeout = static_cast<long>(config.connect_timeout_sec);
    return [endpoint, timeout, &loop]() -> std::unique_ptr<ChatTransport> {
        return std::make_unique<TlsIrcTransport>(endpoint, timeout, loop);
    };
}

} // namespace streamtap
