#include "net.hpp"

#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace streamtap {

// ── URL parsing ────────────────────────────────────────────────

Endpoint parse_url(const std::string& url) {
    Endpoint result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("net: invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    result.tls = (scheme == "https" || scheme == "wss" || scheme == "ircs");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    return result;
}

// ── Connection ─────────────────────────────────────────────────

Connection::~Connection() {
    if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
    if (ctx) SSL_CTX_free(ctx);
    if (fd >= 0) ::close(fd);
}

bool Connection::connect(const Endpoint& endpoint, long timeout_secs) {
    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    if (getaddrinfo(endpoint.host.c_str(), endpoint.port.c_str(), &hints, &res) != 0)
        return false;

    bool connected = false;
    for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;

        // Non-blocking connect so we can honour timeout_secs.
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            fcntl(fd, F_SETFL, flags);
            connected = true;
        } else if (errno == EINPROGRESS) {
            struct pollfd pfd{fd, POLLOUT, 0};
            rc = ::poll(&pfd, 1, static_cast<int>(timeout_secs * 1000));
            if (rc > 0) {
                int err = 0;
                socklen_t elen = sizeof(err);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                if (err == 0) {
                    fcntl(fd, F_SETFL, flags);
                    connected = true;
                }
            }
        }
        if (!connected) { ::close(fd); fd = -1; }
    }
    freeaddrinfo(res);
    if (!connected || aborted()) return false;

    // Use full timeout for TLS handshake, then switch to 1-second slices
    // so abort-flag checks work during reads.
    if (endpoint.tls) {
        set_socket_timeout(timeout_secs);

        ctx = SSL_CTX_new(TLS_client_method());
        if (!ctx) return false;
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx);
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

        ssl = SSL_new(ctx);
        if (!ssl) return false;
        SSL_set_fd(ssl, fd);
        SSL_set_tlsext_host_name(ssl, endpoint.host.c_str()); // SNI
        SSL_set1_host(ssl, endpoint.host.c_str());

        if (SSL_connect(ssl) != 1) {
            ERR_clear_error();
            return false;
        }
    }

    set_socket_timeout(1);
    return true;
}

ssize_t Connection::read_some(char* buf, size_t len) {
    while (true) {
        if (aborted()) return -1;

        ssize_t n;
        if (ssl) {
            n = SSL_read(ssl, buf, static_cast<int>(len));
            if (n > 0) return n;
            int err = SSL_get_error(ssl, static_cast<int>(n));
            if (err == SSL_ERROR_ZERO_RETURN) return 0;
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                continue;
            if (err == SSL_ERROR_SYSCALL &&
                (errno == EAGAIN || errno == EWOULDBLOCK))
                continue; // 1-second slice expired
            ERR_clear_error();
            return n == 0 ? 0 : -1;
        } else {
            n = ::recv(fd, buf, len, 0);
            if (n > 0) return n;
            if (n == 0) return 0;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return -1;
        }
    }
}

bool Connection::write_all(const char* buf, size_t len) {
    while (len > 0) {
        if (aborted()) return false;
        ssize_t n;
        if (ssl) {
            n = SSL_write(ssl, buf, static_cast<int>(len));
            if (n <= 0) {
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                    continue;
                ERR_clear_error();
                return false;
            }
        } else {
            n = ::send(fd, buf, len, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                return false;
            }
        }
        buf += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

bool Connection::set_nonblocking() {
    if (fd < 0) return false;
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) return false;
    // The pending-output buffer may grow or move between retries.
    if (ssl) SSL_set_mode(ssl, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    return true;
}

ssize_t Connection::read_available(char* buf, size_t len) {
    if (ssl) {
        ERR_clear_error();
        int n = SSL_read(ssl, buf, static_cast<int>(len));
        if (n > 0) {
            want_write_ = false;
            return n;
        }
        int err = SSL_get_error(ssl, n);
        if (err == SSL_ERROR_WANT_READ) {
            want_write_ = false;
            return kWouldBlock;
        }
        if (err == SSL_ERROR_WANT_WRITE) {
            want_write_ = true;
            return kWouldBlock;
        }
        if (err == SSL_ERROR_ZERO_RETURN) return 0;
        if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
            return kWouldBlock;
        ERR_clear_error();
        return n == 0 ? 0 : -1;
    }

    ssize_t n = ::recv(fd, buf, len, 0);
    if (n >= 0) return n;
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return kWouldBlock;
    return -1;
}

ssize_t Connection::write_some(const char* buf, size_t len) {
    if (ssl) {
        ERR_clear_error();
        int n = SSL_write(ssl, buf, static_cast<int>(len));
        if (n > 0) {
            want_write_ = false;
            return n;
        }
        int err = SSL_get_error(ssl, n);
        if (err == SSL_ERROR_WANT_WRITE) {
            want_write_ = true;
            return kWouldBlock;
        }
        if (err == SSL_ERROR_WANT_READ) return kWouldBlock;
        if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
            return kWouldBlock;
        ERR_clear_error();
        return -1;
    }

    ssize_t n = ::send(fd, buf, len, MSG_NOSIGNAL);
    if (n >= 0) return n;
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return kWouldBlock;
    return -1;
}

bool Connection::has_buffered() const {
    return ssl && SSL_pending(ssl) > 0;
}

void Connection::set_socket_timeout(long secs) {
    struct timeval tv{secs, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

} // namespace streamtap
