#pragma once
#include <atomic>
#include <string>
#include <sys/types.h>

#include <openssl/ssl.h>

namespace streamtap {

struct Endpoint {
    bool tls = true;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string (HTTP only)
};

// Parse "scheme://host[:port]/path". Throws std::runtime_error on a URL
// without a scheme.
Endpoint parse_url(const std::string& url);

// RAII TCP connection with optional TLS, shared by the HTTP client and the
// chat transport. Blocking reads use 1-second socket slices so an abort flag
// can be polled; the chat transport switches to non-blocking mode instead.
struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    const std::atomic<bool>* abort_flag = nullptr;

    Connection() = default;
    ~Connection();
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const Endpoint& endpoint, long timeout_secs);

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on unrecoverable error
    // or abort. EAGAIN (1-second slice expiry) loops back to check the flag.
    ssize_t read_some(char* buf, size_t len);

    bool write_all(const char* buf, size_t len);

    // ── Non-blocking mode, for a connection driven by poll() ──

    static constexpr ssize_t kWouldBlock = -2;

    // Switch the socket to O_NONBLOCK after connect(). read_some and
    // write_all must not be used afterwards.
    bool set_nonblocking();

    // >0 on data, 0 on EOF, -1 on error, kWouldBlock when no application
    // data is ready (e.g. only a TLS session ticket arrived).
    ssize_t read_available(char* buf, size_t len);

    // Bytes written (possibly fewer than len), -1 on error, kWouldBlock.
    // A retry after kWouldBlock must pass at least the same bytes again.
    ssize_t write_some(const char* buf, size_t len);

    // The last TLS operation is waiting for the socket to become writable.
    bool wants_write() const { return want_write_; }

    // Bytes already decrypted inside the TLS layer, invisible to poll().
    bool has_buffered() const;

private:
    void set_socket_timeout(long secs);
    bool aborted() const {
        return abort_flag && abort_flag->load(std::memory_order_relaxed);
    }

    bool want_write_ = false;
};

} // namespace streamtap
