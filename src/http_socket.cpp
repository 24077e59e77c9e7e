// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"
#include "net.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace streamtap {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const Endpoint& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (method == "POST" && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
static std::string read_line(Connection& conn, std::string& leftover) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            std::string line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return "";
        leftover.append(buf, static_cast<size_t>(n));
    }
}

struct ResponseHead {
    long status = 0;
    bool is_chunked = false;
    size_t content_length = 0;
    std::string location;
};

// Parse status line + headers.
static ResponseHead parse_response_headers(Connection& conn, std::string& leftover) {
    ResponseHead head;

    std::string status_line = read_line(conn, leftover);
    if (status_line.empty()) return head;

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return head;
    char* end = nullptr;
    long status = std::strtol(status_line.c_str() + sp1 + 1, &end, 10);
    if (status < 100 || status > 999) return head;

    while (true) {
        std::string line = read_line(conn, leftover);
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding") {
            std::string lowered = value;
            for (auto& c : lowered) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
            head.is_chunked = (lowered.find("chunked") != std::string::npos);
        } else if (name == "content-length") {
            head.content_length = std::strtoul(value.c_str(), nullptr, 10);
        } else if (name == "location") {
            head.location = value;
        }
    }
    head.status = status;
    return head;
}

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(Connection& conn, std::string& leftover,
                          size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

static void read_until_eof(Connection& conn, std::string& leftover,
                            std::string& out) {
    out += leftover;
    leftover.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
}

// Accumulate full body (handles chunked + content-length + read-to-close).
// Returns false when the body was cut short.
static bool read_body(Connection& conn, std::string& leftover,
                      const ResponseHead& head, std::string& body) {
    if (head.is_chunked) {
        for (;;) {
            std::string size_line = read_line(conn, leftover);
            if (size_line.empty()) return false;
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return true;
            if (!read_exactly(conn, leftover, chunk_size, body)) return false;
            std::string crlf;
            read_exactly(conn, leftover, 2, crlf); // trailing \r\n
        }
    }
    if (head.content_length > 0)
        return read_exactly(conn, leftover, head.content_length, body);
    read_until_eof(conn, leftover, body);
    return true;
}

// ── Core request executor ──────────────────────────────────────

static constexpr int kMaxRedirects = 3;

static HttpResponse do_request(const std::string& method,
                                const std::string& url_str,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                long timeout_secs,
                                int redirects_left = kMaxRedirects) {
    Endpoint url;
    try { url = parse_url(url_str); } catch (const std::exception&) { return {}; }

    Connection conn;
    conn.abort_flag = g_socket_abort_flag;
    if (!conn.connect(url, timeout_secs)) return {};

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) return {};

    std::string leftover;
    ResponseHead head = parse_response_headers(conn, leftover);
    if (head.status == 0) return {};

    // Segment CDNs answer playlist/segment URLs with 302 to edge nodes.
    if (method == "GET" && head.status >= 300 && head.status < 400 &&
        !head.location.empty() && redirects_left > 0) {
        std::string next = head.location;
        if (next[0] == '/')
            next = std::string(url.tls ? "https://" : "http://") + url.host + next;
        return do_request(method, next, body, headers, timeout_secs, redirects_left - 1);
    }

    HttpResponse resp;
    resp.status_code = head.status;
    if (!read_body(conn, leftover, head, resp.body)) return {};
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::get(const std::string& url,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    return do_request("POST", url, body, headers, timeout_seconds);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    return do_request("GET", url, "", headers, timeout_seconds);
}

} // namespace streamtap

#endif // __linux__
