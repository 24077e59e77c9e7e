#pragma once
#include "config.hpp"
#include "event_loop.hpp"
#include "http.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace streamtap {

struct TextFetch {
    bool ok = false;
    std::string text;
    std::string error;
};

struct BytesFetch {
    bool ok = false;
    std::vector<uint8_t> bytes;
    std::string error;
};

using TextCallback = std::function<void(TextFetch)>;
using BytesCallback = std::function<void(BytesFetch)>;

// Privileged host-side fetch primitive. Completions run on the loop thread,
// in whatever order the requests finish.
class BridgeTransport {
public:
    virtual ~BridgeTransport() = default;
    virtual void fetch_text(const std::string& url, TextCallback done) = 0;
    virtual void fetch_bytes(const std::string& url, BytesCallback done) = 0;
};

// Bridge over HttpClient: the GET runs on a worker, the result is posted
// back to the loop. Requests carry browser-like User-Agent and Referer so
// the stream CDN serves them like the web player.
class HttpBridge : public BridgeTransport {
public:
    HttpBridge(HttpClient& http, Scheduler& loop, TaskRunner& workers,
               BridgeConfig config);

    void fetch_text(const std::string& url, TextCallback done) override;
    void fetch_bytes(const std::string& url, BytesCallback done) override;

    std::vector<Header> request_headers() const;

    // Empty when the response is usable, otherwise the transport error text.
    static std::string response_error(const std::string& url, const HttpResponse& resp);

private:
    HttpClient& http_;
    Scheduler& loop_;
    TaskRunner& workers_;
    BridgeConfig config_;
};

} // namespace streamtap
