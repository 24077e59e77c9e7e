#include "bridge.hpp"

#include <iostream>

namespace streamtap {

HttpBridge::HttpBridge(HttpClient& http, Scheduler& loop, TaskRunner& workers,
                       BridgeConfig config)
    : http_(http), loop_(loop), workers_(workers), config_(std::move(config)) {}

std::vector<Header> HttpBridge::request_headers() const {
    std::vector<Header> headers;
    if (!config_.user_agent.empty()) headers.emplace_back("User-Agent", config_.user_agent);
    if (!config_.referer.empty()) headers.emplace_back("Referer", config_.referer);
    headers.emplace_back("Accept", "*/*");
    return headers;
}

std::string HttpBridge::response_error(const std::string& url, const HttpResponse& resp) {
    if (resp.status_code == 0) return "request failed: " + url;
    if (resp.status_code < 200 || resp.status_code >= 300)
        return "HTTP " + std::to_string(resp.status_code) + " for " + url;
    return {};
}

void HttpBridge::fetch_text(const std::string& url, TextCallback done) {
    auto headers = request_headers();
    long timeout = static_cast<long>(config_.timeout_sec);
    workers_.submit([this, url, headers, timeout, done = std::move(done)]() mutable {
        HttpResponse resp = http_.get(url, headers, timeout);
        TextFetch result;
        result.error = response_error(url, resp);
        result.ok = result.error.empty();
        if (result.ok) result.text = std::move(resp.body);
        else std::cerr << "[bridge] " << result.error << '\n';
        loop_.post([done = std::move(done), result = std::move(result)]() mutable {
            done(std::move(result));
        });
    });
}

void HttpBridge::fetch_bytes(const std::string& url, BytesCallback done) {
    auto headers = request_headers();
    long timeout = static_cast<long>(config_.timeout_sec);
    workers_.submit([this, url, headers, timeout, done = std::move(done)]() mutable {
        HttpResponse resp = http_.get(url, headers, timeout);
        BytesFetch result;
        result.error = response_error(url, resp);
        result.ok = result.error.empty();
        if (result.ok) result.bytes.assign(resp.body.begin(), resp.body.end());
        else std::cerr << "[bridge] " << result.error << '\n';
        loop_.post([done = std::move(done), result = std::move(result)]() mutable {
            done(std::move(result));
        });
    });
}

} // namespace streamtap
