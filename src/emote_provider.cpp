#include "emote_provider.hpp"
#include <stdexcept>

namespace streamtap {

std::optional<std::string> provider_get(HttpClient& http, const std::string& url,
                                        long timeout_seconds) {
    auto resp = http.get(url, {{"Accept", "application/json"}}, timeout_seconds);
    if (resp.status_code == 404) return std::nullopt;
    if (resp.status_code == 0) {
        throw std::runtime_error("request failed: " + url);
    }
    if (resp.status_code < 200 || resp.status_code >= 300) {
        throw std::runtime_error("HTTP " + std::to_string(resp.status_code) + " for " + url);
    }
    return resp.body;
}

} // namespace streamtap
