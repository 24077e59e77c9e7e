#pragma once
#include "emotes.hpp"
#include "http.hpp"
#include <optional>
#include <string>
#include <vector>

namespace streamtap {

// A third-party emote source. Fetches are blocking and run on a worker;
// they throw on transport or format errors.
class EmoteProvider {
public:
    virtual ~EmoteProvider() = default;

    virtual std::string provider_name() const = 0;

    // Providers without a global set return false and an empty list.
    virtual bool has_global() const { return true; }

    virtual std::vector<Emote> fetch_global() = 0;
    virtual std::vector<Emote> fetch_channel(const std::string& channel_id) = 0;
};

// GET a provider endpoint. A 404 means the channel has no account on that
// service and yields nullopt; any other failure throws std::runtime_error.
std::optional<std::string> provider_get(HttpClient& http, const std::string& url,
                                        long timeout_seconds);

} // namespace streamtap
