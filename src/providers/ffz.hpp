#pragma once
#include "../emote_provider.hpp"
#include "../http.hpp"
#include <string>
#include <vector>

namespace streamtap {

// FrankerFaceZ room emotes. There is no global set.
class FfzProvider : public EmoteProvider {
public:
    FfzProvider(HttpClient& http, long timeout_seconds);

    std::string provider_name() const override { return "ffz"; }
    bool has_global() const override { return false; }
    std::vector<Emote> fetch_global() override { return {}; }
    std::vector<Emote> fetch_channel(const std::string& channel_id) override;

    // sets.*.emoticons[], preferring the 2x image
    static std::vector<Emote> parse_room(const std::string& body);

private:
    HttpClient& http_;
    long timeout_seconds_;
};

} // namespace streamtap
