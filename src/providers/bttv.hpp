#pragma once
#include "../emote_provider.hpp"
#include "../http.hpp"
#include <string>
#include <vector>

namespace streamtap {

class BttvProvider : public EmoteProvider {
public:
    BttvProvider(HttpClient& http, long timeout_seconds);

    std::string provider_name() const override { return "bttv"; }
    std::vector<Emote> fetch_global() override;
    std::vector<Emote> fetch_channel(const std::string& channel_id) override;

    static std::vector<Emote> parse_global(const std::string& body);
    // channelEmotes followed by sharedEmotes
    static std::vector<Emote> parse_channel(const std::string& body);
    static std::string emote_url(const std::string& id);

private:
    HttpClient& http_;
    long timeout_seconds_;
};

} // namespace streamtap
