#pragma once
#include "../emote_provider.hpp"
#include "../http.hpp"
#include <string>
#include <vector>

namespace streamtap {

// 7TV: global emote set plus the channel's active set.
class SevenTvProvider : public EmoteProvider {
public:
    SevenTvProvider(HttpClient& http, long timeout_seconds);

    std::string provider_name() const override { return "7tv"; }
    std::vector<Emote> fetch_global() override;
    std::vector<Emote> fetch_channel(const std::string& channel_id) override;

    // emotes[] of an emote set
    static std::vector<Emote> parse_emote_set(const std::string& body);
    // emote_set.emotes[] of a user; null emote_set is empty
    static std::vector<Emote> parse_user(const std::string& body);

private:
    HttpClient& http_;
    long timeout_seconds_;
};

} // namespace streamtap
