#pragma once
#include "config.hpp"
#include "emotes.hpp"
#include "http.hpp"
#include "session.hpp"
#include <string>
#include <vector>

namespace streamtap {

// Platform emotes (Helix) and badges (GQL). Calls block and run on a
// worker; failures throw std::runtime_error (or nlohmann::json::exception
// for a malformed body).
class TwitchApi {
public:
    TwitchApi(HttpClient& http, SessionManager& session, EmotesConfig config);

    std::vector<Emote> global_emotes();
    std::vector<Emote> channel_emotes(const std::string& channel_id);
    BadgeSet global_badges();
    BadgeSet channel_badges(const std::string& channel_id);

    // Helix needs the app client id and the viewer's bearer token.
    std::vector<Header> helix_headers() const;
    // GQL runs unauthenticated under the web client id.
    std::vector<Header> gql_headers() const;

    static constexpr const char* kHelixUrl = "https://api.twitch.tv/helix";
    static constexpr const char* kGqlUrl = "https://gql.twitch.tv/gql/";

private:
    std::string helix_get(const std::string& url);
    std::string gql_post(const std::string& payload);

    HttpClient& http_;
    SessionManager& session_;
    EmotesConfig config_;
    std::string device_id_;
};

} // namespace streamtap
