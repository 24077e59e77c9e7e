#include <catch2/catch.hpp>
#include "emotes.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace streamtap;

// ── to_emote_map ────────────────────────────────────────────────

TEST_CASE("to_emote_map: later entries win", "[emotes]") {
    auto map = to_emote_map({{"Kappa", "a"}, {"Pog", "b"}, {"Kappa", "c"}});
    REQUIRE(map.size() == 2);
    REQUIRE(map["Kappa"] == "c");
}

TEST_CASE("to_emote_map: skips entries without name or url", "[emotes]") {
    auto map = to_emote_map({{"", "a"}, {"Pog", ""}, {"ok", "u"}});
    REQUIRE(map.size() == 1);
    REQUIRE(map.count("ok") == 1);
}

TEST_CASE("platform_emote_url: CDN path for an id", "[emotes]") {
    REQUIRE(platform_emote_url("25") ==
            "https://static-cdn.jtvnw.net/emoticons/v2/25/default/dark/2.0");
}

// ── BadgeSet ────────────────────────────────────────────────────

TEST_CASE("BadgeSet: find by set and version", "[emotes]") {
    BadgeSet set;
    set.add({"subscriber", "12", "1-Year Subscriber", "https://img/sub12"});
    set.add({"subscriber", "0", "Subscriber", "https://img/sub0"});
    REQUIRE(set.size() == 2);
    REQUIRE(set.find("subscriber", "12")->image_url == "https://img/sub12");
    REQUIRE(set.find("subscriber", "3") == nullptr);
    REQUIRE(set.find("moderator", "1") == nullptr);
}

TEST_CASE("BadgeSet: add replaces the same set/version", "[emotes]") {
    BadgeSet set;
    set.add({"vip", "1", "VIP", "old"});
    set.add({"vip", "1", "VIP", "new"});
    REQUIRE(set.size() == 1);
    REQUIRE(set.find("vip", "1")->image_url == "new");
}

// ── Helix ───────────────────────────────────────────────────────

TEST_CASE("parse_helix_emotes: prefers the 2x image", "[emotes]") {
    std::string body = R"({
        "data": [
            {"id": "25", "name": "Kappa",
             "images": {"url_1x": "https://e/25/1.0", "url_2x": "https://e/25/2.0"}},
            {"id": "88", "name": "PogChamp", "images": {"url_1x": "https://e/88/1.0"}},
            {"id": "99", "name": "NoImages"}
        ],
        "template": "ignored"
    })";
    auto emotes = parse_helix_emotes(body);
    REQUIRE(emotes.size() == 2);
    REQUIRE(emotes[0].name == "Kappa");
    REQUIRE(emotes[0].url == "https://e/25/2.0");
    REQUIRE(emotes[1].url == "https://e/88/1.0");
}

TEST_CASE("parse_helix_emotes: empty data is an empty list", "[emotes]") {
    REQUIRE(parse_helix_emotes(R"({"data": []})").empty());
}

TEST_CASE("parse_helix_emotes: wrong shape throws", "[emotes]") {
    REQUIRE_THROWS_AS(parse_helix_emotes(R"({"error": "Unauthorized"})"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_helix_emotes("not json"), nlohmann::json::exception);
}

// ── GQL badges ──────────────────────────────────────────────────

TEST_CASE("parse_gql_badges: global badges", "[emotes]") {
    std::string body = R"({"data": {"badges": [
        {"setID": "moderator", "version": "1", "title": "Moderator", "imageURL": "https://b/mod"},
        {"setID": "partner", "version": "1", "title": "Verified", "imageURL": "https://b/partner"},
        {"setID": "broken", "version": "", "imageURL": "https://b/x"},
        null
    ]}})";
    auto set = parse_gql_badges(body);
    REQUIRE(set.size() == 2);
    REQUIRE(set.find("moderator", "1")->title == "Moderator");
}

TEST_CASE("parse_gql_badges: missing badges throws", "[emotes]") {
    REQUIRE_THROWS_AS(parse_gql_badges(R"({"errors": [{"message": "bad"}]})"),
                      std::runtime_error);
}

TEST_CASE("parse_gql_channel_badges: broadcast badges", "[emotes]") {
    std::string body = R"({"data": {"user": {"broadcastBadges": [
        {"setID": "subscriber", "version": "6", "title": "6-Month", "imageURL": "https://b/s6"}
    ]}}})";
    auto set = parse_gql_channel_badges(body);
    REQUIRE(set.size() == 1);
    REQUIRE(set.find("subscriber", "6")->image_url == "https://b/s6");
}

TEST_CASE("parse_gql_channel_badges: unknown user is empty", "[emotes]") {
    REQUIRE(parse_gql_channel_badges(R"({"data": {"user": null}})").empty());
    REQUIRE_THROWS_AS(parse_gql_channel_badges(R"({"errors": []})"), std::runtime_error);
}
