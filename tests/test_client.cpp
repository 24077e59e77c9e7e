#include <catch2/catch.hpp>
#include "client.hpp"
#include "mock_chat_transport.hpp"
#include "mock_http_client.hpp"

using namespace streamtap;
using namespace std::chrono_literals;

namespace {

struct ClientFixture {
    FakeTransportHub hub;
    MockHttpClient* http = nullptr;
    std::unique_ptr<Client> client;

    ClientFixture() {
        Config config;
        config.emotes.providers.clear();
        config.bridge.workers = 1;
        config.chat.ping_interval_sec = 0;
        auto mock = std::make_unique<MockHttpClient>();
        http = mock.get();
        client = std::make_unique<Client>(config, std::move(mock), hub.factory());
    }
};

} // namespace

TEST_CASE("Client: connect, sign in and leave", "[client]") {
    ClientFixture f;
    auto& client = *f.client;

    client.connect_to_chat("Alpha");
    f.hub.last()->accept();
    REQUIRE(client.chat().state() == ChatState::Connected);
    REQUIRE(client.send_chat_message("hi") == SendResult::AuthRequired);

    client.set_user_session({"tok", "viewer"});
    REQUIRE(f.hub.links.size() == 2);
    auto link = f.hub.last();
    link->accept();
    REQUIRE(link->sent_line("PASS oauth:tok"));
    REQUIRE(client.send_chat_message("hi") == SendResult::Sent);

    client.leave_chat();
    REQUIRE(client.chat().state() == ChatState::Closed);
    REQUIRE(client.resolver().channel_id().empty());
}

TEST_CASE("Client: session from config", "[client]") {
    Config config;
    config.emotes.providers.clear();
    config.auth.access_token = "tok";
    config.auth.login = "Viewer";
    FakeTransportHub hub;
    Client client(config, std::make_unique<MockHttpClient>(), hub.factory());
    REQUIRE(client.session().logged_in());
    REQUIRE(client.session().user()->login == "viewer");
}

TEST_CASE("Client: enabled providers come from config", "[client]") {
    Config config;
    config.emotes.providers = {"bttv", "ffz"};
    FakeTransportHub hub;
    Client client(config, std::make_unique<MockHttpClient>(), hub.factory());
    REQUIRE(client.resolver().provider_count() == 2);
}

TEST_CASE("Client: fetch_playlist completes on the loop", "[client]") {
    ClientFixture f;
    f.http->next_response = {200, "#EXTM3U\n"};

    TextFetch result;
    bool done = false;
    f.client->fetch_playlist("https://video.example/index.m3u8", [&](TextFetch r) {
        result = std::move(r);
        done = true;
        f.client->stop();
    });
    f.client->loop().run_for(5000ms);

    REQUIRE(done);
    REQUIRE(result.ok);
    REQUIRE(result.text == "#EXTM3U\n");
}
