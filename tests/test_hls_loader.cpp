#include <catch2/catch.hpp>
#include "hls_loader.hpp"
#include "mock_bridge.hpp"

using namespace streamtap;

// ── Helpers ─────────────────────────────────────────────────────

namespace {

struct Recorder {
    int successes = 0;
    int errors = 0;
    int aborts = 0;
    LoaderResponse last_response;
    LoaderStats last_stats;
    LoaderError last_error;

    LoaderCallbacks callbacks() {
        LoaderCallbacks cb;
        cb.on_success = [this](const LoaderResponse& r, const LoaderStats& s, const LoaderContext&) {
            successes++;
            last_response = r;
            last_stats = s;
        };
        cb.on_error = [this](const LoaderError& e, const LoaderContext&, const LoaderStats& s) {
            errors++;
            last_error = e;
            last_stats = s;
        };
        cb.on_abort = [this](const LoaderStats& s, const LoaderContext&) {
            aborts++;
            last_stats = s;
        };
        return cb;
    }
};

// Deterministic clock advancing 5 ms per reading.
StatsClock ticking_clock() {
    auto t = std::make_shared<double>(1000.0);
    return [t] { *t += 5.0; return *t; };
}

LoaderContext ctx(const std::string& url) {
    LoaderContext c;
    c.url = url;
    return c;
}

} // namespace

// ── classify_url ────────────────────────────────────────────────

TEST_CASE("classify_url: playlists by path suffix", "[loader]") {
    REQUIRE(classify_url("https://cdn/x/index.m3u8") == LoadKind::Playlist);
    REQUIRE(classify_url("https://cdn/x/INDEX.M3U8?token=abc") == LoadKind::Playlist);
    REQUIRE(classify_url("https://cdn/x/list.m3u#frag") == LoadKind::Playlist);
}

TEST_CASE("classify_url: everything else is a segment", "[loader]") {
    REQUIRE(classify_url("https://cdn/x/seg123.ts") == LoadKind::Segment);
    REQUIRE(classify_url("https://cdn/x/seg.mp4?name=a.m3u8") == LoadKind::Segment);
    REQUIRE(classify_url("https://cdn/m3u8/init.mp4") == LoadKind::Segment);
}

// ── Success ─────────────────────────────────────────────────────

TEST_CASE("BridgeLoader: playlist load delivers text and stats", "[loader]") {
    FakeBridge bridge;
    BridgeLoader loader(bridge, ticking_clock());
    Recorder rec;

    loader.load(ctx("https://cdn/live/index.m3u8"), {}, rec.callbacks());
    REQUIRE(bridge.text_calls == 1);
    REQUIRE(bridge.bytes_calls == 0);

    const std::string playlist = "#EXTM3U\n#EXT-X-VERSION:3\n";
    bridge.complete_text(0, playlist);

    REQUIRE(rec.successes == 1);
    REQUIRE(rec.errors == 0);
    REQUIRE(rec.last_response.url == "https://cdn/live/index.m3u8");
    REQUIRE(rec.last_response.is_text());
    REQUIRE(rec.last_response.text() == playlist);
    REQUIRE(rec.last_stats.loaded == playlist.size());
    REQUIRE(rec.last_stats.total == playlist.size());
    REQUIRE(rec.last_stats.loading.end >= rec.last_stats.loading.start);
    REQUIRE(rec.last_stats.loading.first >= rec.last_stats.loading.start);
    REQUIRE(rec.last_stats.parsing.end == rec.last_stats.loading.end);
    REQUIRE(rec.last_stats.buffering.end == rec.last_stats.loading.end);
    REQUIRE(rec.last_stats.retry == 0);
    REQUIRE_FALSE(rec.last_stats.aborted);
}

TEST_CASE("BridgeLoader: segment load delivers bytes", "[loader]") {
    FakeBridge bridge;
    BridgeLoader loader(bridge, ticking_clock());
    Recorder rec;

    loader.load(ctx("https://cdn/live/seg7.ts"), {}, rec.callbacks());
    REQUIRE(bridge.bytes_calls == 1);

    bridge.complete_bytes(0, {0x47, 0x40, 0x00, 0x10});
    REQUIRE(rec.successes == 1);
    REQUIRE_FALSE(rec.last_response.is_text());
    REQUIRE(rec.last_response.bytes().size() == 4);
    REQUIRE(rec.last_stats.loaded == 4);
    REQUIRE(rec.last_stats.total == 4);
    REQUIRE(loader.stats().loaded == 4);
}

TEST_CASE("BridgeLoader: context kind follows the URL", "[loader]") {
    FakeBridge bridge;
    BridgeLoader loader(bridge);
    Recorder rec;

    LoaderContext c = ctx("https://cdn/a.m3u8");
    c.kind = LoadKind::Segment;
    loader.load(c, {}, rec.callbacks());
    REQUIRE(loader.context().kind == LoadKind::Playlist);
    REQUIRE(bridge.text_calls == 1);
}

// ── Failure ─────────────────────────────────────────────────────

TEST_CASE("BridgeLoader: bridge failure surfaces as error code 0", "[loader]") {
    FakeBridge bridge;
    BridgeLoader loader(bridge, ticking_clock());
    Recorder rec;

    loader.load(ctx("https://cdn/live/seg1.ts"), {}, rec.callbacks());
    bridge.fail(0, "HTTP 403 for https://cdn/live/seg1.ts");

    REQUIRE(rec.errors == 1);
    REQUIRE(rec.successes == 0);
    REQUIRE(rec.last_error.code == 0);
    REQUIRE(rec.last_error.text == "HTTP 403 for https://cdn/live/seg1.ts");
    // No internal retry.
    REQUIRE(bridge.pending.size() == 1);
    REQUIRE(loader.stats().retry == 0);
}

// ── Abort / destroy ─────────────────────────────────────────────

TEST_CASE("BridgeLoader: no callback after abort, whenever the bridge resolves", "[loader]") {
    FakeBridge bridge;
    BridgeLoader loader(bridge, ticking_clock());
    Recorder rec;

    SECTION("success arriving late") {
        loader.load(ctx("https://cdn/index.m3u8"), {}, rec.callbacks());
        loader.abort();
        REQUIRE(rec.aborts == 1);
        REQUIRE(loader.stats().aborted);
        bridge.complete_text(0, "#EXTM3U\n");
    }
    SECTION("error arriving late") {
        loader.load(ctx("https://cdn/seg.ts"), {}, rec.callbacks());
        loader.abort();
        bridge.fail(0, "timeout");
    }

    REQUIRE(rec.successes == 0);
    REQUIRE(rec.errors == 0);
}

TEST_CASE("BridgeLoader: abort after completion does not fire on_abort", "[loader]") {
    FakeBridge bridge;
    BridgeLoader loader(bridge);
    Recorder rec;

    loader.load(ctx("https://cdn/seg.ts"), {}, rec.callbacks());
    bridge.complete_bytes(0, {1, 2, 3});
    loader.abort();
    REQUIRE(rec.successes == 1);
    REQUIRE(rec.aborts == 0);
}

TEST_CASE("BridgeLoader: destroy drops callbacks", "[loader]") {
    FakeBridge bridge;
    BridgeLoader loader(bridge);
    Recorder rec;

    loader.load(ctx("https://cdn/seg.ts"), {}, rec.callbacks());
    loader.destroy();
    REQUIRE(loader.destroyed());
    bridge.complete_bytes(0, {1});
    loader.abort();
    REQUIRE(rec.successes == 0);
    REQUIRE(rec.aborts == 0);

    // Loads after destroy are ignored.
    loader.load(ctx("https://cdn/seg2.ts"), {}, rec.callbacks());
    REQUIRE(bridge.pending.size() == 1);
}

TEST_CASE("BridgeLoader: completion after loader destruction is dropped", "[loader]") {
    FakeBridge bridge;
    Recorder rec;
    {
        BridgeLoader loader(bridge);
        loader.load(ctx("https://cdn/index.m3u8"), {}, rec.callbacks());
    }
    bridge.complete_text(0, "#EXTM3U\n");
    REQUIRE(rec.successes == 0);
}

TEST_CASE("BridgeLoader: a newer load supersedes the previous one", "[loader]") {
    FakeBridge bridge;
    BridgeLoader loader(bridge);
    Recorder first;
    Recorder second;

    loader.load(ctx("https://cdn/a.ts"), {}, first.callbacks());
    loader.load(ctx("https://cdn/b.ts"), {}, second.callbacks());

    // Completions arrive out of order.
    bridge.complete_bytes(1, {9, 9});
    bridge.complete_bytes(0, {1});

    REQUIRE(first.successes == 0);
    REQUIRE(second.successes == 1);
    REQUIRE(second.last_response.url == "https://cdn/b.ts");
    REQUIRE(loader.context().url == "https://cdn/b.ts");
}

TEST_CASE("BridgeLoader: loaders sharing a bridge are independent", "[loader]") {
    FakeBridge bridge;
    auto factory = make_bridge_loader_factory(bridge);
    auto a = factory();
    auto b = factory();
    Recorder ra;
    Recorder rb;

    a->load(ctx("https://cdn/a.m3u8"), {}, ra.callbacks());
    b->load(ctx("https://cdn/b.ts"), {}, rb.callbacks());
    a->abort();
    bridge.complete_text(0, "#EXTM3U\n");
    bridge.complete_bytes(1, {1, 2});

    REQUIRE(ra.successes == 0);
    REQUIRE(ra.aborts == 1);
    REQUIRE(rb.successes == 1);
}
