#include "hls_loader.hpp"
#include "util.hpp"

#include <chrono>
#include <iostream>

namespace streamtap {

LoadKind classify_url(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    if (ends_with_nocase(path, ".m3u8") || ends_with_nocase(path, ".m3u"))
        return LoadKind::Playlist;
    return LoadKind::Segment;
}

size_t LoaderResponse::size() const {
    return is_text() ? text().size() : bytes().size();
}

double steady_now_ms() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double, std::milli>(now).count();
}

BridgeLoader::BridgeLoader(BridgeTransport& bridge, StatsClock clock)
    : bridge_(bridge),
      clock_(std::move(clock)),
      current_(std::make_shared<LoadState>()) {}

BridgeLoader::~BridgeLoader() {
    destroy();
}

void BridgeLoader::load(const LoaderContext& context,
                        const LoaderConfiguration& config,
                        LoaderCallbacks callbacks) {
    if (destroyed_) {
        std::cerr << "[loader] load() after destroy ignored: " << context.url << '\n';
        return;
    }

    // A previous load still in flight loses its slot.
    current_->cancelled = true;

    auto state = std::make_shared<LoadState>();
    state->context = context;
    state->context.kind = classify_url(context.url);
    state->config = config;
    state->callbacks = std::move(callbacks);
    state->clock = clock_;
    state->stats.loading.start = clock_();
    current_ = state;

    const std::string url = state->context.url;
    if (state->context.kind == LoadKind::Playlist) {
        bridge_.fetch_text(url, [state](TextFetch result) {
            if (discarded(*state)) return;
            if (!result.ok) {
                fail(state, result.error);
                return;
            }
            complete(state, LoaderResponse{state->context.url, std::move(result.text)});
        });
    } else {
        bridge_.fetch_bytes(url, [state](BytesFetch result) {
            if (discarded(*state)) return;
            if (!result.ok) {
                fail(state, result.error);
                return;
            }
            complete(state, LoaderResponse{state->context.url, std::move(result.bytes)});
        });
    }
}

void BridgeLoader::abort() {
    auto state = current_;
    bool in_flight = !state->finished && !state->cancelled && !state->stats.aborted;
    state->stats.aborted = true;
    if (!in_flight) return;

    auto on_abort = state->callbacks.on_abort;
    if (on_abort) on_abort(state->stats, state->context);
}

void BridgeLoader::destroy() {
    destroyed_ = true;
    current_->cancelled = true;
    current_->callbacks = LoaderCallbacks{};
}

bool BridgeLoader::discarded(const LoadState& state) {
    return state.cancelled || state.finished || state.stats.aborted;
}

void BridgeLoader::complete(const std::shared_ptr<LoadState>& state, LoaderResponse response) {
    double now = state->clock();
    auto& stats = state->stats;
    if (stats.loading.first == 0) stats.loading.first = now;
    stats.loading.end = now;
    // True content length is unknown ahead of time; report what arrived.
    stats.loaded = response.size();
    stats.total = response.size();
    stats.chunk_count = 1;
    stats.parsing = ParsingTimes{now, now};
    stats.buffering = BufferingTimes{now, now, now};
    double elapsed = stats.loading.end - stats.loading.start;
    if (elapsed > 0)
        stats.bw_estimate = static_cast<double>(stats.loaded) * 8000.0 / elapsed;

    state->finished = true;
    // Copy out: the callback may destroy the loader or start the next load.
    auto on_success = state->callbacks.on_success;
    if (on_success) on_success(response, stats, state->context);
}

void BridgeLoader::fail(const std::shared_ptr<LoadState>& state, const std::string& cause) {
    std::cerr << "[loader] Fetch failed: " << state->context.url << ": " << cause << '\n';
    state->stats.loading.end = state->clock();
    state->finished = true;
    auto on_error = state->callbacks.on_error;
    if (on_error) on_error(LoaderError{0, cause}, state->context, state->stats);
}

LoaderFactory make_bridge_loader_factory(BridgeTransport& bridge) {
    return [&bridge]() -> std::unique_ptr<Loader> {
        return std::make_unique<BridgeLoader>(bridge);
    };
}

} // namespace streamtap
