#pragma once
#include "bridge.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace streamtap {

enum class LoadKind { Playlist, Segment };

// Playlists go through the text bridge call, everything else is binary.
// Fixed suffix test on the URL path; query and fragment are ignored.
LoadKind classify_url(const std::string& url);

struct LoaderContext {
    std::string url;
    LoadKind kind = LoadKind::Segment;
};

// Pass-through knobs owned by the streaming engine. The loader never
// retries; retry policy stays with the engine.
struct LoaderConfiguration {
    uint32_t timeout_ms = 0;
    uint32_t max_retry = 0;
    uint32_t retry_delay_ms = 0;
    uint32_t max_retry_delay_ms = 0;
};

struct LoadingTimes {
    double start = 0;
    double first = 0;
    double end = 0;
};

struct ParsingTimes {
    double start = 0;
    double end = 0;
};

struct BufferingTimes {
    double start = 0;
    double first = 0;
    double end = 0;
};

// Field-for-field the stats record the streaming engine reads back.
// Parsing and buffering stamps are not measured for a network fetch; they
// equal loading.end once a load succeeds.
struct LoaderStats {
    bool aborted = false;
    size_t loaded = 0;
    size_t total = 0;
    uint32_t retry = 0;
    uint32_t chunk_count = 0;
    double bw_estimate = 0;
    LoadingTimes loading;
    ParsingTimes parsing;
    BufferingTimes buffering;
};

struct LoaderResponse {
    std::string url;
    std::variant<std::string, std::vector<uint8_t>> data;

    bool is_text() const { return std::holds_alternative<std::string>(data); }
    const std::string& text() const { return std::get<std::string>(data); }
    const std::vector<uint8_t>& bytes() const { return std::get<std::vector<uint8_t>>(data); }
    size_t size() const;
};

struct LoaderError {
    int code = 0;
    std::string text;
};

struct LoaderCallbacks {
    std::function<void(const LoaderResponse&, const LoaderStats&, const LoaderContext&)> on_success;
    std::function<void(const LoaderError&, const LoaderContext&, const LoaderStats&)> on_error;
    std::function<void(const LoaderStats&, const LoaderContext&)> on_abort;
};

// Pluggable loader contract of the adaptive-streaming engine.
class Loader {
public:
    virtual ~Loader() = default;
    virtual void load(const LoaderContext& context,
                      const LoaderConfiguration& config,
                      LoaderCallbacks callbacks) = 0;
    virtual void abort() = 0;
    virtual void destroy() = 0;
    virtual const LoaderStats& stats() const = 0;
    virtual const LoaderContext& context() const = 0;
};

using LoaderFactory = std::function<std::unique_ptr<Loader>()>;

// Millisecond clock used for stats stamps (steady, arbitrary epoch).
using StatsClock = std::function<double()>;
double steady_now_ms();

// Routes every request through a BridgeTransport. Each load() owns a fresh
// state handle (context, stats, callbacks); the bridge completion holds that
// handle, so a result arriving after abort(), destroy(), a newer load() or
// the loader's destruction finds it cancelled and is dropped.
class BridgeLoader : public Loader {
public:
    explicit BridgeLoader(BridgeTransport& bridge, StatsClock clock = steady_now_ms);
    ~BridgeLoader() override;

    void load(const LoaderContext& context,
              const LoaderConfiguration& config,
              LoaderCallbacks callbacks) override;
    void abort() override;
    void destroy() override;
    const LoaderStats& stats() const override { return current_->stats; }
    const LoaderContext& context() const override { return current_->context; }

    bool destroyed() const { return destroyed_; }

private:
    struct LoadState {
        LoaderContext context;
        LoaderConfiguration config;
        LoaderStats stats;
        LoaderCallbacks callbacks;
        StatsClock clock;
        bool finished = false;
        bool cancelled = false;
    };

    static bool discarded(const LoadState& state);
    static void complete(const std::shared_ptr<LoadState>& state, LoaderResponse response);
    static void fail(const std::shared_ptr<LoadState>& state, const std::string& cause);

    BridgeTransport& bridge_;
    StatsClock clock_;
    std::shared_ptr<LoadState> current_;
    bool destroyed_ = false;
};

LoaderFactory make_bridge_loader_factory(BridgeTransport& bridge);

} // namespace streamtap
