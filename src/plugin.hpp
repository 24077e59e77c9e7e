#pragma once
#include "emote_provider.hpp"
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace streamtap {

// Factory function type
using EmoteProviderFactory = std::function<std::unique_ptr<EmoteProvider>(
    HttpClient& http, const EmotesConfig& config)>;

// Central registry for self-registering emote providers.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_emote_provider(const std::string& name, EmoteProviderFactory factory);

    // Throws std::invalid_argument for an unknown name.
    std::unique_ptr<EmoteProvider> create_emote_provider(const std::string& name,
                                                         HttpClient& http,
                                                         const EmotesConfig& config) const;

    // Instantiate config.providers in order. Unknown names are logged and skipped.
    std::vector<std::unique_ptr<EmoteProvider>> create_enabled_providers(
        HttpClient& http, const EmotesConfig& config) const;

    // Query
    std::vector<std::string> emote_provider_names() const;
    bool has_emote_provider(const std::string& name) const;

    // Testing support
    void clear();

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, EmoteProviderFactory> emote_providers_;
};

// ── Self-registrar helper (used at file scope in each provider .cpp) ──

struct EmoteProviderRegistrar {
    EmoteProviderRegistrar(const std::string& name, EmoteProviderFactory factory) {
        PluginRegistry::instance().register_emote_provider(name, std::move(factory));
    }
};

} // namespace streamtap
