#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>
#include <iostream>

namespace streamtap {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_emote_provider(const std::string& name,
                                             EmoteProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    emote_providers_[name] = std::move(factory);
}

std::unique_ptr<EmoteProvider> PluginRegistry::create_emote_provider(
    const std::string& name, HttpClient& http, const EmotesConfig& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = emote_providers_.find(name);
    if (it == emote_providers_.end()) {
        throw std::invalid_argument("Unknown emote provider: " + name);
    }
    return it->second(http, config);
}

std::vector<std::unique_ptr<EmoteProvider>> PluginRegistry::create_enabled_providers(
    HttpClient& http, const EmotesConfig& config) const {
    std::vector<std::unique_ptr<EmoteProvider>> result;
    for (const auto& name : config.providers) {
        if (!has_emote_provider(name)) {
            std::cerr << "[emotes] unknown provider in config: " << name << "\n";
            continue;
        }
        result.push_back(create_emote_provider(name, http, config));
    }
    return result;
}

std::vector<std::string> PluginRegistry::emote_provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(emote_providers_.size());
    for (const auto& [name, _] : emote_providers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_emote_provider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return emote_providers_.count(name) > 0;
}

void PluginRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    emote_providers_.clear();
}

} // namespace streamtap
