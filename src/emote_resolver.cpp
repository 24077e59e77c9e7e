#include "emote_resolver.hpp"

#include <iostream>

namespace streamtap {

const char* to_string(EmoteSource source) {
    switch (source) {
        case EmoteSource::PlatformGlobal:    return "platform-global";
        case EmoteSource::ThirdPartyGlobal:  return "third-party-global";
        case EmoteSource::PlatformChannel:   return "platform-channel";
        case EmoteSource::ThirdPartyChannel: return "third-party-channel";
    }
    return "unknown";
}

EmoteResolver::EmoteResolver(Scheduler& loop, TaskRunner& workers, TwitchApi& api,
                             std::vector<std::shared_ptr<EmoteProvider>> providers)
    : loop_(loop),
      workers_(workers),
      api_(api),
      providers_(std::move(providers)),
      merged_(std::make_shared<const EmoteMap>()),
      global_badges_(std::make_shared<const BadgeSet>()),
      channel_badges_(std::make_shared<const BadgeSet>()) {
    for (auto& t : tables_) t = std::make_shared<const EmoteMap>();
}

EmoteResolver::~EmoteResolver() {
    *alive_ = false;
}

bool EmoteResolver::current(std::optional<uint64_t> channel_gen) const {
    return !channel_gen || *channel_gen == channel_generation_;
}

void EmoteResolver::load_global() {
    std::weak_ptr<bool> alive = alive_;
    TwitchApi& api = api_;
    Scheduler& loop = loop_;

    workers_.submit([this, alive, &api, &loop] {
        EmoteMap table;
        try {
            table = to_emote_map(api.global_emotes());
        } catch (const std::exception& e) {
            std::cerr << "[emotes] platform global emotes: " << e.what() << "\n";
        }
        loop.post([this, alive, table = std::move(table)]() mutable {
            if (alive.expired()) return;
            replace_table(EmoteSource::PlatformGlobal, std::move(table));
        });
    });

    load_third_party(EmoteSource::ThirdPartyGlobal, {}, std::nullopt);

    workers_.submit([this, alive, &api, &loop] {
        BadgeSet badges;
        try {
            badges = api.global_badges();
        } catch (const std::exception& e) {
            std::cerr << "[emotes] global badges: " << e.what() << "\n";
        }
        loop.post([this, alive, badges = std::move(badges)]() mutable {
            if (alive.expired()) return;
            replace_global_badges(std::move(badges));
        });
    });
}

void EmoteResolver::load_channel(const std::string& channel_id) {
    channel_id_ = channel_id;
    uint64_t gen = ++channel_generation_;

    tables_[static_cast<size_t>(EmoteSource::PlatformChannel)] = std::make_shared<const EmoteMap>();
    tables_[static_cast<size_t>(EmoteSource::ThirdPartyChannel)] = std::make_shared<const EmoteMap>();
    channel_badges_ = std::make_shared<const BadgeSet>();
    merge();

    std::weak_ptr<bool> alive = alive_;
    TwitchApi& api = api_;
    Scheduler& loop = loop_;

    workers_.submit([this, alive, &api, &loop, channel_id, gen] {
        EmoteMap table;
        try {
            table = to_emote_map(api.channel_emotes(channel_id));
        } catch (const std::exception& e) {
            std::cerr << "[emotes] platform emotes for " << channel_id << ": " << e.what() << "\n";
        }
        loop.post([this, alive, gen, table = std::move(table)]() mutable {
            if (alive.expired() || !current(gen)) return;
            replace_table(EmoteSource::PlatformChannel, std::move(table));
        });
    });

    load_third_party(EmoteSource::ThirdPartyChannel, channel_id, gen);

    workers_.submit([this, alive, &api, &loop, channel_id, gen] {
        BadgeSet badges;
        try {
            badges = api.channel_badges(channel_id);
        } catch (const std::exception& e) {
            std::cerr << "[emotes] badges for " << channel_id << ": " << e.what() << "\n";
        }
        loop.post([this, alive, gen, badges = std::move(badges)]() mutable {
            if (alive.expired() || !current(gen)) return;
            replace_channel_badges(std::move(badges));
        });
    });
}

void EmoteResolver::load_third_party(EmoteSource target, const std::string& channel_id,
                                     std::optional<uint64_t> channel_gen) {
    bool global = target == EmoteSource::ThirdPartyGlobal;
    std::vector<std::shared_ptr<EmoteProvider>> selected;
    for (const auto& p : providers_) {
        if (!global || p->has_global()) selected.push_back(p);
    }
    if (selected.empty()) {
        replace_table(target, {});
        return;
    }

    auto gather = std::make_shared<Gather>();
    gather->parts.resize(selected.size());
    gather->remaining = selected.size();
    std::weak_ptr<bool> alive = alive_;
    Scheduler& loop = loop_;

    for (size_t i = 0; i < selected.size(); ++i) {
        auto provider = selected[i];
        workers_.submit([this, alive, &loop, provider, gather, i, target, channel_id,
                         channel_gen, global] {
            std::vector<Emote> emotes;
            try {
                emotes = global ? provider->fetch_global() : provider->fetch_channel(channel_id);
            } catch (const std::exception& e) {
                // One failing provider contributes nothing; the others still merge.
                std::cerr << "[emotes] " << provider->provider_name() << " "
                          << (global ? "global" : channel_id) << ": " << e.what() << "\n";
            }
            loop.post([this, alive, gather, i, target, channel_gen,
                       emotes = std::move(emotes)]() mutable {
                if (alive.expired()) return;
                gather->parts[i] = std::move(emotes);
                if (--gather->remaining > 0) return;
                if (!current(channel_gen)) return;
                // Provider order decides duplicates within the table.
                std::vector<Emote> all;
                for (auto& part : gather->parts)
                    all.insert(all.end(), part.begin(), part.end());
                replace_table(target, to_emote_map(all));
            });
        });
    }
}

void EmoteResolver::clear_channel() {
    ++channel_generation_;
    channel_id_.clear();
    tables_[static_cast<size_t>(EmoteSource::PlatformChannel)] = std::make_shared<const EmoteMap>();
    tables_[static_cast<size_t>(EmoteSource::ThirdPartyChannel)] = std::make_shared<const EmoteMap>();
    channel_badges_ = std::make_shared<const BadgeSet>();
    merge();
    notify();
}

void EmoteResolver::replace_table(EmoteSource source, EmoteMap table) {
    size_t count = table.size();
    tables_[static_cast<size_t>(source)] = std::make_shared<const EmoteMap>(std::move(table));
    merge();
    std::cerr << "[emotes] " << to_string(source) << ": " << count << " emotes\n";
    notify();
}

void EmoteResolver::replace_global_badges(BadgeSet badges) {
    global_badges_ = std::make_shared<const BadgeSet>(std::move(badges));
    notify();
}

void EmoteResolver::replace_channel_badges(BadgeSet badges) {
    channel_badges_ = std::make_shared<const BadgeSet>(std::move(badges));
    notify();
}

void EmoteResolver::merge() {
    EmoteMap merged;
    for (const auto& table : tables_) {
        for (const auto& [name, url] : *table) merged[name] = url;
    }
    merged_ = std::make_shared<const EmoteMap>(std::move(merged));
}

void EmoteResolver::notify() {
    if (on_update_) on_update_();
}

std::shared_ptr<const EmoteMap> EmoteResolver::table(EmoteSource source) const {
    return tables_[static_cast<size_t>(source)];
}

std::optional<std::string> EmoteResolver::emote_url(const std::string& token) const {
    auto snapshot = merged_;
    auto it = snapshot->find(token);
    if (it == snapshot->end()) return std::nullopt;
    return it->second;
}

std::optional<Badge> EmoteResolver::badge(const std::string& set_id,
                                          const std::string& version) const {
    if (const Badge* b = channel_badges_->find(set_id, version)) return *b;
    if (const Badge* b = global_badges_->find(set_id, version)) return *b;
    return std::nullopt;
}

std::vector<std::string> EmoteResolver::resolve_badges(const std::vector<BadgeRef>& badges) const {
    std::vector<std::string> urls;
    for (const auto& ref : badges) {
        auto b = badge(ref.set_id, ref.version);
        if (b) urls.push_back(b->image_url);
    }
    return urls;
}

RenderedMessage EmoteResolver::render(const ChatEvent& event) const {
    RenderedMessage out;
    out.user = event.user;
    out.color = event.color;
    out.action = event.action;
    for (const auto& ref : event.badges) {
        auto b = badge(ref.set_id, ref.version);
        if (!b) continue;
        out.badge_urls.push_back(b->image_url);
        out.badge_titles.push_back(b->title.empty() ? b->set_id : b->title);
    }

    auto snapshot = merged_;
    for (const auto& token : event.tokens) {
        if (token.kind == TokenKind::Emote) {
            out.spans.push_back(
                RenderedSpan{TokenKind::Emote, token.text, platform_emote_url(token.emote_id)});
            continue;
        }
        auto it = snapshot->find(token.text);
        if (it != snapshot->end()) {
            out.spans.push_back(RenderedSpan{TokenKind::Emote, token.text, it->second});
            continue;
        }
        if (!out.spans.empty() && out.spans.back().kind == TokenKind::Text) {
            out.spans.back().text += " " + token.text;
        } else {
            out.spans.push_back(RenderedSpan{TokenKind::Text, token.text, {}});
        }
    }
    return out;
}

std::string format_plain(const RenderedMessage& message) {
    std::string line;
    for (const auto& title : message.badge_titles) line += "[" + title + "]";
    if (!line.empty()) line += " ";
    line += message.action ? "* " + message.user + " " : message.user + ": ";
    bool first = true;
    for (const auto& span : message.spans) {
        if (!first) line += " ";
        first = false;
        line += span.kind == TokenKind::Emote ? "<" + span.text + ">" : span.text;
    }
    return line;
}

} // namespace streamtap
