#pragma once
#include "chat_event.hpp"
#include "emote_provider.hpp"
#include "emotes.hpp"
#include "event_loop.hpp"
#include "twitch_api.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace streamtap {

// Emote tables in merge precedence order, lowest first.
enum class EmoteSource {
    PlatformGlobal = 0,
    ThirdPartyGlobal,
    PlatformChannel,
    ThirdPartyChannel,
};

constexpr size_t kEmoteSourceCount = 4;

const char* to_string(EmoteSource source);

struct RenderedSpan {
    TokenKind kind = TokenKind::Text;
    std::string text;      // words, or the emote name for emotes
    std::string image_url; // emotes only
};

struct RenderedMessage {
    std::string user;
    std::optional<std::string> color;
    bool action = false;
    std::vector<std::string> badge_urls;
    std::vector<std::string> badge_titles; // parallel to badge_urls
    std::vector<RenderedSpan> spans;
};

// One-line text form for terminals: "[Moderator] user: hi <Kappa>".
// Only resolved badges appear; emotes are shown as <name>.
std::string format_plain(const RenderedMessage& message);

// Owns the four emote tables and the two badge sets, and publishes the
// merged lookup as an immutable snapshot replaced on every change. Loads
// run on workers; results are applied on the loop thread.
class EmoteResolver {
public:
    EmoteResolver(Scheduler& loop, TaskRunner& workers, TwitchApi& api,
                  std::vector<std::shared_ptr<EmoteProvider>> providers);
    ~EmoteResolver();
    EmoteResolver(const EmoteResolver&) = delete;
    EmoteResolver& operator=(const EmoteResolver&) = delete;

    // Called on the loop thread after any table or badge set changes.
    void set_on_update(std::function<void()> callback) { on_update_ = std::move(callback); }

    // Platform-global emotes, third-party-global emotes and global badges,
    // three independent loads.
    void load_global();

    // Channel-scoped counterparts. Results for a channel that is no longer
    // current when they arrive are dropped.
    void load_channel(const std::string& channel_id);

    // Forget the channel tables and badges.
    void clear_channel();

    void replace_table(EmoteSource source, EmoteMap table);
    void replace_global_badges(BadgeSet badges);
    void replace_channel_badges(BadgeSet badges);

    std::shared_ptr<const EmoteMap> emotes() const { return merged_; }
    std::shared_ptr<const EmoteMap> table(EmoteSource source) const;
    std::optional<std::string> emote_url(const std::string& token) const;

    // Channel set first, then global.
    std::optional<Badge> badge(const std::string& set_id, const std::string& version) const;

    // Image URLs in the event's badge order; unresolved badges are omitted.
    std::vector<std::string> resolve_badges(const std::vector<BadgeRef>& badges) const;

    RenderedMessage render(const ChatEvent& event) const;

    const std::string& channel_id() const { return channel_id_; }
    size_t provider_count() const { return providers_.size(); }

private:
    // Per-load gather of third-party results, touched on the loop only.
    struct Gather {
        std::vector<std::vector<Emote>> parts;
        size_t remaining = 0;
    };

    void load_third_party(EmoteSource target, const std::string& channel_id,
                          std::optional<uint64_t> channel_gen);
    bool current(std::optional<uint64_t> channel_gen) const;
    void merge();
    void notify();

    Scheduler& loop_;
    TaskRunner& workers_;
    TwitchApi& api_;
    std::vector<std::shared_ptr<EmoteProvider>> providers_;

    std::array<std::shared_ptr<const EmoteMap>, kEmoteSourceCount> tables_;
    std::shared_ptr<const EmoteMap> merged_;
    std::shared_ptr<const BadgeSet> global_badges_;
    std::shared_ptr<const BadgeSet> channel_badges_;

    std::string channel_id_;
    uint64_t channel_generation_ = 0;
    std::function<void()> on_update_;

    // Completions posted after destruction see this expired.
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace streamtap
