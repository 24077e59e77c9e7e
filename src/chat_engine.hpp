#pragma once
#include "chat_event.hpp"
#include "chat_transport.hpp"
#include "config.hpp"
#include "event_loop.hpp"
#include "session.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

namespace streamtap {

enum class ChatState { Disconnected, Connecting, Connected, Closed };

const char* to_string(ChatState state);

enum class SendResult {
    Sent,
    Empty,          // nothing left after trimming
    AuthRequired,   // no user session; nothing was sent
    NotConnected,
    TransportError, // write failed; not retried
};

const char* to_string(SendResult result);

// Failure classes reported to the listener. None of them is fatal.
enum class ErrorKind { Transport, Protocol, AuthRequired, Capacity };

const char* to_string(ErrorKind kind);

// The presentation layer's view of the engine. All calls arrive on the
// loop thread.
class ChatListener {
public:
    virtual ~ChatListener() = default;
    virtual void on_chat_message(const ChatEvent& /*event*/) {}
    virtual void on_chat_disconnected(const std::string& /*channel*/) {}
    virtual void on_login_success() {}
    virtual void on_chat_notice(const std::string& /*channel*/, const std::string& /*text*/) {}
    virtual void on_chat_state(ChatState /*state*/) {}
    virtual void on_chat_error(ErrorKind /*kind*/, const std::string& /*detail*/) {}
};

// Remembers the last `capacity` message ids, oldest evicted first.
class DedupWindow {
public:
    explicit DedupWindow(size_t capacity);

    // True if id is already in the window; otherwise records it.
    bool seen_or_insert(const std::string& id);

    void clear();
    size_t size() const { return order_.size(); }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::deque<std::string> order_;
    std::unordered_set<std::string> ids_;
};

using ChatHistory = std::deque<ChatEvent>;

// Reconnect delays below this are raised to it.
constexpr std::chrono::milliseconds kMinReconnectDelay{500};

// One chat session for the selected channel at a time.
//
// Every transport callback and timer carries the generation it was created
// under; select_channel() bumps the generation, so anything belonging to a
// previous session is ignored when it fires.
class ChatEngine {
public:
    ChatEngine(ChatConfig config, Scheduler& loop, ChatTransportFactory transports,
               SessionManager& session);
    ~ChatEngine();
    ChatEngine(const ChatEngine&) = delete;
    ChatEngine& operator=(const ChatEngine&) = delete;

    // Single subscriber; nullptr detaches. Not owned.
    void set_listener(ChatListener* listener) { listener_ = listener; }

    // Switch to a channel, or leave chat with nullopt. The previous session
    // is torn down first. Throws std::invalid_argument for an empty name.
    void select_channel(const std::optional<std::string>& channel);

    // Drop the current connection and connect again to the selected
    // channel, e.g. after the user signed in or out.
    void restart();

    SendResult send_message(const std::string& text);

    ChatState state() const { return state_; }
    std::optional<std::string> channel() const { return channel_; }

    // Channel incoming messages are filtered against: the server-confirmed
    // name after JOIN, the requested one before.
    std::string filter_channel() const;

    std::shared_ptr<const ChatHistory> history() const { return history_; }

    uint32_t reconnect_attempts() const { return reconnect_attempts_; }
    uint64_t generation() const { return generation_; }
    int64_t last_activity() const { return last_activity_; }
    std::chrono::milliseconds reconnect_delay() const;

    // "#Foo " -> "foo"
    static std::string normalize_channel(const std::string& name);

private:
    void reset_session();
    void connect();
    void handle_open(uint64_t gen);
    void handle_line(uint64_t gen, const std::string& line);
    void handle_close(uint64_t gen, const std::string& reason);
    void handle_message(const IrcMessage& msg);
    void handle_privmsg(const IrcMessage& msg);
    void deliver(ChatEvent event);
    void disconnected(const std::string& reason);
    void schedule_reconnect();
    void schedule_keepalive();
    void cancel_timers();
    void retire_transport();
    void set_state(ChatState state);
    bool send_raw(const std::string& line);
    void report(ErrorKind kind, const std::string& detail);

    ChatConfig config_;
    Scheduler& loop_;
    ChatTransportFactory transports_;
    SessionManager& session_;
    ChatListener* listener_ = nullptr;

    ChatState state_ = ChatState::Disconnected;
    std::optional<std::string> channel_;
    std::string confirmed_channel_;
    std::string nick_;
    bool authenticated_ = false;
    bool login_announced_ = false;
    bool capacity_reported_ = false;

    std::unique_ptr<ChatTransport> transport_;
    uint64_t generation_ = 0;
    uint32_t reconnect_attempts_ = 0;
    int64_t last_activity_ = 0;
    std::optional<TimerId> reconnect_timer_;
    std::optional<TimerId> keepalive_timer_;

    DedupWindow dedup_;
    std::shared_ptr<const ChatHistory> history_;
};

} // namespace streamtap
