#include "chat_engine.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace streamtap {

const char* to_string(ChatState state) {
    switch (state) {
        case ChatState::Disconnected: return "disconnected";
        case ChatState::Connecting:   return "connecting";
        case ChatState::Connected:    return "connected";
        case ChatState::Closed:       return "closed";
    }
    return "unknown";
}

const char* to_string(SendResult result) {
    switch (result) {
        case SendResult::Sent:           return "sent";
        case SendResult::Empty:          return "empty";
        case SendResult::AuthRequired:   return "auth required";
        case SendResult::NotConnected:   return "not connected";
        case SendResult::TransportError: return "transport error";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport:    return "transport";
        case ErrorKind::Protocol:     return "protocol";
        case ErrorKind::AuthRequired: return "auth required";
        case ErrorKind::Capacity:     return "capacity";
    }
    return "unknown";
}

// ── DedupWindow ────────────────────────────────────────────────

DedupWindow::DedupWindow(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

bool DedupWindow::seen_or_insert(const std::string& id) {
    if (ids_.count(id)) return true;
    order_.push_back(id);
    ids_.insert(id);
    while (order_.size() > capacity_) {
        ids_.erase(order_.front());
        order_.pop_front();
    }
    return false;
}

void DedupWindow::clear() {
    order_.clear();
    ids_.clear();
}

// ── ChatEngine ─────────────────────────────────────────────────

ChatEngine::ChatEngine(ChatConfig config, Scheduler& loop, ChatTransportFactory transports,
                       SessionManager& session)
    : config_(std::move(config)),
      loop_(loop),
      transports_(std::move(transports)),
      session_(session),
      dedup_(config_.dedup_capacity),
      history_(std::make_shared<const ChatHistory>()) {}

ChatEngine::~ChatEngine() {
    listener_ = nullptr;
    ++generation_;
    cancel_timers();
    retire_transport();
}

std::string ChatEngine::normalize_channel(const std::string& name) {
    std::string n = trim(name);
    while (!n.empty() && n.front() == '#') n.erase(0, 1);
    return to_lower(trim(n));
}

std::string ChatEngine::filter_channel() const {
    if (!confirmed_channel_.empty()) return confirmed_channel_;
    return channel_.value_or("");
}

std::chrono::milliseconds ChatEngine::reconnect_delay() const {
    return std::max(std::chrono::milliseconds(config_.reconnect_delay_ms), kMinReconnectDelay);
}

void ChatEngine::select_channel(const std::optional<std::string>& channel) {
    if (!channel) {
        if (channel_) std::cerr << "[chat] leaving #" << *channel_ << "\n";
        reset_session();
        channel_.reset();
        set_state(ChatState::Closed);
        return;
    }

    std::string name = normalize_channel(*channel);
    if (name.empty()) throw std::invalid_argument("channel name is empty");

    if (channel_ && *channel_ == name &&
        (state_ == ChatState::Connecting || state_ == ChatState::Connected)) {
        return;
    }

    reset_session();
    channel_ = name;
    std::cerr << "[chat] selecting #" << name << "\n";
    connect();
}

void ChatEngine::restart() {
    if (!channel_) return;
    std::string channel = *channel_;
    reset_session();
    channel_ = channel;
    connect();
}

void ChatEngine::reset_session() {
    ++generation_;
    cancel_timers();
    retire_transport();
    history_ = std::make_shared<const ChatHistory>();
    dedup_.clear();
    confirmed_channel_.clear();
    nick_.clear();
    authenticated_ = false;
    login_announced_ = false;
    capacity_reported_ = false;
    reconnect_attempts_ = 0;
}

void ChatEngine::connect() {
    // Each connection attempt gets its own generation, so callbacks from a
    // transport retired by a reconnect are ignored too.
    uint64_t gen = ++generation_;
    set_state(ChatState::Connecting);

    transport_ = transports_();
    ChatTransportHandlers handlers;
    handlers.on_open = [this, gen] { handle_open(gen); };
    handlers.on_line = [this, gen](const std::string& line) { handle_line(gen, line); };
    handlers.on_close = [this, gen](const std::string& reason) { handle_close(gen, reason); };
    transport_->open(std::move(handlers));
}

void ChatEngine::handle_open(uint64_t gen) {
    if (gen != generation_ || !channel_) return;

    bool ok = send_raw("CAP REQ :twitch.tv/tags twitch.tv/commands");
    auto user = session_.user();
    if (user) {
        nick_ = user->login;
        authenticated_ = true;
        ok = ok && send_raw("PASS oauth:" + user->access_token);
    } else {
        nick_ = "justinfan" + random_digits(5);
        authenticated_ = false;
    }
    ok = ok && send_raw("NICK " + nick_);
    ok = ok && send_raw("JOIN #" + *channel_);
    if (!ok) {
        disconnected("handshake write failed");
        return;
    }

    last_activity_ = static_cast<int64_t>(epoch_millis());
    set_state(ChatState::Connected);
    schedule_keepalive();
}

void ChatEngine::handle_line(uint64_t gen, const std::string& line) {
    if (gen != generation_) return;
    last_activity_ = static_cast<int64_t>(epoch_millis());

    auto msg = parse_irc_line(line);
    if (!msg) {
        std::cerr << "[chat] skipping malformed line (" << line.size() << " bytes)\n";
        report(ErrorKind::Protocol, "malformed line");
        return;
    }
    handle_message(*msg);
}

void ChatEngine::handle_close(uint64_t gen, const std::string& reason) {
    if (gen != generation_) return;
    disconnected(reason);
}

void ChatEngine::handle_message(const IrcMessage& msg) {
    const std::string& cmd = msg.command;

    if (cmd == "PING") {
        std::string arg = msg.trailing();
        if (!send_raw(arg.empty() ? "PONG" : "PONG :" + arg)) {
            disconnected("PONG write failed");
        }
        return;
    }

    if (cmd == "PRIVMSG") {
        handle_privmsg(msg);
        return;
    }

    if (cmd == "JOIN") {
        if (to_lower(msg.nick()) == to_lower(nick_)) {
            confirmed_channel_ = normalize_channel(msg.param(0));
            reconnect_attempts_ = 0;
            std::cerr << "[chat] joined #" << confirmed_channel_ << "\n";
        }
        return;
    }

    if (cmd == "NOTICE") {
        std::string target = msg.param(0);
        std::string text = msg.trailing();
        if (!target.empty() && target[0] == '#' &&
            normalize_channel(target) == filter_channel()) {
            if (listener_) listener_->on_chat_notice(filter_channel(), text);
        } else {
            std::cerr << "[chat] notice: " << text << "\n";
        }
        return;
    }

    if (cmd == "001" || cmd == "GLOBALUSERSTATE") {
        if (authenticated_ && !login_announced_) {
            login_announced_ = true;
            std::cerr << "[chat] logged in as " << nick_ << "\n";
            if (listener_) listener_->on_login_success();
        }
        return;
    }

    if (cmd == "RECONNECT") {
        std::cerr << "[chat] server requested reconnect\n";
        disconnected("server requested reconnect");
        return;
    }

    if (cmd == "USERNOTICE" || cmd == "CLEARCHAT") {
        std::string kind = msg.tag("msg-id");
        std::cerr << "[chat] " << cmd << " in " << msg.param(0)
                  << (kind.empty() ? "" : " (" + kind + ")") << "\n";
        return;
    }
}

void ChatEngine::handle_privmsg(const IrcMessage& msg) {
    auto event = chat_event_from_privmsg(msg, static_cast<int64_t>(epoch_millis()));
    if (!event) {
        std::cerr << "[chat] skipping PRIVMSG without channel or body\n";
        report(ErrorKind::Protocol, "incomplete PRIVMSG");
        return;
    }
    if (event->channel != filter_channel()) return;
    if (!event->id.empty() && dedup_.seen_or_insert(event->id)) return;
    deliver(std::move(*event));
}

void ChatEngine::deliver(ChatEvent event) {
    auto next = std::make_shared<ChatHistory>(*history_);
    next->push_back(event);
    bool trimmed = false;
    size_t capacity = std::max<size_t>(config_.history_capacity, 1);
    while (next->size() > capacity) {
        next->pop_front();
        trimmed = true;
    }
    history_ = std::move(next);

    if (trimmed && !capacity_reported_) {
        capacity_reported_ = true;
        report(ErrorKind::Capacity, "history full, dropping oldest messages");
    }
    if (listener_) listener_->on_chat_message(event);
}

void ChatEngine::disconnected(const std::string& reason) {
    std::string channel = channel_.value_or("");
    std::cerr << "[chat] disconnected from #" << channel << ": " << reason << "\n";

    ++generation_;
    cancel_timers();
    retire_transport();
    confirmed_channel_.clear();
    set_state(ChatState::Disconnected);
    report(ErrorKind::Transport, reason);
    if (listener_) listener_->on_chat_disconnected(channel);
    schedule_reconnect();
}

void ChatEngine::schedule_reconnect() {
    if (!channel_) return;
    if (config_.max_reconnect_attempts > 0 &&
        reconnect_attempts_ >= config_.max_reconnect_attempts) {
        std::cerr << "[chat] giving up on #" << *channel_ << " after "
                  << reconnect_attempts_ << " reconnect attempts\n";
        return;
    }

    uint64_t gen = generation_;
    std::string channel = *channel_;
    reconnect_timer_ = loop_.schedule(reconnect_delay(), [this, gen, channel] {
        reconnect_timer_.reset();
        if (gen != generation_ || !channel_ || *channel_ != channel) return;
        ++reconnect_attempts_;
        std::cerr << "[chat] reconnecting to #" << channel
                  << " (attempt " << reconnect_attempts_ << ")\n";
        connect();
    });
}

void ChatEngine::schedule_keepalive() {
    if (config_.ping_interval_sec == 0) return;
    uint64_t gen = generation_;
    auto interval = std::chrono::milliseconds(
        static_cast<int64_t>(config_.ping_interval_sec) * 1000);
    keepalive_timer_ = loop_.schedule(interval, [this, gen] {
        keepalive_timer_.reset();
        if (gen != generation_ || state_ != ChatState::Connected) return;
        if (!send_raw("PING :tmi.twitch.tv")) {
            disconnected("keepalive write failed");
            return;
        }
        schedule_keepalive();
    });
}

void ChatEngine::cancel_timers() {
    if (reconnect_timer_) {
        loop_.cancel(*reconnect_timer_);
        reconnect_timer_.reset();
    }
    if (keepalive_timer_) {
        loop_.cancel(*keepalive_timer_);
        keepalive_timer_.reset();
    }
}

void ChatEngine::retire_transport() {
    if (!transport_) return;
    transport_->close();
    transport_.reset();
}

void ChatEngine::set_state(ChatState state) {
    if (state_ == state) return;
    state_ = state;
    if (listener_) listener_->on_chat_state(state);
}

bool ChatEngine::send_raw(const std::string& line) {
    if (!transport_) return false;
    return transport_->send_line(line);
}

void ChatEngine::report(ErrorKind kind, const std::string& detail) {
    if (listener_) listener_->on_chat_error(kind, detail);
}

SendResult ChatEngine::send_message(const std::string& text) {
    std::string body = text;
    std::replace(body.begin(), body.end(), '\r', ' ');
    std::replace(body.begin(), body.end(), '\n', ' ');
    body = trim(body);
    if (body.empty()) return SendResult::Empty;

    if (!session_.logged_in()) {
        std::cerr << "[chat] not signed in, message not sent\n";
        report(ErrorKind::AuthRequired, "sign in to chat");
        return SendResult::AuthRequired;
    }
    if (state_ != ChatState::Connected || !transport_) return SendResult::NotConnected;
    // Joined anonymously before the user signed in.
    if (!authenticated_) {
        report(ErrorKind::AuthRequired, "reconnect to chat as the signed-in user");
        return SendResult::AuthRequired;
    }

    if (!send_raw("PRIVMSG #" + filter_channel() + " :" + body)) {
        std::cerr << "[chat] send failed on #" << filter_channel() << "\n";
        report(ErrorKind::Transport, "send failed");
        return SendResult::TransportError;
    }
    return SendResult::Sent;
}

} // namespace streamtap
