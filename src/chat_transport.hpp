#pragma once
#include <functional>
#include <memory>
#include <string>

namespace streamtap {

// Handlers are invoked on the loop thread. After close() none of them fire.
struct ChatTransportHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string& line)> on_line;
    std::function<void(const std::string& reason)> on_close;
};

// One line-oriented chat connection. on_close fires at most once, either
// when connecting fails or when an open connection drops.
class ChatTransport {
public:
    virtual ~ChatTransport() = default;

    virtual void open(ChatTransportHandlers handlers) = 0;

    // Write one line; CRLF is appended. False when the write failed.
    virtual bool send_line(const std::string& line) = 0;

    // Stop delivering events and release the connection. Idempotent.
    virtual void close() = 0;
};

using ChatTransportFactory = std::function<std::unique_ptr<ChatTransport>()>;

} // namespace streamtap
