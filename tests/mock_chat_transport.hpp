#pragma once
#include "chat_transport.hpp"
#include <memory>
#include <string>
#include <vector>

namespace streamtap {

// Test-side end of one fake connection. Outlives the transport object, so
// tests can poke a connection the engine has already dropped.
struct FakeLink {
    ChatTransportHandlers handlers;
    std::vector<std::string> sent;
    bool opened = false;
    bool closed = false;
    bool fail_writes = false;

    // Server side: connection established.
    void accept() {
        if (!closed && handlers.on_open) handlers.on_open();
    }

    // Server side: deliver one line.
    void line(const std::string& l) {
        if (!closed && handlers.on_line) handlers.on_line(l);
    }

    // Server side: drop the connection.
    void drop(const std::string& reason = "connection reset") {
        if (closed) return;
        closed = true;
        if (handlers.on_close) handlers.on_close(reason);
    }

    // Push handlers without the closed check, as a late event would.
    void force_line(const std::string& l) {
        if (handlers.on_line) handlers.on_line(l);
    }

    bool sent_line(const std::string& l) const {
        for (const auto& s : sent) if (s == l) return true;
        return false;
    }
};

class FakeChatTransport : public ChatTransport {
public:
    explicit FakeChatTransport(std::shared_ptr<FakeLink> link) : link_(std::move(link)) {}
    ~FakeChatTransport() override { close(); }

    void open(ChatTransportHandlers handlers) override {
        link_->handlers = std::move(handlers);
        link_->opened = true;
    }

    bool send_line(const std::string& line) override {
        if (link_->closed || link_->fail_writes) return false;
        link_->sent.push_back(line);
        return true;
    }

    void close() override { link_->closed = true; }

private:
    std::shared_ptr<FakeLink> link_;
};

// Factory side: every connection the engine opens lands in links.
struct FakeTransportHub {
    std::vector<std::shared_ptr<FakeLink>> links;

    ChatTransportFactory factory() {
        return [this]() -> std::unique_ptr<ChatTransport> {
            auto link = std::make_shared<FakeLink>();
            links.push_back(link);
            return std::make_unique<FakeChatTransport>(link);
        };
    }

    std::shared_ptr<FakeLink> last() const { return links.empty() ? nullptr : links.back(); }
};

} // namespace streamtap
