#pragma once
#include "chat_transport.hpp"
#include "config.hpp"
#include "event_loop.hpp"
#include "net.hpp"
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace streamtap {

// IRC over TLS (or plain TCP when endpoint.tls is false) on a dedicated IO
// thread. Connect, reads, writes and line splitting all happen on that
// thread; every event is posted to the loop.
//
// send_line() only queues the line and wakes the IO thread, so the loop
// never waits on the socket. A write that fails later surfaces as on_close.
// The IO thread owns the socket through a shared link and is detached on
// destruction. Once close() returns nothing more is posted.
class TlsIrcTransport : public ChatTransport {
public:
    TlsIrcTransport(Endpoint endpoint, long connect_timeout_sec, Scheduler& loop);
    ~TlsIrcTransport() override;

    void open(ChatTransportHandlers handlers) override;

    // False when closed, not yet connected, or the outbound queue is full.
    bool send_line(const std::string& line) override;

    void close() override;

    // Upper bound on lines waiting for the IO thread.
    static constexpr size_t kMaxQueuedLines = 1024;

private:
    struct Link {
        Endpoint endpoint;
        long connect_timeout_sec = 10;
        Scheduler* loop = nullptr;
        ChatTransportHandlers handlers;

        std::mutex post_mutex;  // guards closed against posting
        bool closed = false;
        std::atomic<bool> abort{false};
        std::atomic<bool> connected{false};

        std::mutex out_mutex;   // guards outbox
        std::deque<std::string> outbox;

        // poll() wakeup: send_line() and close() write one byte.
        int wake_pipe[2] = {-1, -1};

        // Touched by the IO thread only.
        Connection conn;

        ~Link();

        // Post task unless closed; false when the link is closed.
        bool post(Task task);
        bool is_closed();
        void wake();
        void drain_wake();
    };

    static void io_main(std::shared_ptr<Link> link);
    static void post_close(const std::shared_ptr<Link>& link, const std::string& reason);

    std::shared_ptr<Link> link_;
    bool opened_ = false;
};

ChatTransportFactory make_irc_transport_factory(const ChatConfig& config, Scheduler& loop);

} // namespace streamtap
