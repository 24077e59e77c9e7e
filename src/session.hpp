#pragma once
#include <string>
#include <mutex>
#include <optional>
#include <cstdint>

namespace streamtap {

// Credentials of the signed-in viewer. The OAuth handshake that produces
// them happens outside this library.
struct UserSession {
    std::string access_token;
    std::string login;
};

// Process-scoped owner of the optional user session. Injected into the
// chat engine (PASS/NICK, send permission) and the platform API client
// (Helix bearer token).
class SessionManager {
public:
    SessionManager() = default;
    explicit SessionManager(std::optional<UserSession> initial);

    // Replace the current session. Throws std::invalid_argument when the
    // token or login is empty.
    void set_user(UserSession session);

    void clear_user();

    std::optional<UserSession> user() const;
    bool logged_in() const;

    // Incremented on every set/clear, so holders of a copy can detect
    // that it went stale.
    uint64_t revision() const;

private:
    mutable std::mutex mutex_;
    std::optional<UserSession> user_;
    uint64_t revision_ = 0;
};

} // namespace streamtap
