#include "session.hpp"
#include "util.hpp"

#include <stdexcept>

namespace streamtap {

SessionManager::SessionManager(std::optional<UserSession> initial) {
    if (initial) set_user(std::move(*initial));
}

void SessionManager::set_user(UserSession session) {
    session.access_token = trim(session.access_token);
    session.login = to_lower(trim(session.login));
    // Tokens copied from the browser often carry the IRC prefix
    if (session.access_token.rfind("oauth:", 0) == 0)
        session.access_token = session.access_token.substr(6);
    if (session.access_token.empty())
        throw std::invalid_argument("User session requires an access token");
    if (session.login.empty())
        throw std::invalid_argument("User session requires a login");

    std::lock_guard<std::mutex> lock(mutex_);
    user_ = std::move(session);
    ++revision_;
}

void SessionManager::clear_user() {
    std::lock_guard<std::mutex> lock(mutex_);
    user_.reset();
    ++revision_;
}

std::optional<UserSession> SessionManager::user() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return user_;
}

bool SessionManager::logged_in() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return user_.has_value();
}

uint64_t SessionManager::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

} // namespace streamtap
