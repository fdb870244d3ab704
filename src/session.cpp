#include "zmcp/session.hpp"

namespace zmcp {

Session::Session() = default;

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Session::is_initialized() const {
    return state() == SessionState::Initialized;
}

void Session::mark_initialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState::Initialized;
    ++initialize_count_;
}

void Session::set_client_info(std::optional<Implementation> info) {
    std::lock_guard<std::mutex> lock(mutex_);
    client_info_ = std::move(info);
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

void Session::set_client_protocol_version(std::optional<std::string> version) {
    std::lock_guard<std::mutex> lock(mutex_);
    client_protocol_version_ = std::move(version);
}

std::optional<std::string> Session::client_protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_protocol_version_;
}

int Session::initialize_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialize_count_;
}

} // namespace zmcp
