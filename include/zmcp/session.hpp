#pragma once
#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace zmcp {

enum class SessionState {
    Uninitialized,
    Initialized
};

/// Protocol state of the single session served by a process.
/// The only transition is Uninitialized -> Initialized; it is never reset.
class Session {
public:
    Session();

    SessionState state() const;
    [[nodiscard]] bool is_initialized() const;

    /// Record a successful initialize. Idempotent.
    void mark_initialized();

    /// What the client declared in initialize, if anything.
    void set_client_info(std::optional<Implementation> info);
    std::optional<Implementation> client_info() const;

    void set_client_protocol_version(std::optional<std::string> version);
    std::optional<std::string> client_protocol_version() const;

    /// Number of initialize calls seen, including repeats.
    int initialize_count() const;

private:
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::optional<Implementation> client_info_;
    std::optional<std::string> client_protocol_version_;
    int initialize_count_{0};
};

} // namespace zmcp
