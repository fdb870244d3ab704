#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace zmcp {

/// Cancellation and deadline signal threaded through serving and tool
/// execution. Copies share state: cancelling any copy cancels all of them
/// and every context derived from them.
///
/// Deadlines are observed, not timed: cancelled() and wait_for() report an
/// expired deadline, but on_cancel() callbacks fire only on cancel().
class Context {
public:
    using Clock = std::chrono::steady_clock;

    /// A root context that is never cancelled unless cancel() is called.
    Context();

    /// Child of parent, cancelled when parent is or when timeout elapses.
    static Context with_timeout(const Context& parent, std::chrono::milliseconds timeout);
    static Context with_deadline(const Context& parent, Clock::time_point deadline);

    /// Child of parent without its own deadline.
    static Context child_of(const Context& parent);

    void cancel() const;

    /// True once cancel() was called here or on an ancestor, or the
    /// effective deadline has passed.
    [[nodiscard]] bool cancelled() const;
    [[nodiscard]] bool expired() const;

    /// Earliest deadline across this context and its ancestors.
    [[nodiscard]] std::optional<Clock::time_point> deadline() const;

    /// Sleep up to d. Returns true if the context was cancelled (or expired)
    /// before d elapsed.
    bool wait_for(std::chrono::milliseconds d) const;

    /// Throws McpCancelledError if cancelled() is true.
    void throw_if_cancelled() const;

    /// Register fn to run once on cancellation; runs immediately if already
    /// cancelled. Returns a handle for remove_on_cancel().
    std::size_t on_cancel(std::function<void()> fn) const;
    void remove_on_cancel(std::size_t handle) const;

    /// Number of child contexts created from this one that are still alive.
    [[nodiscard]] std::size_t child_count() const;

private:
    struct State;
    explicit Context(std::shared_ptr<State> state);

    /// now + d, clamped to time_point::max() instead of overflowing.
    static Clock::time_point saturating_after(std::chrono::milliseconds d);

    std::shared_ptr<State> state_;
};

} // namespace zmcp
