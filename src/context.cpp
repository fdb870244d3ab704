#include "zmcp/context.hpp"
#include "zmcp/error.hpp"
#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace zmcp {

struct Context::State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::optional<Clock::time_point> deadline;
    std::shared_ptr<State> parent;
    std::vector<std::weak_ptr<State>> children;
    std::map<std::size_t, std::function<void()>> callbacks;
    std::size_t next_handle = 1;
};

Context::Context() : state_(std::make_shared<State>()) {}

Context::Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

Context Context::child_of(const Context& parent) {
    auto state = std::make_shared<State>();
    state->parent = parent.state_;
    bool parent_cancelled = false;
    {
        std::lock_guard<std::mutex> lock(parent.state_->mutex);
        parent_cancelled = parent.state_->cancelled;
        if (!parent_cancelled) {
            // Children that were already dropped are pruned here, so a
            // long-lived parent holds only its live children.
            auto& children = parent.state_->children;
            children.erase(std::remove_if(children.begin(), children.end(),
                                          [](const std::weak_ptr<State>& w) { return w.expired(); }),
                           children.end());
            children.push_back(state);
        }
    }
    Context child{std::move(state)};
    if (parent_cancelled) child.cancel();
    return child;
}

Context Context::with_deadline(const Context& parent, Clock::time_point deadline) {
    Context child = child_of(parent);
    std::lock_guard<std::mutex> lock(child.state_->mutex);
    child.state_->deadline = deadline;
    return child;
}

Context::Clock::time_point Context::saturating_after(std::chrono::milliseconds d) {
    auto now = Clock::now();
    if (d.count() <= 0) return now;
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::time_point::max() - now);
    if (d >= headroom) return Clock::time_point::max();
    return now + d;
}

Context Context::with_timeout(const Context& parent, std::chrono::milliseconds timeout) {
    return with_deadline(parent, saturating_after(timeout));
}

void Context::cancel() const {
    std::vector<std::function<void()>> to_run;
    std::vector<std::weak_ptr<State>> children;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) return;
        state_->cancelled = true;
        for (auto& [handle, fn] : state_->callbacks) {
            to_run.push_back(std::move(fn));
        }
        state_->callbacks.clear();
        children.swap(state_->children);
    }
    state_->cv.notify_all();

    for (auto& fn : to_run) {
        fn();
    }
    for (auto& weak : children) {
        if (auto child = weak.lock()) {
            Context{child}.cancel();
        }
    }
}

bool Context::cancelled() const {
    auto now = Clock::now();
    for (State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        std::lock_guard<std::mutex> lock(s->mutex);
        if (s->cancelled) return true;
        if (s->deadline && now >= *s->deadline) return true;
    }
    return false;
}

bool Context::expired() const {
    auto dl = deadline();
    return dl && Clock::now() >= *dl;
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    std::optional<Clock::time_point> earliest;
    for (State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        std::lock_guard<std::mutex> lock(s->mutex);
        if (s->deadline && (!earliest || *s->deadline < *earliest)) {
            earliest = s->deadline;
        }
    }
    return earliest;
}

bool Context::wait_for(std::chrono::milliseconds d) const {
    auto until = saturating_after(d);
    auto dl = deadline();
    bool deadline_first = dl && *dl <= until;
    if (deadline_first) until = *dl;

    // Ancestors propagate cancel() into this state, so waiting on our own
    // condition variable is enough.
    std::unique_lock<std::mutex> lock(state_->mutex);
    bool woke = state_->cv.wait_until(lock, until, [this] { return state_->cancelled; });
    if (woke) return true;
    return deadline_first;
}

void Context::throw_if_cancelled() const {
    if (expired()) throw McpCancelledError("Context deadline exceeded");
    if (cancelled()) throw McpCancelledError("Context cancelled");
}

std::size_t Context::on_cancel(std::function<void()> fn) const {
    std::size_t handle = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            handle = state_->next_handle++;
            state_->callbacks.emplace(handle, std::move(fn));
            return handle;
        }
    }
    fn();
    return handle;
}

std::size_t Context::child_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return static_cast<std::size_t>(
        std::count_if(state_->children.begin(), state_->children.end(),
                      [](const std::weak_ptr<State>& w) { return !w.expired(); }));
}

void Context::remove_on_cancel(std::size_t handle) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(handle);
}

} // namespace zmcp
