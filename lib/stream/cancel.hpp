// SPDX-License-Identifier: MIT

// lib/stream/cancel.hpp
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace stage_pipe {

/// Cancellation signal for one request.
///
/// Copies share state. The host cancels once it no longer wants the
/// outcome (see ResultSink::Invalidate); a stage that parks a request,
/// holding resources until some later event, registers a hook to release
/// them early. Hooks run once, on the cancelling thread, outside the lock.
class CancelToken {
public:
    using Hook = std::function<void()>;

    CancelToken() : state_(std::make_shared<State>()) {}

    bool IsCancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    /// Run `hook` on Cancel(), or right away if already cancelled.
    void OnCancel(Hook hook) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled) {
                state_->hooks.push_back(std::move(hook));
                return;
            }
        }
        hook();
    }

    /// Mark cancelled and run every registered hook. Idempotent.
    void Cancel() {
        std::vector<Hook> hooks;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->cancelled) return;
            state_->cancelled = true;
            hooks.swap(state_->hooks);
        }
        for (auto& hook : hooks) hook();
    }

private:
    struct State {
        std::mutex mutex;
        bool cancelled = false;
        std::vector<Hook> hooks;
    };

    std::shared_ptr<State> state_;
};

}  // namespace stage_pipe
