//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BoundedCall.h
// Purpose: One handler invocation with explicit start, await-with-timeout and cancel semantics
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace mcpstdio {
namespace async {

enum class CallOutcome {
    Completed,   // handler returned or threw; TakeResult() yields the value or rethrows
    TimedOut,    // deadline passed first; stop was requested on the handler's token
    Cancelled    // Cancel() happened before completion (or before start)
};

//==========================================================================================================
// BoundedCall<R>
// Purpose: Runs fn(stop_token) on a worker thread and lets the caller wait for it with a deadline.
// Lifecycle:
//   Start()  - launches the worker. Returns false (and launches nothing) when Cancel() came first.
//   Await(t) - blocks until completion, cancellation or timeout (t == 0 waits without deadline).
//   Cancel() - thread-safe; prevents a pending start, or requests stop and wakes Await() early.
// Notes:
//   The worker owns a reference to the shared state, so abandoning a timed-out call is safe; the
//   handler keeps running until it observes its stop token or returns, and its result is dropped.
//==========================================================================================================
template <typename R>
class BoundedCall {
public:
    using Fn = std::function<R(std::stop_token)>;

    explicit BoundedCall(Fn fn) : state(std::make_shared<State>()) {
        state->fn = std::move(fn);
    }

    BoundedCall(const BoundedCall&) = delete;
    BoundedCall& operator=(const BoundedCall&) = delete;

    bool Start() {
        std::shared_ptr<State> s = state;
        {
            std::lock_guard<std::mutex> lock(s->mutex);
            if (s->cancelled || s->started) {
                return false;
            }
            s->started = true;
        }
        std::thread([s]() {
            std::optional<R> value;
            std::exception_ptr error;
            try {
                value.emplace(s->fn(s->stopSource.get_token()));
            } catch (...) {
                // Carried to the awaiting thread and rethrown by TakeResult()
                error = std::current_exception();
            }
            {
                std::lock_guard<std::mutex> lock(s->mutex);
                s->result = std::move(value);
                s->error = error;
                s->done = true;
            }
            s->cv.notify_all();
        }).detach();
        return true;
    }

    CallOutcome Await(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(state->mutex);
        auto ready = [this]() { return state->done || state->cancelled; };
        if (timeout.count() > 0) {
            if (!state->cv.wait_for(lock, timeout, ready)) {
                lock.unlock();
                state->stopSource.request_stop();
                return CallOutcome::TimedOut;
            }
        } else {
            state->cv.wait(lock, ready);
        }
        // Cancel() only marks calls that had not finished, so it wins over a completion racing with it.
        return state->cancelled ? CallOutcome::Cancelled : CallOutcome::Completed;
    }

    void Cancel() {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->done) {
                return;
            }
            state->cancelled = true;
        }
        state->stopSource.request_stop();
        state->cv.notify_all();
    }

    // Only valid after Await() returned Completed.
    R TakeResult() {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->done) {
            throw std::logic_error("BoundedCall::TakeResult before completion");
        }
        if (state->error) {
            std::rethrow_exception(state->error);
        }
        return std::move(*state->result);
    }

    bool Started() const {
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->started;
    }

private:
    struct State {
        Fn fn;
        std::stop_source stopSource;
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool started{false};
        bool cancelled{false};
        bool done{false};
        std::optional<R> result;
        std::exception_ptr error;
    };

    std::shared_ptr<State> state;
};

} // namespace async
} // namespace mcpstdio
