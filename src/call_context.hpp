#pragma once
#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace agentmem {

// Deadline and cancellation handed down by the caller and propagated to every
// external call (store query, embedding request).
// A default-constructed context never expires and cannot be cancelled.
struct CallContext {
    using Clock = std::chrono::steady_clock;

    std::optional<Clock::time_point> deadline;
    const std::atomic<bool>* cancel = nullptr; // must outlive the call

    static CallContext within(std::chrono::milliseconds timeout,
                              const std::atomic<bool>* cancel_flag = nullptr) {
        CallContext ctx;
        ctx.deadline = Clock::now() + timeout;
        ctx.cancel = cancel_flag;
        return ctx;
    }

    bool cancelled() const {
        return cancel && cancel->load(std::memory_order_relaxed);
    }

    bool expired() const {
        return deadline && Clock::now() >= *deadline;
    }

    // Milliseconds left before the deadline, or `fallback` when there is none.
    // Never returns less than 1 so it can be handed to a transport timeout.
    long remaining_ms(long fallback) const {
        if (!deadline) return fallback;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline - Clock::now()).count();
        if (left < 1) return 1;
        return left < fallback ? static_cast<long>(left) : fallback;
    }

    // Throws DependencyUnavailable if the call must not proceed.
    void check(const std::string& what) const {
        if (cancelled()) throw DependencyUnavailable(what + ": cancelled");
        if (expired()) throw DependencyUnavailable(what + ": deadline exceeded");
    }
};

} // namespace agentmem
