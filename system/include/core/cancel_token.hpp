// ============= include/core/cancel_token.hpp =============
#pragma once
#include <atomic>
#include <chrono>

namespace facematch {

// Cancelacion cooperativa: el caller llama cancel() o fija un deadline;
// el orquestador consulta is_cancelled() entre matches por cara.
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken() = default;

    static CancelToken with_timeout(std::chrono::milliseconds timeout) {
        CancelToken token;
        token.set_deadline(Clock::now() + timeout);
        return token;
    }

    CancelToken(const CancelToken& other)
        : cancelled(other.cancelled.load()),
          has_deadline(other.has_deadline),
          deadline(other.deadline) {}

    void cancel() { cancelled = true; }

    void set_deadline(Clock::time_point when) {
        deadline = when;
        has_deadline = true;
    }

    bool is_cancelled() const {
        if (cancelled.load()) return true;
        return has_deadline && Clock::now() >= deadline;
    }

private:
    std::atomic<bool> cancelled{false};
    bool has_deadline = false;
    Clock::time_point deadline{};
};

} // namespace facematch
