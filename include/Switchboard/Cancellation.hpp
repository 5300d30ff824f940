// =================================================================
// include/Switchboard/Cancellation.hpp
// =================================================================
// Cancellation tokens and bounded execution of blocking sub-calls.

#pragma once

#include "Switchboard/Errors.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace Switchboard {

/**
 * @brief Caller-owned cancellation signal with an optional deadline
 *
 * Shared between the caller and the routing call through a shared_ptr.
 * A token counts as cancelled once cancel() was called or its deadline passed.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    explicit CancellationToken(std::chrono::steady_clock::time_point deadline)
        : m_has_deadline(true), m_deadline(deadline) {}

    /**
     * @brief Create a token that expires after the given timeout
     */
    static std::shared_ptr<CancellationToken> withTimeout(std::chrono::milliseconds timeout) {
        return std::make_shared<CancellationToken>(std::chrono::steady_clock::now() + timeout);
    }

    void cancel() { m_cancelled = true; }

    bool isCancelled() const {
        if (m_cancelled.load()) {
            return true;
        }
        return m_has_deadline && std::chrono::steady_clock::now() >= m_deadline;
    }

    bool hasDeadline() const { return m_has_deadline; }

    std::chrono::steady_clock::time_point deadline() const { return m_deadline; }

    /**
     * @brief Throw Cancelled if the token has fired
     * @param stage Pipeline stage name used in the error message
     */
    void throwIfCancelled(const std::string& stage) const {
        if (isCancelled()) {
            throw Cancelled("Request cancelled during " + stage);
        }
    }

private:
    std::atomic<bool> m_cancelled{false};
    bool m_has_deadline = false;
    std::chrono::steady_clock::time_point m_deadline;
};

/**
 * @brief Run a blocking call on its own thread and wait for it with a bound
 *
 * The call is abandoned, not interrupted: when the timeout elapses or the
 * token fires, the waiting side returns immediately and the worker's result
 * is discarded when it eventually completes. Anything the task needs must be
 * captured by value.
 *
 * @param task The blocking call
 * @param timeout Upper bound on the wait
 * @param token Optional caller cancellation token (may be null)
 * @param operation Name used in error messages
 * @return The task's result
 * @throws OperationTimeout when the bound elapses first
 * @throws Cancelled when the token fires first
 */
template <typename Result>
Result runWithDeadline(std::function<Result()> task,
                       std::chrono::milliseconds timeout,
                       const CancellationToken* token,
                       const std::string& operation) {
    auto promise = std::make_shared<std::promise<Result>>();
    std::future<Result> future = promise->get_future();

    std::thread([promise, task]() {
        try {
            promise->set_value(task());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    const auto poll_slice = std::chrono::milliseconds(5);
    const auto limit = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (token && token->isCancelled()) {
            throw Cancelled(operation + " abandoned: request cancelled");
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= limit) {
            throw OperationTimeout(operation + " timed out after " +
                                   std::to_string(timeout.count()) + "ms");
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(limit - now);
        auto slice = std::min<std::chrono::milliseconds>(remaining, poll_slice);
        if (future.wait_for(slice) == std::future_status::ready) {
            return future.get();
        }
    }
}

} // namespace Switchboard
