// AsyncCondition.hpp - Predicate waiters resumed on notification
#pragma once

#include "CoroTask.hpp"
#include "Cancellation.hpp"
#include "coroIoContext.hpp"

#include <coroutine>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <stdexcept>

/**
 * \file transport/coro/AsyncCondition.hpp
 * \brief Awaitable "wait until predicate holds" primitive.
 * \ingroup coro_module
 */

namespace transport {

class AsyncCondition;

/**
 * \brief Awaitable returned by `AsyncCondition::wait()`.
 * \ingroup coro_module
 *
 * Completes immediately when the predicate already holds; otherwise parks the coroutine in the
 * condition's waiter queue until `notify_all()` observes the predicate true, or until the task is
 * cancelled (then `OperationCancelled` is thrown on resumption).
 */
class ConditionAwaitable {
public:
    ConditionAwaitable(AsyncCondition* condition, std::function<bool()> predicate)
        : condition_(condition), predicate_(std::move(predicate)) {}
    /// Leaves the waiter queue if the awaiting frame is destroyed while parked.
    ~ConditionAwaitable();

    ConditionAwaitable(const ConditionAwaitable&) = delete;
    ConditionAwaitable& operator=(const ConditionAwaitable&) = delete;

    bool await_ready() { return predicate_(); }

    template<typename Promise>
    void await_suspend(std::coroutine_handle<Promise> handle) {
        auto& promise = handle.promise();
        if (!promise.context()) {
            throw std::logic_error("AsyncCondition: task is not bound to a CoroIoContext");
        }
        park(handle, promise.context(), promise.cancellation());
    }

    void await_resume();

private:
    void park(std::coroutine_handle<> handle, CoroIoContext* context, std::shared_ptr<CancellationState> cancellation);

    AsyncCondition* condition_;
    std::function<bool()> predicate_;
    std::shared_ptr<CancellationState> cancellation_;
    bool parked_{false};

    friend class AsyncCondition;
};

/**
 * \brief FIFO queue of coroutines waiting for a predicate over state owned elsewhere.
 * \ingroup coro_module
 *
 * The owner of the guarded state calls `notify_all()` after changing it. Waiters whose predicate
 * holds are posted to their loop; the others stay parked. A resumed waiter should re-check the
 * state in a loop, since it may change again before the waiter runs.
 */
class AsyncCondition {
public:
    AsyncCondition() = default;
    ~AsyncCondition();

    AsyncCondition(const AsyncCondition&) = delete;
    AsyncCondition& operator=(const AsyncCondition&) = delete;

    /** \brief Usage: `co_await cond.wait([&]{ return ready; });` */
    ConditionAwaitable wait(std::function<bool()> predicate) {
        return ConditionAwaitable(this, std::move(predicate));
    }

    /** \brief Re-evaluate every waiter and schedule the satisfied ones. */
    void notify_all();

    /** \brief Number of parked waiters. */
    size_t waiting_count() const { return waiters_.size(); }

private:
    struct Waiter {
        uint64_t id;
        std::coroutine_handle<> handle;
        ConditionAwaitable* awaiter;
        CoroIoContext* context;
    };

    uint64_t enqueue(std::coroutine_handle<> handle, ConditionAwaitable* awaiter, CoroIoContext* context);
    /** \brief Cancellation path: drop waiter `id` and schedule it so it can throw. */
    void release_cancelled(uint64_t id);
    void forget(ConditionAwaitable* awaiter);

    std::deque<Waiter> waiters_;
    uint64_t next_waiter_id_{1};

    friend class ConditionAwaitable;
};

} // namespace transport
