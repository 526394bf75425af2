/**
 * \file Cancellation.hpp
 * \brief One-shot cooperative cancellation shared by a task and the children it awaits.
 * \details A supervised task owns one `CancellationState`. Every `Task<T>` it awaits inherits
 * the same state, so a request made by `TaskSupervisor::cancel_key_tasks()` surfaces at whichever
 * suspension point the task chain is parked on. The request is consumed when delivered: awaits
 * performed afterwards (e.g. from cleanup code that emits a "finished" event) proceed normally.
 */
#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace transport {

/** \ingroup coro_module
 *  \brief Raised at a suspension point of a task whose cancellation was requested. */
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
    explicit OperationCancelled(const std::string& what) : std::runtime_error(what) {}
};

/** \ingroup coro_module
 *  \brief Cancellation request flag plus an optional waker for tasks parked outside the event loop.
 */
class CancellationState {
public:
    /** \brief Request cancellation; wakes a parked waiter so it can observe the request. */
    void request() {
        requested_ = true;
        if (waker_) {
            auto waker = std::move(waker_);
            waker_ = nullptr;
            waker();
        }
    }

    /** \brief True while a request is pending (not yet delivered). */
    bool requested() const { return requested_; }

    /** \brief Deliver a pending request: clears it and returns true if one was pending. */
    bool consume() {
        const bool pending = requested_;
        requested_ = false;
        return pending;
    }

    /** \brief Throw `OperationCancelled` if a request is pending. */
    void throw_if_requested() {
        if (consume()) {
            throw OperationCancelled();
        }
    }

    /** \brief Install the callback that re-schedules a parked waiter on request(). */
    void set_waker(std::function<void()> waker) { waker_ = std::move(waker); }
    void clear_waker() { waker_ = nullptr; }

private:
    bool requested_{false};
    std::function<void()> waker_;
};

} // namespace transport
