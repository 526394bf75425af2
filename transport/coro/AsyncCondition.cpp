#include "AsyncCondition.hpp"

#include <algorithm>
#include <utility>

/**
 * \file transport/coro/AsyncCondition.cpp
 * \brief Implements the waiter queue behind `AsyncCondition`.
 * \ingroup coro_module
 */

// Design overview:
// - await_ready evaluates the predicate so satisfied waits never suspend.
// - park() queues the coroutine and installs a waker on its cancellation state; a cancel request
//   removes the waiter and posts it, and await_resume then throws OperationCancelled.
// - notify_all() posts satisfied waiters in FIFO order instead of resuming them inline, so the
//   notifier keeps running undisturbed.

namespace transport {

void ConditionAwaitable::park(std::coroutine_handle<> handle, CoroIoContext* context,
                              std::shared_ptr<CancellationState> cancellation) {
    cancellation_ = std::move(cancellation);
    const uint64_t id = condition_->enqueue(handle, this, context);
    parked_ = true;
    if (cancellation_) {
        AsyncCondition* condition = condition_;
        cancellation_->set_waker([condition, id]() { condition->release_cancelled(id); });
    }
}

ConditionAwaitable::~ConditionAwaitable() {
    if (parked_) {
        if (cancellation_) cancellation_->clear_waker();
        condition_->forget(this);
    }
}

void ConditionAwaitable::await_resume() {
    if (cancellation_) {
        cancellation_->clear_waker();
        cancellation_->throw_if_requested();
    }
}

AsyncCondition::~AsyncCondition() {
    // Parked coroutines must not outlive the condition they reference.
    while (!waiters_.empty()) {
        auto waiter = waiters_.front();
        waiters_.pop_front();
        waiter.awaiter->parked_ = false;
        if (waiter.awaiter->cancellation_) {
            waiter.awaiter->cancellation_->clear_waker();
            waiter.awaiter->cancellation_->request();
        }
        waiter.context->post(waiter.handle);
    }
}

uint64_t AsyncCondition::enqueue(std::coroutine_handle<> handle, ConditionAwaitable* awaiter, CoroIoContext* context) {
    const uint64_t id = next_waiter_id_++;
    waiters_.push_back(Waiter{id, handle, awaiter, context});
    return id;
}

void AsyncCondition::notify_all() {
    std::deque<Waiter> still_waiting;
    std::deque<Waiter> satisfied;
    for (auto& waiter : waiters_) {
        if (waiter.awaiter->predicate_()) {
            satisfied.push_back(waiter);
        } else {
            still_waiting.push_back(waiter);
        }
    }
    waiters_.swap(still_waiting);

    for (auto& waiter : satisfied) {
        waiter.awaiter->parked_ = false;
        if (waiter.awaiter->cancellation_) {
            waiter.awaiter->cancellation_->clear_waker();
        }
        waiter.context->post(waiter.handle);
    }
}

void AsyncCondition::release_cancelled(uint64_t id) {
    auto it = std::find_if(waiters_.begin(), waiters_.end(), [id](const Waiter& w) { return w.id == id; });
    if (it == waiters_.end()) {
        return;
    }
    auto waiter = *it;
    waiters_.erase(it);
    waiter.awaiter->parked_ = false;
    waiter.context->post(waiter.handle);
}

void AsyncCondition::forget(ConditionAwaitable* awaiter) {
    auto it = std::find_if(waiters_.begin(), waiters_.end(),
                           [awaiter](const Waiter& w) { return w.awaiter == awaiter; });
    if (it != waiters_.end()) {
        waiters_.erase(it);
    }
}

} // namespace transport
