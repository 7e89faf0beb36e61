//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: Awaiter enabling co_await on std::future inside Task coroutines
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <thread>
#include <utility>

namespace lmcp {
namespace async {

//==========================================================================================================
// FutureAwaitable<T>
// Purpose: Suspends the awaiting coroutine until the future is ready.
// Notes:
//   A ready future resumes inline. Otherwise a detached waiter thread blocks on the future and resumes
//   the coroutine there, so code after the co_await runs on that thread. The stored value or exception
//   surfaces from await_resume via get().
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread([this, h]() mutable {
            fut.wait();
            h.resume();
        }).detach();
    }

    T await_resume() { return fut.get(); }

private:
    std::future<T> fut;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace lmcp
