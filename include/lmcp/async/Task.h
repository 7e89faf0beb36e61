//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Coroutine return type that hands its result out as a std::future
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <utility>

namespace lmcp {
namespace async {

namespace detail {

// Shared promise plumbing: eager start, self-destroying frame, exceptions routed into the future.
template <typename T>
struct PromiseBase {
    std::promise<T> promise;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};

} // namespace detail

//==========================================================================================================
// Task<T>
// Purpose: Eager coroutine whose co_return value (or escaping exception) lands in a std::future<T>.
// Notes:
//   The frame outlives the caller's stack, so coroutine parameters must be taken by value.
//   Usage: Task<int> f() { co_return 1; }  ->  f().toFuture().get()
//==========================================================================================================
template <typename T>
class Task {
public:
    struct promise_type : detail::PromiseBase<T> {
        Task get_return_object() { return Task{ this->promise.get_future() }; }
        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

template <>
class Task<void> {
public:
    struct promise_type : detail::PromiseBase<void> {
        Task get_return_object() { return Task{ this->promise.get_future() }; }
        void return_void() { this->promise.set_value(); }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<void>&& f) : fut(std::move(f)) {}
    std::future<void> fut;
};

} // namespace async
} // namespace lmcp
