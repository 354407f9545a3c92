#pragma once

#include <coroutine>
#include <cstddef>
#include <exception>

namespace rpcdial::detail {
    /// A suspended coroutine. Lives in the coroutine's frame for as long
    /// as the coroutine waits.
    struct awaiter {
        std::coroutine_handle<> coroutine;
        awaiter* next = nullptr;
        std::exception_ptr failure;
    };

    /// An intrusive FIFO list of suspended coroutines.
    class awaiter_queue {
        awaiter* first = nullptr;
        awaiter* last = nullptr;
    public:
        awaiter_queue() = default;

        awaiter_queue(const awaiter_queue&) = delete;

        auto operator=(const awaiter_queue&) -> awaiter_queue& = delete;

        auto empty() const noexcept -> bool;

        /// Makes every queued coroutine throw 'ex' when it resumes.
        auto fail(std::exception_ptr ex) noexcept -> void;

        auto pop() noexcept -> awaiter*;

        auto push(awaiter& a) noexcept -> void;

        /// Resumes the coroutines queued at the time of the call, in order.
        auto resume_all() -> void;

        auto size() const noexcept -> std::size_t;

        /// Moves every awaiter in 'other' to the back of this queue.
        auto splice(awaiter_queue& other) noexcept -> void;
    };

    /// Suspends the awaiting coroutine at the back of a queue.
    class queued {
        awaiter self;
        awaiter_queue& queue;
    public:
        explicit queued(awaiter_queue& queue) noexcept;

        auto await_ready() const noexcept -> bool { return false; }

        auto await_suspend(std::coroutine_handle<> coroutine) noexcept
            -> void;

        auto await_resume() const -> void;
    };
}
