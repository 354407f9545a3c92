#pragma once

#include "detail/awaiter.hpp"

#include <ext/coroutine>

namespace rpcdial {
    /// Wakes coroutines waiting for something to happen inside the process.
    /// Listeners resume on the next iteration of the runtime.
    class event {
        detail::awaiter_queue listeners;
    public:
        /// Resumes every listener with a 'task_canceled' exception.
        auto cancel() -> void;

        auto emit() -> void;

        auto listen() -> ext::task<>;

        auto listening() const noexcept -> bool;
    };
}
