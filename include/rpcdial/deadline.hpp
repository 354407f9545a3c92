#pragma once

#include "timer.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace rpcdial {
    using clock = std::chrono::steady_clock;

    /// An absolute point in time after which I/O on a connection fails.
    /// When the deadline passes, the expiry handler runs once so that
    /// suspended operations can be woken up.
    class deadline {
        struct state {
            timer clock;
            std::function<void()> on_expire;
            bool expired = false;
            bool watching = false;
        };

        std::shared_ptr<state> s;

        static auto watch(std::shared_ptr<state> s) -> ext::detached_task;

        auto expire() -> void;
    public:
        deadline() = default;

        explicit deadline(std::function<void()>&& on_expire);

        deadline(const deadline&) = delete;

        deadline(deadline&&) = default;

        ~deadline();

        auto operator=(const deadline&) -> deadline& = delete;

        auto operator=(deadline&& other) -> deadline&;

        /// Removes the deadline and forgets a previous expiration.
        auto clear() -> void;

        auto expired() const noexcept -> bool;

        /// Sets the deadline. A default constructed time point clears it;
        /// a time point that already passed expires immediately.
        auto set(clock::time_point time) -> void;
    };
}
