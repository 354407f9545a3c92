#pragma once

#include "fd.hpp"
#include "runtime.hpp"

#include <chrono>
#include <cstdint>
#include <fmt/format.h>

namespace rpcdial {
    /// A monotonic clock timer backed by a timerfd.
    class timer {
        rpcdial::fd descriptor;
        std::shared_ptr<runtime::watcher> watcher;
    public:
        static auto monotonic() -> timer;

        timer() = default;

        /// Expires after 'first', then every 'interval' if it is nonzero.
        auto arm(
            std::chrono::nanoseconds first,
            std::chrono::nanoseconds interval = {}
        ) -> void;

        /// Stops the timer and wakes a pending 'wait'.
        auto disarm() -> void;

        auto fd() const noexcept -> int;

        auto valid() const noexcept -> bool;

        /// Returns the number of expirations since the last wait,
        /// or 0 if the timer was disarmed.
        auto wait() -> ext::task<std::uint64_t>;
    };

    template <typename Rep, typename Period>
    auto sleep_for(std::chrono::duration<Rep, Period> duration)
        -> ext::task<>
    {
        auto t = timer::monotonic();
        t.arm(duration);

        static_cast<void>(co_await t.wait());
    }
}

template <>
struct fmt::formatter<rpcdial::timer> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const rpcdial::timer& timer, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "timer ({})", timer.fd());
    }
};
