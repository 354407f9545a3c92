#pragma once

#include "detail/awaiter.hpp"
#include "fd.hpp"

#include <cstdint>
#include <ext/coroutine>
#include <memory>
#include <sys/epoll.h>
#include <vector>

namespace rpcdial {
    /// A single-threaded event loop. At most one runtime exists per thread.
    class runtime {
    public:
        /// Readiness notifications for one file descriptor.
        /// At most one coroutine waits for each direction at a time.
        class watcher : public std::enable_shared_from_this<watcher> {
            friend class runtime;

            runtime& owner;
            int descriptor;
            std::uint32_t last = 0;
            bool stopped = false;
            std::coroutine_handle<> reader;
            std::coroutine_handle<> writer;

            watcher(runtime& owner, int fd);

            auto notify(std::uint32_t events) -> void;
        public:
            class readiness {
                std::shared_ptr<watcher> source;
                std::coroutine_handle<>& slot;
                std::coroutine_handle<> self;
            public:
                readiness(
                    std::shared_ptr<watcher>&& source,
                    std::coroutine_handle<>& slot
                ) noexcept;

                readiness(const readiness&) = delete;

                ~readiness();

                auto await_ready() const noexcept -> bool;

                auto await_suspend(std::coroutine_handle<> coroutine) -> void;

                /// Returns the received events, or 0 if the watcher was
                /// canceled.
                [[nodiscard]]
                auto await_resume() noexcept -> std::uint32_t;
            };

            static auto create(int fd, std::uint32_t events)
                -> std::shared_ptr<watcher>;

            watcher(const watcher&) = delete;

            ~watcher();

            auto operator=(const watcher&) -> watcher& = delete;

            /// Wakes both waiting coroutines. Later waits complete
            /// immediately until 'reset' is called.
            auto cancel() -> void;

            auto canceled() const noexcept -> bool;

            auto fd() const noexcept -> int;

            auto in() -> readiness;

            auto out() -> readiness;

            auto reset() noexcept -> void;
        };

        static auto active() noexcept -> bool;

        static auto current() -> runtime&;

        runtime();

        runtime(const runtime&) = delete;

        ~runtime();

        auto operator=(const runtime&) -> runtime& = delete;

        auto descriptor() const noexcept -> int;

        /// Processes events until no coroutine is waiting on
        /// a file descriptor and nothing is scheduled.
        auto run() -> void;

        /// Resumes the awaiter on the next loop iteration.
        auto schedule(detail::awaiter& a) -> void;

        auto schedule(detail::awaiter_queue& awaiters) -> void;
    private:
        fd epoll;
        std::vector<epoll_event> ready;
        int ready_count = 0;
        detail::awaiter_queue scheduled;
        std::size_t blocked = 0;

        auto forget(const watcher* w) noexcept -> void;

        auto poll(bool block) -> void;

        auto watch(watcher& w, std::uint32_t events) -> void;
    };

    auto run() -> void;

    /// Runs the task to completion on the thread's runtime, creating a
    /// runtime for the duration of the call if none is active.
    template <typename R>
    auto run(ext::task<R>&& task) -> R {
        const auto start = [&task]() -> ext::jtask<R> {
            co_return co_await std::move(task);
        };

        if (runtime::active()) {
            auto job = start();
            runtime::current().run();
            return std::move(job).result();
        }

        auto rt = runtime();
        auto job = start();
        rt.run();
        return std::move(job).result();
    }

    /// Suspends the calling coroutine until the next loop iteration.
    auto yield() -> ext::task<>;
}

template <>
struct fmt::formatter<rpcdial::runtime> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const rpcdial::runtime& rt, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "runtime ({})", rt.descriptor());
    }
};
