#include <rpcdial/runtime.hpp>

#include <ext/except.h>
#include <stdexcept>
#include <sys/socket.h>
#include <timber/timber>
#include <utility>

namespace {
    thread_local rpcdial::runtime* instance = nullptr;

    auto wake(std::coroutine_handle<>& slot, std::size_t& blocked) -> void {
        const auto coroutine = std::exchange(slot, nullptr);
        if (!coroutine) return;

        --blocked;
        coroutine.resume();
    }
}

namespace rpcdial {
    auto runtime::active() noexcept -> bool { return instance != nullptr; }

    auto runtime::current() -> runtime& {
        if (!instance) {
            throw std::logic_error("no runtime is active in this thread");
        }

        return *instance;
    }

    runtime::runtime() :
        epoll(epoll_create1(EPOLL_CLOEXEC)),
        ready(SOMAXCONN)
    {
        if (!epoll.valid()) throw ext::system_error("epoll_create1");

        if (instance) {
            throw std::logic_error("a runtime is already active in this thread");
        }

        instance = this;
        TIMBER_TRACE("{} created", *this);
    }

    runtime::~runtime() {
        TIMBER_TRACE("{} destroyed", *this);
        instance = nullptr;
    }

    auto runtime::descriptor() const noexcept -> int { return epoll; }

    auto runtime::forget(const watcher* w) noexcept -> void {
        for (auto i = 0; i < ready_count; ++i) {
            if (ready[i].data.ptr == w) ready[i].data.ptr = nullptr;
        }
    }

    auto runtime::poll(bool block) -> void {
        ready_count = epoll_wait(
            epoll,
            ready.data(),
            static_cast<int>(ready.size()),
            block ? -1 : 0
        );

        if (ready_count == -1) {
            ready_count = 0;
            if (errno == EINTR) return;
            throw ext::system_error("epoll_wait");
        }

        TIMBER_TRACE(
            "{} {:L} of {:L} waiting descriptor{} ready",
            *this,
            ready_count,
            blocked,
            blocked == 1 ? "" : "s"
        );

        // Watchers destroyed while handling this batch clear their entries.
        for (auto i = 0; i < ready_count; ++i) {
            const auto& entry = ready[i];
            if (auto* const w = static_cast<watcher*>(entry.data.ptr)) {
                w->notify(entry.events);
            }
        }

        ready_count = 0;
    }

    auto runtime::run() -> void {
        TIMBER_TRACE("{} running", *this);

        while (blocked > 0 || !scheduled.empty()) {
            poll(scheduled.empty());
            scheduled.resume_all();
        }

        TIMBER_TRACE("{} idle", *this);
    }

    auto runtime::schedule(detail::awaiter& a) -> void { scheduled.push(a); }

    auto runtime::schedule(detail::awaiter_queue& awaiters) -> void {
        scheduled.splice(awaiters);
    }

    auto runtime::watch(watcher& w, std::uint32_t events) -> void {
        auto entry = epoll_event {
            .events = events | EPOLLET,
            .data = {.ptr = &w}
        };

        if (epoll_ctl(epoll, EPOLL_CTL_ADD, w.descriptor, &entry) == -1) {
            throw ext::system_error(fmt::format(
                "failed to watch fd ({})",
                w.descriptor
            ));
        }

        TIMBER_TRACE("{} watching fd ({})", *this, w.descriptor);
    }

    runtime::watcher::watcher(runtime& owner, int fd) :
        owner(owner),
        descriptor(fd)
    {}

    runtime::watcher::~watcher() { owner.forget(this); }

    auto runtime::watcher::create(int fd, std::uint32_t events)
        -> std::shared_ptr<watcher>
    {
        auto& rt = current();
        auto result = std::shared_ptr<watcher>(new watcher(rt, fd));

        rt.watch(*result, events);
        return result;
    }

    auto runtime::watcher::cancel() -> void {
        const auto self = shared_from_this();
        stopped = true;

        wake(reader, owner.blocked);
        wake(writer, owner.blocked);
    }

    auto runtime::watcher::canceled() const noexcept -> bool {
        return stopped;
    }

    auto runtime::watcher::fd() const noexcept -> int { return descriptor; }

    auto runtime::watcher::in() -> readiness {
        return readiness(shared_from_this(), reader);
    }

    auto runtime::watcher::notify(std::uint32_t events) -> void {
        const auto self = shared_from_this();
        last = events;

        // Errors and hangups concern both directions.
        const auto failed = (events & (EPOLLERR | EPOLLHUP)) != 0;

        if (failed || (events & EPOLLIN)) wake(reader, owner.blocked);
        if (failed || (events & EPOLLOUT)) wake(writer, owner.blocked);
    }

    auto runtime::watcher::out() -> readiness {
        return readiness(shared_from_this(), writer);
    }

    auto runtime::watcher::reset() noexcept -> void { stopped = false; }

    runtime::watcher::readiness::readiness(
        std::shared_ptr<watcher>&& source,
        std::coroutine_handle<>& slot
    ) noexcept :
        source(std::move(source)),
        slot(slot)
    {}

    runtime::watcher::readiness::~readiness() {
        // The waiting coroutine was destroyed before the descriptor
        // became ready.
        if (self && slot == self) {
            slot = nullptr;
            --source->owner.blocked;
        }
    }

    auto runtime::watcher::readiness::await_ready() const noexcept -> bool {
        return source->stopped;
    }

    auto runtime::watcher::readiness::await_suspend(
        std::coroutine_handle<> coroutine
    ) -> void {
        if (slot) {
            throw std::logic_error(fmt::format(
                "fd ({}) already has a waiting coroutine",
                source->descriptor
            ));
        }

        self = coroutine;
        slot = coroutine;
        ++source->owner.blocked;
    }

    auto runtime::watcher::readiness::await_resume() noexcept
        -> std::uint32_t
    {
        return source->stopped ? 0 : source->last;
    }

    auto run() -> void {
        if (instance) instance->run();
        else runtime().run();
    }

    auto yield() -> ext::task<> {
        class next_iteration {
            detail::awaiter self;
        public:
            auto await_ready() const noexcept -> bool { return false; }

            auto await_suspend(std::coroutine_handle<> coroutine) -> void {
                self.coroutine = coroutine;
                runtime::current().schedule(self);
            }

            auto await_resume() const noexcept -> void {}
        };

        co_await next_iteration();
    }
}
