#include <rpcdial/timer.hpp>

#include <cerrno>
#include <ext/except.h>
#include <sys/timerfd.h>
#include <timber/timber>
#include <unistd.h>

using std::chrono::duration_cast;
using std::chrono::nanoseconds;
using std::chrono::seconds;

namespace {
    auto to_timespec(nanoseconds ns) -> timespec {
        const auto whole = duration_cast<seconds>(ns);

        auto spec = timespec();
        spec.tv_sec = whole.count();
        spec.tv_nsec = (ns - whole).count();
        return spec;
    }
}

namespace rpcdial {
    auto timer::monotonic() -> timer {
        auto result = timer();

        result.descriptor = rpcdial::fd(
            timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)
        );

        if (!result.descriptor.valid()) {
            throw ext::system_error("timerfd_create");
        }

        result.watcher = runtime::watcher::create(result.descriptor, EPOLLIN);
        return result;
    }

    auto timer::arm(nanoseconds first, nanoseconds interval) -> void {
        // A zero value would disarm the timerfd instead.
        if (first <= nanoseconds::zero()) first = nanoseconds(1);

        auto spec = itimerspec();
        spec.it_value = to_timespec(first);
        spec.it_interval = to_timespec(interval);

        if (timerfd_settime(descriptor, 0, &spec, nullptr) == -1) {
            throw ext::system_error("timerfd_settime");
        }

        watcher->reset();

        TIMBER_TRACE(
            "{} armed: {:L}ns, repeating every {:L}ns",
            *this,
            first.count(),
            interval.count()
        );
    }

    auto timer::disarm() -> void {
        const auto spec = itimerspec();

        if (timerfd_settime(descriptor, 0, &spec, nullptr) == -1) {
            throw ext::system_error("timerfd_settime");
        }

        watcher->cancel();
        TIMBER_TRACE("{} disarmed", *this);
    }

    auto timer::fd() const noexcept -> int { return descriptor; }

    auto timer::valid() const noexcept -> bool { return descriptor.valid(); }

    auto timer::wait() -> ext::task<std::uint64_t> {
        auto expirations = std::uint64_t(0);

        while (::read(descriptor, &expirations, sizeof(expirations)) == -1) {
            if (errno != EAGAIN) throw ext::system_error("timerfd read");
            if (!co_await watcher->in()) co_return 0;
        }

        co_return expirations;
    }
}
