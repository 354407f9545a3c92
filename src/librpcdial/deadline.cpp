#include <rpcdial/deadline.hpp>

#include <timber/timber>

namespace rpcdial {
    deadline::deadline(std::function<void()>&& on_expire) :
        s(std::make_shared<state>(state {
            .clock = timer::monotonic(),
            .on_expire = std::move(on_expire)
        }))
    {}

    deadline::~deadline() {
        if (s && s->watching) s->clock.disarm();
    }

    auto deadline::operator=(deadline&& other) -> deadline& {
        if (std::addressof(other) != this) {
            if (s && s->watching) s->clock.disarm();
            s = std::move(other.s);
        }

        return *this;
    }

    auto deadline::clear() -> void {
        if (!s) return;

        s->expired = false;
        if (s->watching) s->clock.disarm();
    }

    auto deadline::expire() -> void {
        s->expired = true;
        if (s->on_expire) s->on_expire();
    }

    auto deadline::expired() const noexcept -> bool {
        return s && s->expired;
    }

    auto deadline::set(clock::time_point time) -> void {
        if (!s) return;

        clear();
        if (time == clock::time_point()) return;

        const auto remaining = time - clock::now();

        if (remaining <= clock::duration::zero()) {
            TIMBER_TRACE("deadline already passed");
            expire();
            return;
        }

        s->clock.arm(remaining);

        if (!s->watching) watch(s);
    }

    auto deadline::watch(std::shared_ptr<state> s) -> ext::detached_task {
        s->watching = true;
        const auto expirations = co_await s->clock.wait();
        s->watching = false;

        if (expirations == 0) co_return;

        TIMBER_TRACE("{} deadline exceeded", s->clock);

        s->expired = true;
        if (s->on_expire) s->on_expire();
    }
}
