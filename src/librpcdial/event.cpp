#include <rpcdial/event.hpp>
#include <rpcdial/except.hpp>
#include <rpcdial/runtime.hpp>

namespace rpcdial {
    auto event::cancel() -> void {
        listeners.fail(std::make_exception_ptr(task_canceled()));
        emit();
    }

    auto event::emit() -> void {
        if (!listeners.empty()) runtime::current().schedule(listeners);
    }

    auto event::listen() -> ext::task<> {
        co_await detail::queued(listeners);
    }

    auto event::listening() const noexcept -> bool {
        return !listeners.empty();
    }
}
