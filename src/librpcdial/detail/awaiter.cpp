#include <rpcdial/detail/awaiter.hpp>

#include <utility>

namespace rpcdial::detail {
    auto awaiter_queue::empty() const noexcept -> bool {
        return first == nullptr;
    }

    auto awaiter_queue::fail(std::exception_ptr ex) noexcept -> void {
        for (auto* a = first; a; a = a->next) a->failure = ex;
    }

    auto awaiter_queue::pop() noexcept -> awaiter* {
        auto* const a = first;
        if (!a) return nullptr;

        first = std::exchange(a->next, nullptr);
        if (!first) last = nullptr;

        return a;
    }

    auto awaiter_queue::push(awaiter& a) noexcept -> void {
        a.next = nullptr;

        if (last) last->next = &a;
        else first = &a;

        last = &a;
    }

    auto awaiter_queue::resume_all() -> void {
        // Coroutines resumed below may queue themselves again.
        auto* a = std::exchange(first, nullptr);
        last = nullptr;

        while (a) {
            // The awaiter goes away with its coroutine's suspension.
            const auto coroutine = a->coroutine;
            a = a->next;

            if (!coroutine.done()) coroutine.resume();
        }
    }

    auto awaiter_queue::size() const noexcept -> std::size_t {
        auto n = std::size_t(0);
        for (auto* a = first; a; a = a->next) ++n;
        return n;
    }

    auto awaiter_queue::splice(awaiter_queue& other) noexcept -> void {
        if (!other.first) return;

        if (last) last->next = other.first;
        else first = other.first;

        last = std::exchange(other.last, nullptr);
        other.first = nullptr;
    }

    queued::queued(awaiter_queue& queue) noexcept : queue(queue) {}

    auto queued::await_suspend(std::coroutine_handle<> coroutine) noexcept
        -> void
    {
        self.coroutine = coroutine;
        queue.push(self);
    }

    auto queued::await_resume() const -> void {
        if (self.failure) std::rethrow_exception(self.failure);
    }
}
