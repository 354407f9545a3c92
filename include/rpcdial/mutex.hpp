#pragma once

#include "detail/awaiter.hpp"
#include "runtime.hpp"

#include <ext/coroutine>
#include <utility>

namespace rpcdial {
    /// Serializes access to a value shared between coroutines.
    /// Ownership passes to waiters in the order they asked for it.
    template <typename T>
    class mutex {
        T value;
        detail::awaiter_queue queue;
        bool owned = false;

        auto release() -> void {
            auto* const next = queue.pop();

            if (next) runtime::current().schedule(*next);
            else owned = false;
        }
    public:
        /// Grants access to the value until destroyed.
        class guard {
            friend class mutex;

            mutex* owner = nullptr;

            explicit guard(mutex& owner) noexcept : owner(&owner) {}
        public:
            guard() = default;

            guard(const guard&) = delete;

            guard(guard&& other) noexcept :
                owner(std::exchange(other.owner, nullptr))
            {}

            ~guard() { unlock(); }

            auto operator=(const guard&) -> guard& = delete;

            auto operator=(guard&& other) -> guard& {
                if (this != &other) {
                    unlock();
                    owner = std::exchange(other.owner, nullptr);
                }

                return *this;
            }

            auto operator*() const noexcept -> T& { return owner->value; }

            auto operator->() const noexcept -> T* { return &owner->value; }

            auto unlock() -> void {
                if (auto* const m = std::exchange(owner, nullptr)) {
                    m->release();
                }
            }
        };

        template <typename... Args>
        explicit mutex(Args&&... args) : value(std::forward<Args>(args)...) {}

        mutex(const mutex&) = delete;

        auto operator=(const mutex&) -> mutex& = delete;

        auto lock() -> ext::task<guard> {
            if (owned) co_await detail::queued(queue);
            else owned = true;

            co_return guard(*this);
        }

        auto locked() const noexcept -> bool { return owned; }

        auto waiting() const noexcept -> std::size_t { return queue.size(); }
    };
}
