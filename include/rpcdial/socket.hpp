#pragma once

#include "deadline.hpp"
#include "fd.hpp"
#include "runtime.hpp"

#include <chrono>
#include <ext/coroutine>
#include <fmt/format.h>
#include <sys/socket.h>

namespace rpcdial {
    /// A nonblocking stream socket driven by the runtime.
    class socket {
        rpcdial::fd descriptor;
        std::shared_ptr<runtime::watcher> watcher;
        rpcdial::deadline timeout;

        [[noreturn]]
        auto interrupted() const -> void;
    public:
        socket() = default;

        /// Takes ownership of a nonblocking socket descriptor.
        explicit socket(int fd);

        socket(int domain, int type, int protocol);

        /// Throws 'closed_error' or 'timeout_error' when the socket can no
        /// longer be used.
        auto check() const -> void;

        /// Cancels pending operations and closes the descriptor.
        auto close() noexcept -> void;

        /// Connects to the given address.
        /// Throws 'ext::system_error' when the peer cannot be reached.
        auto connect(const sockaddr* addr, socklen_t len) -> ext::task<>;

        auto fd() const noexcept -> int;

        auto read(void* dest, std::size_t len) -> ext::task<std::size_t>;

        /// Waits until the socket can be read without blocking.
        auto readable() -> ext::task<>;

        auto set_deadline(clock::time_point time) -> void;

        auto set_keep_alive(std::chrono::seconds period) -> void;

        auto valid() const noexcept -> bool;

        /// Waits until the socket can be written without blocking.
        auto writable() -> ext::task<>;

        auto write(const void* src, std::size_t len) -> ext::task<std::size_t>;
    };
}

template <>
struct fmt::formatter<rpcdial::socket> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const rpcdial::socket& socket, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "socket ({})", socket.fd());
    }
};
