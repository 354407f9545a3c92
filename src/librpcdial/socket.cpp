#include <rpcdial/except.hpp>
#include <rpcdial/socket.hpp>

#include <cerrno>
#include <ext/except.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <timber/timber>

namespace {
    auto would_block() noexcept -> bool {
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }

    auto set_option(int fd, int level, int name, int value) -> void {
        if (setsockopt(fd, level, name, &value, sizeof(value)) == -1) {
            throw ext::system_error("setsockopt");
        }
    }
}

namespace rpcdial {
    socket::socket(int fd) :
        descriptor(fd),
        watcher(runtime::watcher::create(fd, EPOLLIN | EPOLLOUT)),
        timeout([w = watcher] { w->cancel(); })
    {
        TIMBER_TRACE("{} open", *this);
    }

    socket::socket(int domain, int type, int protocol) :
        socket([&] {
            const auto fd = ::socket(
                domain,
                type | SOCK_NONBLOCK | SOCK_CLOEXEC,
                protocol
            );

            if (fd == -1) throw ext::system_error("socket");
            return fd;
        }())
    {}

    auto socket::check() const -> void {
        if (!descriptor.valid()) throw closed_error();
        if (timeout.expired()) throw timeout_error();
    }

    auto socket::close() noexcept -> void {
        if (!descriptor.valid()) return;

        TIMBER_DEBUG("{} closing", *this);

        timeout.clear();
        descriptor.close();
        watcher->cancel();
    }

    auto socket::connect(const sockaddr* addr, socklen_t len)
        -> ext::task<>
    {
        if (::connect(descriptor, addr, len) == -1) {
            if (errno != EINPROGRESS) throw ext::system_error("connect");

            co_await writable();

            auto error = 0;
            auto size = socklen_t(sizeof(error));

            if (getsockopt(descriptor, SOL_SOCKET, SO_ERROR, &error, &size)
                == -1)
                throw ext::system_error("getsockopt");

            if (error != 0) {
                errno = error;
                throw ext::system_error("connect");
            }
        }

        TIMBER_DEBUG("{} connected", *this);
    }

    auto socket::fd() const noexcept -> int { return descriptor; }

    auto socket::read(void* dest, std::size_t len) -> ext::task<std::size_t> {
        while (true) {
            check();

            const auto n = ::recv(descriptor, dest, len, 0);

            if (n >= 0) {
                TIMBER_TRACE("{} received {:L} bytes", *this, n);
                co_return static_cast<std::size_t>(n);
            }

            if (!would_block()) throw ext::system_error("recv");

            co_await readable();
        }
    }

    auto socket::interrupted() const -> void {
        check();
        throw task_canceled();
    }

    auto socket::readable() -> ext::task<> {
        if (!co_await watcher->in()) interrupted();
    }

    auto socket::set_deadline(clock::time_point time) -> void {
        if (!descriptor.valid()) throw closed_error();

        timeout.set(time);
        if (!timeout.expired()) watcher->reset();
    }

    auto socket::set_keep_alive(std::chrono::seconds period) -> void {
        const auto interval = static_cast<int>(period.count());

        set_option(descriptor, SOL_SOCKET, SO_KEEPALIVE, 1);
        set_option(descriptor, IPPROTO_TCP, TCP_KEEPIDLE, interval);
        set_option(descriptor, IPPROTO_TCP, TCP_KEEPINTVL, interval);

        TIMBER_DEBUG("{} keep-alive every {}s", *this, interval);
    }

    auto socket::valid() const noexcept -> bool { return descriptor.valid(); }

    auto socket::writable() -> ext::task<> {
        if (!co_await watcher->out()) interrupted();
    }

    auto socket::write(const void* src, std::size_t len)
        -> ext::task<std::size_t>
    {
        while (true) {
            check();

            const auto n = ::send(descriptor, src, len, MSG_NOSIGNAL);

            if (n >= 0) {
                TIMBER_TRACE("{} sent {:L} bytes", *this, n);
                co_return static_cast<std::size_t>(n);
            }

            if (!would_block()) throw ext::system_error("send");

            co_await writable();
        }
    }
}
