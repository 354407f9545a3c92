#include <rpcdial/except.hpp>
#include <rpcdial/socket_connection.hpp>

namespace rpcdial {
    socket_connection::socket_connection(
        rpcdial::socket&& socket,
        std::string_view kind
    ) :
        kind(kind),
        sock(std::forward<rpcdial::socket>(socket))
    {}

    auto socket_connection::close() noexcept -> void { sock.close(); }

    auto socket_connection::closed() const noexcept -> bool {
        return !sock.valid();
    }

    auto socket_connection::description() const -> std::string {
        return fmt::format("{} connection ({})", kind, sock.fd());
    }

    auto socket_connection::fd() const noexcept -> int { return sock.fd(); }

    auto socket_connection::read(
        void* dest,
        std::size_t len
    ) -> ext::task<std::size_t> {
        return sock.read(dest, len);
    }

    auto socket_connection::set_deadline(clock::time_point time) -> void {
        sock.set_deadline(time);
    }

    auto socket_connection::write(
        const void* src,
        std::size_t len
    ) -> ext::task<std::size_t> {
        return sock.write(src, len);
    }

    tcp_connection::tcp_connection(rpcdial::socket&& socket) :
        socket_connection(std::forward<rpcdial::socket>(socket), "tcp")
    {}

    auto tcp_connection::set_keep_alive(std::chrono::seconds period) -> void {
        sock.set_keep_alive(period);
    }

    tls_connection::tls_connection(ssl::socket&& socket) :
        sock(std::forward<ssl::socket>(socket))
    {}

    auto tls_connection::close() noexcept -> void { sock.close(); }

    auto tls_connection::closed() const noexcept -> bool {
        return !sock.valid();
    }

    auto tls_connection::description() const -> std::string {
        return fmt::format("TLS connection ({})", sock.fd());
    }

    auto tls_connection::read(
        void* dest,
        std::size_t len
    ) -> ext::task<std::size_t> {
        return sock.read(dest, len);
    }

    auto tls_connection::set_deadline(clock::time_point time) -> void {
        sock.set_deadline(time);
    }

    auto tls_connection::write(
        const void* src,
        std::size_t len
    ) -> ext::task<std::size_t> {
        return sock.write(src, len);
    }
}
