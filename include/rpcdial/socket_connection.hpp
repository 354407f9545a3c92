#pragma once

#include "connection.hpp"
#include "socket.hpp"
#include "ssl/socket.hpp"

namespace rpcdial {
    /// A connection over a plain stream socket.
    class socket_connection : public connection {
        std::string kind;
    protected:
        rpcdial::socket sock;
    public:
        socket_connection(rpcdial::socket&& socket, std::string_view kind);

        auto close() noexcept -> void override;

        auto closed() const noexcept -> bool override;

        auto description() const -> std::string override;

        auto fd() const noexcept -> int;

        auto read(void* dest, std::size_t len) -> ext::task<std::size_t>
            override;

        auto set_deadline(clock::time_point time) -> void override;

        auto write(const void* src, std::size_t len) -> ext::task<std::size_t>
            override;
    };

    class tcp_connection final : public socket_connection, public keep_alive {
    public:
        explicit tcp_connection(rpcdial::socket&& socket);

        auto set_keep_alive(std::chrono::seconds period) -> void override;
    };

    class tls_connection final : public connection {
        ssl::socket sock;
    public:
        explicit tls_connection(ssl::socket&& socket);

        auto close() noexcept -> void override;

        auto closed() const noexcept -> bool override;

        auto description() const -> std::string override;

        auto read(void* dest, std::size_t len) -> ext::task<std::size_t>
            override;

        auto set_deadline(clock::time_point time) -> void override;

        auto write(const void* src, std::size_t len) -> ext::task<std::size_t>
            override;
    };
}
