#pragma once

#include "ssl.hpp"

#include <rpcdial/socket.hpp>

#include <fmt/format.h>

namespace rpcdial::ssl {
    /// A TLS session layered over a connected socket.
    class socket {
        rpcdial::socket transport;
        rpcdial::ssl::ssl session;

        /// Drives a handshake step until it completes.
        auto handshake(int (rpcdial::ssl::ssl::* step)(), const char* peer)
            -> ext::task<>;
    public:
        socket() = default;

        socket(rpcdial::socket&& transport, rpcdial::ssl::ssl&& session);

        /// Performs the server side of the TLS handshake.
        auto accept() -> ext::task<>;

        /// Sends close_notify when the handshake completed, then closes
        /// the underlying socket.
        auto close() noexcept -> void;

        /// Performs the client side of the TLS handshake with 'host'.
        auto connect(std::string_view host) -> ext::task<>;

        auto fd() const noexcept -> int;

        auto read(void* dest, std::size_t len) -> ext::task<std::size_t>;

        /// The server name the client requested during the handshake,
        /// or an empty string.
        auto server_name() const noexcept -> std::string_view;

        auto set_deadline(clock::time_point time) -> void;

        auto valid() const noexcept -> bool;

        auto write(const void* src, std::size_t len) -> ext::task<std::size_t>;
    };
}

template <>
struct fmt::formatter<rpcdial::ssl::socket> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const rpcdial::ssl::socket& socket, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "TLS socket ({})", socket.fd());
    }
};
