#pragma once

#include "ssl/context.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace rpcdial {
    /// Path requested by the HTTP tunnel and WebSocket transports
    /// when no path is configured.
    constexpr auto default_rpc_path = std::string_view("/_rpcx_");

    constexpr std::size_t default_reader_buffer_size = 16 * 1024;

    struct connect_option {
        /// Bounds dialing and transport handshakes. Zero disables the bound.
        std::chrono::milliseconds connect_timeout = std::chrono::seconds(10);

        /// Enables TLS for every transport that supports it.
        std::optional<ssl::context> tls;

        /// Zero leaves keep-alive probes disabled.
        std::chrono::seconds tcp_keep_alive_period =
            std::chrono::seconds::zero();

        /// Deadline applied to a connection right after it is established.
        /// Zero disables the deadline.
        std::chrono::milliseconds idle_timeout =
            std::chrono::milliseconds::zero();

        bool heartbeat = false;
        std::chrono::milliseconds heartbeat_interval =
            std::chrono::milliseconds::zero();

        std::string rpc_path;

        std::size_t reader_buffer_size = default_reader_buffer_size;

        auto path() const noexcept -> std::string_view {
            return rpc_path.empty() ? default_rpc_path : rpc_path;
        }
    };
}
