#pragma once

#include "connection.hpp"
#include "ssl/context.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>

namespace rpcdial {
    class client;
    class memory_network;

    /// Response status that confirms an HTTP CONNECT tunnel.
    constexpr auto tunnel_established =
        std::string_view("200 Connected to rpcx");

    /// Dials a stream socket. "unix" treats 'address' as a filesystem path;
    /// every other network dials TCP, restricted to IPv4 by "tcp4" and to
    /// IPv6 by "tcp6". Each resolved address is tried in turn. When 'tls'
    /// is present, a TLS handshake with the address's host follows.
    /// Dialing and the handshake share 'timeout'; zero means no bound.
    auto dial_stream(
        std::string_view network,
        std::string_view address,
        std::chrono::milliseconds timeout,
        std::optional<ssl::context> tls
    ) -> ext::task<std::unique_ptr<connection>>;

    /// Dials directly with the client's timeout and TLS settings, or with
    /// default settings if 'c' is null. Failures throw 'dial_error'.
    auto dial_direct(
        const client* c,
        std::string_view network,
        std::string_view address
    ) -> ext::task<std::unique_ptr<connection>>;

    /// Dials TCP (or TLS) and negotiates an HTTP CONNECT tunnel
    /// on the client's RPC path.
    auto dial_http(
        const client* c,
        std::string_view network,
        std::string_view address
    ) -> ext::task<std::unique_ptr<connection>>;

    /// Dials a WebSocket at ws://<address><path> or wss://<address><path>
    /// depending on 'network'.
    auto dial_websocket(
        const client* c,
        std::string_view network,
        std::string_view address
    ) -> ext::task<std::unique_ptr<connection>>;

    auto dial_memory(
        std::shared_ptr<memory_network> network,
        std::string_view address
    ) -> ext::task<std::unique_ptr<connection>>;
}
