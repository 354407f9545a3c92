#pragma once

#include "connection.hpp"
#include "options.hpp"
#include "plugin.hpp"
#include "protocol.hpp"
#include "registry.hpp"

#include <memory>
#include <string_view>

namespace rpcdial {
    /// Establishes and owns a connection to an RPC server.
    ///
    /// Once connected, a reader task feeds inbound bytes to the client's
    /// protocol, and an optional heartbeat task writes the protocol's
    /// heartbeat at a fixed interval. Both stop when the connection closes.
    class client {
        struct session;

        connect_option opts;
        std::shared_ptr<const transport_registry> transports;
        std::shared_ptr<protocol> proto;
        std::shared_ptr<plugin_chain> chain;
        std::shared_ptr<session> current;

        static auto heartbeat(
            std::shared_ptr<session> s,
            std::shared_ptr<protocol> proto,
            std::chrono::milliseconds interval
        ) -> ext::detached_task;

        static auto read(
            std::shared_ptr<session> s,
            std::shared_ptr<protocol> proto
        ) -> ext::detached_task;

        auto configure(rpcdial::connection& conn) const -> void;

        auto dial(
            std::string_view network,
            std::string_view address
        ) const -> ext::task<std::unique_ptr<rpcdial::connection>>;
    public:
        /// A null registry selects 'transport_registry::defaults()';
        /// a null protocol selects 'discard_protocol'.
        explicit client(
            connect_option options = {},
            std::shared_ptr<const transport_registry> registry = nullptr,
            std::shared_ptr<protocol> proto = nullptr,
            std::shared_ptr<plugin_chain> plugins = nullptr
        );

        client(const client&) = delete;

        client(client&&) = default;

        ~client();

        auto operator=(const client&) -> client& = delete;

        /// Closes this client's connection before taking over 'other's.
        auto operator=(client&& other) -> client&;

        /// Closes the active connection, if any.
        auto close() noexcept -> void;

        /// Connects to 'address' over the transport named 'network' and
        /// starts the background tasks. "http", "ws" and "wss" always use
        /// the built-in connectors; other names are looked up in the
        /// registry, and names it does not know are dialed directly.
        ///
        /// On failure the client is left as it was. On success the new
        /// connection replaces (and closes) the previous one.
        auto connect(
            std::string_view network,
            std::string_view address
        ) -> ext::task<>;

        auto connected() const noexcept -> bool;

        /// The active connection, or null.
        auto connection() const noexcept -> rpcdial::connection*;

        auto heartbeating() const noexcept -> bool;

        auto options() const noexcept -> const connect_option&;

        auto plugins() const noexcept -> plugin_chain*;

        auto reading() const noexcept -> bool;

        auto registry() const noexcept -> const transport_registry&;

        /// Writes 'len' bytes to the active connection. Writes are
        /// serialized with heartbeats.
        auto write(const void* src, std::size_t len) -> ext::task<>;

        auto write(std::string_view data) -> ext::task<>;
    };
}
