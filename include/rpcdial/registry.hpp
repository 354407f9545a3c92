#pragma once

#include "connection.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rpcdial {
    class client;
    class memory_network;

    /// Establishes a connection over one kind of transport.
    /// The client may be null; connectors that need its options
    /// fail or fall back to defaults.
    using connector = std::function<ext::task<std::unique_ptr<connection>>(
        const client* c,
        std::string_view network,
        std::string_view address
    )>;

    /// Maps transport names to connectors. Populate it before handing it
    /// to a client; clients only read from it.
    class transport_registry {
        std::map<std::string, connector, std::less<>> connectors;
    public:
        /// A registry with the built-in transports: "http" and "unix".
        static auto defaults() -> transport_registry;

        /// The built-in transports plus "memu", dialing into 'network'.
        static auto defaults(std::shared_ptr<memory_network> network)
            -> transport_registry;

        /// Registers 'c' under 'name', replacing any previous entry.
        auto add(std::string_view name, connector c) -> void;

        auto contains(std::string_view name) const -> bool;

        /// Returns the connector registered under 'name', or null.
        auto find(std::string_view name) const -> const connector*;

        auto names() const -> std::vector<std::string>;

        auto size() const noexcept -> std::size_t;
    };
}
