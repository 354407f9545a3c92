#pragma once

#include "connection.hpp"

#include <memory>
#include <span>
#include <vector>

namespace rpcdial {
    class plugin {
    public:
        virtual ~plugin() = default;
    };

    /// A plugin notified of every connection a client establishes.
    class connection_created_plugin : public virtual plugin {
    public:
        /// Returns the connection the client should use: 'conn' itself or
        /// a replacement wrapping it. Throwing vetoes the connection; a hook
        /// that throws without taking 'conn' leaves it with the caller.
        virtual auto on_connection_created(std::unique_ptr<connection>&& conn)
            -> ext::task<std::unique_ptr<connection>> = 0;
    };

    /// An ordered sequence of plugins.
    class plugin_chain {
        std::vector<std::shared_ptr<plugin>> plugins;
    public:
        auto add(std::shared_ptr<plugin> p) -> void;

        auto all() const noexcept -> std::span<const std::shared_ptr<plugin>>;

        /// Runs every connection-created hook in order, feeding each
        /// hook the connection returned by the previous one. On return,
        /// 'conn' holds the connection returned by the last hook.
        auto connection_created(std::unique_ptr<connection>& conn)
            -> ext::task<>;

        auto empty() const noexcept -> bool;

        /// Removes every occurrence of 'p'. Returns false if 'p' was not
        /// part of the chain.
        auto remove(const std::shared_ptr<plugin>& p) -> bool;
    };
}
