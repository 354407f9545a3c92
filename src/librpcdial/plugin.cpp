#include <rpcdial/except.hpp>
#include <rpcdial/plugin.hpp>

#include <algorithm>
#include <timber/timber>

namespace rpcdial {
    auto plugin_chain::add(std::shared_ptr<plugin> p) -> void {
        if (!p) throw invalid_argument("plugin is null");
        plugins.push_back(std::move(p));
    }

    auto plugin_chain::all() const noexcept
        -> std::span<const std::shared_ptr<plugin>>
    {
        return plugins;
    }

    auto plugin_chain::connection_created(std::unique_ptr<connection>& conn)
        -> ext::task<>
    {
        if (!conn) throw invalid_argument("connection is null");

        // Hooks may modify the chain; iterate over a snapshot.
        const auto snapshot = plugins;

        for (const auto& p : snapshot) {
            auto* const hook = dynamic_cast<connection_created_plugin*>(p.get());
            if (!hook) continue;

            conn = co_await hook->on_connection_created(std::move(conn));

            if (!conn) {
                throw plugin_rejection(
                    "connection created plugin returned no connection"
                );
            }
        }

        TIMBER_TRACE("{} accepted by plugins", *conn);
    }

    auto plugin_chain::empty() const noexcept -> bool {
        return plugins.empty();
    }

    auto plugin_chain::remove(const std::shared_ptr<plugin>& p) -> bool {
        return std::erase(plugins, p) > 0;
    }
}
