#include <rpcdial/connector.hpp>
#include <rpcdial/except.hpp>
#include <rpcdial/memory.hpp>
#include <rpcdial/registry.hpp>

#include <timber/timber>

namespace rpcdial {
    auto transport_registry::defaults() -> transport_registry {
        auto registry = transport_registry();

        registry.add("http", dial_http);
        registry.add("unix", dial_direct);

        return registry;
    }

    auto transport_registry::defaults(
        std::shared_ptr<memory_network> network
    ) -> transport_registry {
        if (!network) throw invalid_argument("memory network is null");

        auto registry = defaults();

        registry.add("memu", [network = std::move(network)](
            const client*,
            std::string_view,
            std::string_view address
        ) {
            return dial_memory(network, address);
        });

        return registry;
    }

    auto transport_registry::add(std::string_view name, connector c) -> void {
        if (!c) {
            throw invalid_argument(fmt::format(
                "connector for transport '{}' is empty",
                name
            ));
        }

        TIMBER_TRACE("register transport '{}'", name);
        connectors.insert_or_assign(std::string(name), std::move(c));
    }

    auto transport_registry::contains(std::string_view name) const -> bool {
        return connectors.contains(name);
    }

    auto transport_registry::find(
        std::string_view name
    ) const -> const connector* {
        const auto it = connectors.find(name);
        if (it == connectors.end()) return nullptr;
        return &it->second;
    }

    auto transport_registry::names() const -> std::vector<std::string> {
        auto result = std::vector<std::string>();
        result.reserve(connectors.size());

        for (const auto& [name, c] : connectors) result.push_back(name);

        return result;
    }

    auto transport_registry::size() const noexcept -> std::size_t {
        return connectors.size();
    }
}
