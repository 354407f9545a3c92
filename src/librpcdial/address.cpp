#include <rpcdial/address.hpp>
#include <rpcdial/except.hpp>

#include <arpa/inet.h>
#include <array>
#include <ext/except.h>
#include <fmt/format.h>

namespace rpcdial {
    auto address_list::resolve(
        std::string_view host,
        std::string_view port,
        int family
    ) -> address_list {
        auto hints = addrinfo();
        hints.ai_family = family;
        hints.ai_socktype = SOCK_STREAM;

        const auto node = host.empty() ? std::string("localhost") :
            std::string(host);
        const auto service = std::string(port);

        addrinfo* info = nullptr;
        const auto code = getaddrinfo(
            node.c_str(),
            service.c_str(),
            &hints,
            &info
        );

        if (code == EAI_SYSTEM) {
            throw ext::system_error(fmt::format(
                "lookup {}:{}",
                node,
                service
            ));
        }

        if (code != 0) {
            throw std::runtime_error(fmt::format(
                "lookup {}:{}: {}",
                node,
                service,
                gai_strerror(code)
            ));
        }

        auto result = address_list();
        result.head.reset(info);
        return result;
    }

    auto address_list::empty() const noexcept -> bool { return !head; }

    auto address_list::entries() const -> std::vector<const addrinfo*> {
        auto result = std::vector<const addrinfo*>();

        for (const auto* ai = head.get(); ai; ai = ai->ai_next) {
            result.push_back(ai);
        }

        return result;
    }

    auto to_string(const sockaddr* addr, socklen_t len) -> std::string {
        auto host = std::array<char, NI_MAXHOST>();
        auto port = std::array<char, NI_MAXSERV>();

        const auto code = getnameinfo(
            addr,
            len,
            host.data(),
            host.size(),
            port.data(),
            port.size(),
            NI_NUMERICHOST | NI_NUMERICSERV
        );

        if (code != 0) return fmt::format("<{}>", gai_strerror(code));

        if (addr->sa_family == AF_INET6) {
            return fmt::format("[{}]:{}", host.data(), port.data());
        }

        return fmt::format("{}:{}", host.data(), port.data());
    }

    auto split_host_port(std::string_view address) -> host_port {
        if (address.starts_with("[")) {
            const auto end = address.find(']');

            if (end == std::string_view::npos) {
                throw invalid_argument(fmt::format(
                    "address {}: missing ']' in address",
                    address
                ));
            }

            const auto rest = address.substr(end + 1);

            if (!rest.starts_with(":") || rest.size() == 1) {
                throw invalid_argument(fmt::format(
                    "address {}: missing port in address",
                    address
                ));
            }

            return {
                .host = std::string(address.substr(1, end - 1)),
                .port = std::string(rest.substr(1))
            };
        }

        const auto separator = address.rfind(':');

        if (separator == std::string_view::npos ||
            separator == address.size() - 1) {
            throw invalid_argument(fmt::format(
                "address {}: missing port in address",
                address
            ));
        }

        const auto host = address.substr(0, separator);

        if (host.find(':') != std::string_view::npos) {
            throw invalid_argument(fmt::format(
                "address {}: too many colons in address",
                address
            ));
        }

        return {
            .host = std::string(host),
            .port = std::string(address.substr(separator + 1))
        };
    }

    auto is_ip_literal(std::string_view host) -> bool {
        const auto string = std::string(host);

        auto v4 = in_addr();
        auto v6 = in6_addr();

        return
            inet_pton(AF_INET, string.c_str(), &v4) == 1 ||
            inet_pton(AF_INET6, string.c_str(), &v6) == 1;
    }

    auto address_family(std::string_view network) noexcept -> int {
        if (network == "tcp4") return AF_INET;
        if (network == "tcp6") return AF_INET6;
        return AF_UNSPEC;
    }
}
