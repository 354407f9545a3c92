#pragma once

#include <memory>
#include <netdb.h>
#include <string>
#include <string_view>
#include <vector>

namespace rpcdial {
    /// The stream socket addresses a host name resolves to.
    class address_list {
        struct deleter {
            auto operator()(addrinfo* info) const noexcept -> void {
                freeaddrinfo(info);
            }
        };

        std::unique_ptr<addrinfo, deleter> head;
    public:
        /// Resolves 'host' and 'port'. An empty host means "localhost".
        /// 'family' restricts the results, e.g. to AF_INET.
        static auto resolve(
            std::string_view host,
            std::string_view port,
            int family = AF_UNSPEC
        ) -> address_list;

        /// The results in the order the resolver returned them.
        auto entries() const -> std::vector<const addrinfo*>;

        auto empty() const noexcept -> bool;
    };

    /// Formats a numeric socket address as "host:port", with IPv6 hosts
    /// in brackets.
    auto to_string(const sockaddr* addr, socklen_t len) -> std::string;

    struct host_port {
        std::string host;
        std::string port;
    };

    /// Splits an address of the form "host:port", "[host]:port" or ":port".
    /// An empty host means the local machine.
    auto split_host_port(std::string_view address) -> host_port;

    /// Returns true if 'host' is a numeric IPv4 or IPv6 address.
    auto is_ip_literal(std::string_view host) -> bool;

    /// Maps a network name to an address family: "tcp4" to AF_INET,
    /// "tcp6" to AF_INET6 and anything else to AF_UNSPEC.
    auto address_family(std::string_view network) noexcept -> int;
}
