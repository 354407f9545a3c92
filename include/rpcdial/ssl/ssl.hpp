#pragma once

#include <memory>
#include <openssl/ssl.h>
#include <string_view>

namespace rpcdial::ssl {
    /// One TLS session.
    class ssl {
        struct deleter {
            auto operator()(SSL* s) const noexcept -> void { SSL_free(s); }
        };

        std::unique_ptr<SSL, deleter> handle;
    public:
        ssl() = default;

        explicit ssl(SSL_CTX* ctx);

        auto accept() -> int;

        auto connect() -> int;

        auto get() const noexcept -> SSL*;

        auto get_error(int result) const noexcept -> int;

        auto set_fd(int fd) -> void;

        /// Sends 'host' as the SNI server name and, when peer verification
        /// is enabled, requires the peer certificate to match it.
        /// IP literals are matched against the certificate's addresses.
        auto set_host(std::string_view host) -> void;

        auto shutdown() noexcept -> int;
    };
}
