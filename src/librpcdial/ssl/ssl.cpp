#include <rpcdial/address.hpp>
#include <rpcdial/ssl/error.hpp>
#include <rpcdial/ssl/ssl.hpp>

#include <fmt/format.h>
#include <openssl/x509v3.h>
#include <string>

namespace rpcdial::ssl {
    ssl::ssl(SSL_CTX* ctx) : handle(SSL_new(ctx)) {
        if (!handle) throw error("SSL_new");
    }

    auto ssl::accept() -> int { return SSL_accept(get()); }

    auto ssl::connect() -> int { return SSL_connect(get()); }

    auto ssl::get() const noexcept -> SSL* { return handle.get(); }

    auto ssl::get_error(int result) const noexcept -> int {
        return SSL_get_error(get(), result);
    }

    auto ssl::set_fd(int fd) -> void {
        if (SSL_set_fd(get(), fd) != 1) throw error("SSL_set_fd");
    }

    auto ssl::set_host(std::string_view host) -> void {
        if (host.empty()) return;

        const auto name = std::string(host);

        if (is_ip_literal(host)) {
            auto* const param = SSL_get0_param(get());

            if (X509_VERIFY_PARAM_set1_ip_asc(param, name.c_str()) != 1) {
                throw error(fmt::format("Invalid peer address '{}'", name));
            }

            return;
        }

        if (SSL_set_tlsext_host_name(get(), name.c_str()) != 1) {
            throw error("Failed to set the SNI server name");
        }

        if (SSL_set1_host(get(), name.c_str()) != 1) {
            throw error("Failed to set the expected peer name");
        }
    }

    auto ssl::shutdown() noexcept -> int { return SSL_shutdown(get()); }
}
