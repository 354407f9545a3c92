#include <rpcdial/ssl/context.hpp>
#include <rpcdial/ssl/error.hpp>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace rpcdial::ssl {
    context::context(const SSL_METHOD* method) :
        handle(SSL_CTX_new(method), SSL_CTX_free)
    {
        if (!handle) throw error("SSL_CTX_new");
    }

    auto context::client() -> context {
        auto ctx = context(TLS_client_method());

        if (SSL_CTX_set_default_verify_paths(ctx.handle.get()) != 1) {
            throw error("Failed to load the default trust store");
        }

        ctx.verify(true);
        return ctx;
    }

    auto context::server() -> context { return context(TLS_server_method()); }

    auto context::certificate(const fs::path& file) -> void {
        const auto ok = SSL_CTX_use_certificate_chain_file(
            handle.get(),
            file.c_str()
        );

        if (ok != 1) {
            throw error(fmt::format(
                "Failed to load certificate {}",
                file.native()
            ));
        }
    }

    auto context::certificate_authority(const fs::path& file) -> void {
        const auto ok = SSL_CTX_load_verify_locations(
            handle.get(),
            file.c_str(),
            nullptr
        );

        if (ok != 1) {
            throw error(fmt::format(
                "Failed to trust certificates in {}",
                file.native()
            ));
        }
    }

    auto context::private_key(const fs::path& file) -> void {
        const auto ok = SSL_CTX_use_PrivateKey_file(
            handle.get(),
            file.c_str(),
            SSL_FILETYPE_PEM
        );

        if (ok != 1) {
            throw error(fmt::format(
                "Failed to load private key {}",
                file.native()
            ));
        }
    }

    auto context::verify(bool enabled) -> void {
        const auto mode = enabled ? SSL_VERIFY_PEER : SSL_VERIFY_NONE;
        SSL_CTX_set_verify(handle.get(), mode, nullptr);
    }

    auto context::wrap(rpcdial::socket&& socket) const -> rpcdial::ssl::socket {
        return rpcdial::ssl::socket(
            std::move(socket),
            rpcdial::ssl::ssl(handle.get())
        );
    }
}
