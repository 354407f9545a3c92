#pragma once

#include "socket.hpp"

#include <filesystem>
#include <memory>

namespace rpcdial::ssl {
    /// TLS settings shared by every session created from them.
    /// Copies refer to the same OpenSSL context.
    class context {
        std::shared_ptr<SSL_CTX> handle;

        explicit context(const SSL_METHOD* method);
    public:
        /// Verifies peers against the system's default trust store.
        static auto client() -> context;

        static auto server() -> context;

        /// Loads the certificate chain presented to peers (PEM).
        auto certificate(const std::filesystem::path& file) -> void;

        /// Trusts the certificates found in 'file' (PEM).
        auto certificate_authority(const std::filesystem::path& file) -> void;

        auto private_key(const std::filesystem::path& file) -> void;

        auto verify(bool enabled) -> void;

        /// Starts a TLS session over a connected socket.
        auto wrap(rpcdial::socket&& socket) const -> rpcdial::ssl::socket;
    };
}
