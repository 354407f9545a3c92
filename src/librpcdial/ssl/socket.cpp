#include <rpcdial/except.hpp>
#include <rpcdial/ssl/error.hpp>
#include <rpcdial/ssl/socket.hpp>

#include <cerrno>
#include <ext/except.h>
#include <fmt/format.h>
#include <openssl/err.h>
#include <timber/timber>

namespace {
    constexpr auto read_failure = "TLS read failed";
    constexpr auto write_failure = "TLS write failed";

    /// Whether the peer closed the transport without sending close_notify.
    auto truncated(int code) -> bool {
        if (code == SSL_ERROR_SYSCALL) {
            return ERR_peek_error() == 0 && errno == 0;
        }

        return code == SSL_ERROR_SSL &&
            ERR_GET_REASON(ERR_peek_error()) ==
                SSL_R_UNEXPECTED_EOF_WHILE_READING;
    }
}

namespace rpcdial::ssl {
    socket::socket(
        rpcdial::socket&& transport,
        rpcdial::ssl::ssl&& session
    ) :
        transport(std::move(transport)),
        session(std::move(session))
    {
        this->session.set_fd(this->transport.fd());
    }

    auto socket::accept() -> ext::task<> {
        co_await handshake(&rpcdial::ssl::ssl::accept, "client");
        TIMBER_DEBUG("{} accepted", *this);
    }

    auto socket::close() noexcept -> void {
        if (!transport.valid()) return;

        // A peer that is already gone cannot receive close_notify.
        if (SSL_is_init_finished(session.get()) && session.shutdown() < 0) {
            ERR_clear_error();
        }

        transport.close();
    }

    auto socket::connect(std::string_view host) -> ext::task<> {
        session.set_host(host);
        co_await handshake(&rpcdial::ssl::ssl::connect, "server");

        TIMBER_DEBUG(
            "{} using {} with '{}'",
            *this,
            SSL_get_version(session.get()),
            host
        );
    }

    auto socket::fd() const noexcept -> int { return transport.fd(); }

    auto socket::handshake(
        int (rpcdial::ssl::ssl::* step)(),
        const char* peer
    ) -> ext::task<> {
        while (true) {
            transport.check();

            const auto result = (session.*step)();
            if (result == 1) co_return;

            const auto code = session.get_error(result);

            if (code == SSL_ERROR_WANT_READ) co_await transport.readable();
            else if (code == SSL_ERROR_WANT_WRITE) {
                co_await transport.writable();
            }
            else throw error(fmt::format("TLS handshake with {} failed", peer));
        }
    }

    auto socket::read(void* dest, std::size_t len) -> ext::task<std::size_t> {
        while (true) {
            transport.check();
            errno = 0;

            const auto n = SSL_read(session.get(), dest, static_cast<int>(len));

            if (n > 0) {
                TIMBER_TRACE("{} decrypted {:L} bytes", *this, n);
                co_return static_cast<std::size_t>(n);
            }

            const auto code = session.get_error(n);

            switch (code) {
                case SSL_ERROR_WANT_READ:
                    co_await transport.readable();
                    continue;
                case SSL_ERROR_WANT_WRITE:
                    co_await transport.writable();
                    continue;
                case SSL_ERROR_ZERO_RETURN:
                    TIMBER_TRACE("{} received close_notify", *this);
                    co_return 0;
                default:
                    break;
            }

            if (truncated(code)) {
                ERR_clear_error();
                throw eof();
            }

            if (code == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
                throw ext::system_error(read_failure);
            }

            throw error(read_failure);
        }
    }

    auto socket::server_name() const noexcept -> std::string_view {
        const auto* const name = SSL_get_servername(
            session.get(),
            TLSEXT_NAMETYPE_host_name
        );

        return name ? name : std::string_view();
    }

    auto socket::set_deadline(clock::time_point time) -> void {
        transport.set_deadline(time);
    }

    auto socket::valid() const noexcept -> bool { return transport.valid(); }

    auto socket::write(const void* src, std::size_t len)
        -> ext::task<std::size_t>
    {
        while (true) {
            transport.check();

            const auto n = SSL_write(
                session.get(),
                src,
                static_cast<int>(len)
            );

            if (n > 0) {
                TIMBER_TRACE("{} encrypted {:L} bytes", *this, n);
                co_return static_cast<std::size_t>(n);
            }

            switch (session.get_error(n)) {
                case SSL_ERROR_WANT_WRITE: co_await transport.writable(); break;
                case SSL_ERROR_WANT_READ: co_await transport.readable(); break;
                default: throw error(write_failure);
            }
        }
    }
}
