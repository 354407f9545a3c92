#include <rpcdial/address.hpp>
#include <rpcdial/client.hpp>
#include <rpcdial/connector.hpp>
#include <rpcdial/except.hpp>
#include <rpcdial/http.hpp>
#include <rpcdial/memory.hpp>
#include <rpcdial/socket_connection.hpp>
#include <rpcdial/websocket.hpp>

#include <cstring>
#include <sys/un.h>
#include <timber/timber>

namespace {
    auto limit(std::chrono::milliseconds timeout) -> rpcdial::clock::time_point {
        if (timeout <= std::chrono::milliseconds::zero()) return {};
        return rpcdial::clock::now() + timeout;
    }

    auto connect_unix(
        std::string_view path,
        rpcdial::clock::time_point deadline
    ) -> ext::task<rpcdial::socket> {
        auto addr = sockaddr_un();
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;

        if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
            throw rpcdial::invalid_argument(fmt::format(
                "invalid unix socket path: \"{}\"",
                path
            ));
        }

        path.copy(addr.sun_path, path.size());

        auto sock = rpcdial::socket(AF_UNIX, SOCK_STREAM, 0);
        sock.set_deadline(deadline);

        co_await sock.connect(
            reinterpret_cast<const sockaddr*>(&addr),
            sizeof(addr)
        );

        TIMBER_DEBUG(R"({} connected to path "{}")", sock, path);

        co_return sock;
    }

    auto connect_inet(
        std::string_view network,
        std::string_view host,
        std::string_view port,
        rpcdial::clock::time_point deadline
    ) -> ext::task<rpcdial::socket> {
        const auto addresses = rpcdial::address_list::resolve(
            host,
            port,
            rpcdial::address_family(network)
        );

        auto error = std::exception_ptr();

        for (const auto* ai : addresses.entries()) {
            try {
                auto sock = rpcdial::socket(
                    ai->ai_family,
                    ai->ai_socktype,
                    ai->ai_protocol
                );
                sock.set_deadline(deadline);

                co_await sock.connect(ai->ai_addr, ai->ai_addrlen);

                TIMBER_DEBUG(
                    "{} connected to {}",
                    sock,
                    rpcdial::to_string(ai->ai_addr, ai->ai_addrlen)
                );

                co_return sock;
            }
            catch (const rpcdial::timeout_error&) {
                // The time budget covers every address.
                throw;
            }
            catch (const std::exception& ex) {
                TIMBER_DEBUG(
                    "failed to connect to {}: {}",
                    rpcdial::to_string(ai->ai_addr, ai->ai_addrlen),
                    ex.what()
                );

                error = std::current_exception();
            }
        }

        if (error) std::rethrow_exception(error);

        throw std::runtime_error(fmt::format(
            "no addresses found for {}:{}",
            host,
            port
        ));
    }

    auto handshake(
        rpcdial::socket sock,
        rpcdial::ssl::context ctx,
        std::string_view host,
        rpcdial::clock::time_point deadline
    ) -> ext::task<std::unique_ptr<rpcdial::connection>> {
        auto tls = ctx.wrap(std::move(sock));

        if (host.empty()) {
            TIMBER_WARNING(
                "{}: no server name to verify the peer certificate against",
                tls
            );
        }

        tls.set_deadline(deadline);
        co_await tls.connect(host);
        tls.set_deadline({});

        co_return std::make_unique<rpcdial::tls_connection>(std::move(tls));
    }

    auto options_of(const rpcdial::client* c) -> const rpcdial::connect_option& {
        static const auto defaults = rpcdial::connect_option();
        return c ? c->options() : defaults;
    }
}

namespace rpcdial {
    auto dial_stream(
        std::string_view network,
        std::string_view address,
        std::chrono::milliseconds timeout,
        std::optional<ssl::context> tls
    ) -> ext::task<std::unique_ptr<connection>> {
        const auto deadline = limit(timeout);

        if (network == "unix") {
            auto sock = co_await connect_unix(address, deadline);

            if (tls) {
                co_return co_await handshake(std::move(sock), *tls, "", deadline);
            }

            sock.set_deadline({});
            co_return std::make_unique<socket_connection>(std::move(sock), "unix");
        }

        const auto target = split_host_port(address);
        auto sock = co_await connect_inet(
            network,
            target.host,
            target.port,
            deadline
        );

        if (tls) {
            // ":port" dials the local machine, which is verified under the
            // name it resolved as.
            const auto host = target.host.empty() ?
                std::string("localhost") : target.host;

            co_return co_await handshake(std::move(sock), *tls, host, deadline);
        }

        sock.set_deadline({});
        co_return std::make_unique<tcp_connection>(std::move(sock));
    }

    auto dial_direct(
        const client* c,
        std::string_view network,
        std::string_view address
    ) -> ext::task<std::unique_ptr<connection>> {
        const auto& options = options_of(c);

        try {
            co_return co_await dial_stream(
                network,
                address,
                options.connect_timeout,
                options.tls
            );
        }
        catch (const std::exception& ex) {
            TIMBER_WARNING("failed to dial server: {}", ex.what());
            throw dial_error(network, address, std::current_exception());
        }
    }

    auto dial_http(
        const client* c,
        std::string_view network,
        std::string_view address
    ) -> ext::task<std::unique_ptr<connection>> {
        if (!c) throw invalid_argument("empty client");

        const auto& options = c->options();
        const auto path = options.path();

        auto conn = std::unique_ptr<connection>();

        try {
            conn = co_await dial_stream(
                "tcp",
                address,
                options.connect_timeout,
                options.tls
            );
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR("failed to dial server: {}", ex.what());
            throw dial_error("tcp", address, std::current_exception());
        }

        auto error = std::exception_ptr();

        try {
            conn->set_deadline(limit(options.connect_timeout));

            co_await write_all(
                *conn,
                fmt::format("CONNECT {} HTTP/1.0\r\n\r\n", path)
            );
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR("failed to make CONNECT: {}", ex.what());
            error = std::current_exception();
        }

        if (!error) {
            try {
                const auto response = co_await http::read_response(*conn);

                if (response.status == tunnel_established) {
                    conn->set_deadline({});

                    TIMBER_DEBUG(
                        "{} tunnel established to {}{}",
                        *conn,
                        address,
                        path
                    );

                    co_return conn;
                }

                TIMBER_ERROR("unexpected HTTP response: {}", response.status);

                error = std::make_exception_ptr(http_error(fmt::format(
                    "unexpected HTTP response: {}",
                    response.status
                )));
            }
            catch (const std::exception& ex) {
                TIMBER_ERROR("failed to read CONNECT response: {}", ex.what());
                error = std::current_exception();
            }
        }

        conn->close();
        throw tunnel_error(network, address, error);
    }

    auto dial_websocket(
        const client* c,
        std::string_view network,
        std::string_view address
    ) -> ext::task<std::unique_ptr<connection>> {
        if (!c) throw invalid_argument("empty client");

        const auto& options = c->options();
        const auto url = websocket_url(network, address, options.path());
        const auto origin = websocket_origin(network, address);
        const auto location = ws::parse_url(url);

        auto tls = std::optional<ssl::context>();
        if (location.secure) {
            tls = options.tls ? *options.tls : ssl::context::client();
        }

        TIMBER_DEBUG("dialing {} (origin {})", url, origin);

        auto conn = co_await dial_stream(
            "tcp",
            location.dial_address(),
            options.connect_timeout,
            std::move(tls)
        );

        try {
            conn->set_deadline(limit(options.connect_timeout));
            co_await websocket_handshake(*conn, location, origin);
            conn->set_deadline({});
        }
        catch (const std::exception& ex) {
            TIMBER_DEBUG(
                "WebSocket handshake with {} failed: {}",
                url,
                ex.what()
            );
            conn->close();
            throw;
        }

        co_return std::make_unique<websocket_connection>(std::move(conn));
    }

    auto dial_memory(
        std::shared_ptr<memory_network> network,
        std::string_view address
    ) -> ext::task<std::unique_ptr<connection>> {
        if (!network) throw invalid_argument("memory network is null");
        co_return network->dial(address);
    }
}
