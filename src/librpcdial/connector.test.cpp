#include "test_server.hpp"

#include <rpcdial/client.hpp>
#include <rpcdial/connector.hpp>
#include <rpcdial/except.hpp>
#include <rpcdial/memory.hpp>
#include <rpcdial/socket_connection.hpp>
#include <rpcdial/ssl/error.hpp>
#include <rpcdial/websocket.hpp>

#include <functional>
#include <gtest/gtest.h>
#include <timber/timber>

namespace fs = std::filesystem;

using namespace std::chrono_literals;
using rpcdial::test::server_socket;

namespace {
    using server_handler = std::function<ext::task<>(rpcdial::socket&)>;
    using client_handler = std::function<ext::task<>(std::string_view)>;

    constexpr auto tunnel_request = std::string_view(
        "CONNECT /_rpcx_ HTTP/1.0\r\n\r\n"
    );

    auto read_string(rpcdial::connection& conn, std::size_t len)
        -> ext::task<std::string>
    {
        auto result = std::string(len, '\0');
        co_await rpcdial::read_exact(conn, result.data(), len);
        co_return result;
    }

    template <typename Stream>
    auto receive_text(Stream& stream, std::size_t len) -> ext::task<std::string> {
        auto result = std::string(len, '\0');
        auto total = std::size_t(0);

        while (total < len) {
            const auto bytes = co_await stream.read(
                result.data() + total,
                len - total
            );
            if (bytes == 0) throw rpcdial::eof();
            total += bytes;
        }

        co_return result;
    }

    template <typename Stream>
    auto send_text(Stream& stream, std::string_view data) -> ext::task<> {
        auto total = std::size_t(0);

        while (total < data.size()) {
            total += co_await stream.write(
                data.data() + total,
                data.size() - total
            );
        }
    }

    /// Reads until the peer closes. Returns the number of bytes read.
    template <typename Stream>
    auto drain(Stream& stream) -> ext::task<std::size_t> {
        char buffer[256];
        auto total = std::size_t(0);

        while (const auto bytes = co_await stream.read(buffer, sizeof(buffer))) {
            total += bytes;
        }

        co_return total;
    }

    template <typename Stream>
    auto read_head(Stream& stream) -> ext::task<std::string> {
        auto result = std::string();

        while (!result.ends_with("\r\n\r\n")) {
            result += co_await receive_text(stream, 1);
        }

        co_return result;
    }

    /// Answers a WebSocket opening handshake, expects one masked binary
    /// frame carrying "abc" and replies with "ok".
    template <typename Stream>
    auto echo_websocket(Stream& stream) -> ext::task<> {
        const auto request = co_await read_head(stream);
        EXPECT_TRUE(request.starts_with("GET /_rpcx_ HTTP/1.1\r\n"));

        const auto field = std::string_view("Sec-WebSocket-Key: ");
        const auto start = request.find(field) + field.size();
        const auto key = request.substr(start, request.find("\r\n", start) - start);

        co_await send_text(stream, fmt::format(
            "HTTP/1.1 101 Switching Protocols\r\n"
            "Upgrade: websocket\r\n"
            "Connection: Upgrade\r\n"
            "Sec-WebSocket-Accept: {}\r\n"
            "\r\n",
            rpcdial::websocket_accept_key(key)
        ));

        // One masked binary frame: header, mask key, payload.
        const auto frame = co_await receive_text(stream, 2 + 4 + 3);
        EXPECT_EQ('\x82', frame[0]);
        EXPECT_EQ('\x83', frame[1]);

        auto payload = std::string();
        for (auto i = 0; i < 3; ++i) payload.push_back(frame[6 + i] ^ frame[2 + i]);
        EXPECT_EQ("abc", payload);

        co_await send_text(stream, "\x82\x02ok");
        EXPECT_EQ(0, co_await drain(stream));
    }

    auto serve(server_socket& server, const server_handler& handler)
        -> ext::detached_task
    {
        try {
            auto sock = co_await server.accept();
            if (sock.valid()) co_await handler(sock);
        }
        catch (const std::exception& ex) {
            ADD_FAILURE() << "test server failed: " << ex.what();
        }
    }

    auto task(
        server_socket& server,
        const server_handler& handler,
        const client_handler& client
    ) -> ext::task<> {
        serve(server, handler);
        co_await client(server.address());
        server.close();
    }

    auto run(
        server_socket& server,
        const server_handler& handler,
        const client_handler& client
    ) -> void {
        rpcdial::run(task(server, handler, client));
    }

    auto closed_address() -> std::string {
        auto server = server_socket::loopback();
        auto address = server.address();
        server.close();
        return address;
    }
}

TEST(Connector, DirectTcp) {
    auto server = server_socket::loopback();

    run(server, [](rpcdial::socket& sock) -> ext::task<> {
        co_await rpcdial::test::write_string(sock, "hello");
        EXPECT_EQ("world", co_await rpcdial::test::read_string(sock, 5));
    }, [](std::string_view address) -> ext::task<> {
        const auto conn = co_await rpcdial::dial_direct(
            nullptr,
            "tcp",
            address
        );

        EXPECT_TRUE(conn->description().starts_with("tcp connection ("));
        EXPECT_NE(nullptr, dynamic_cast<rpcdial::keep_alive*>(conn.get()));

        EXPECT_EQ("hello", co_await read_string(*conn, 5));
        co_await rpcdial::write_all(*conn, "world");
    });
}

TEST(Connector, DirectUnix) {
    auto server = server_socket::local(
        fs::temp_directory_path() / "rpcdial.connector.test.sock"
    );

    run(server, [](rpcdial::socket& sock) -> ext::task<> {
        EXPECT_EQ("ping", co_await rpcdial::test::read_string(sock, 4));
        co_await rpcdial::test::write_string(sock, "pong");
    }, [](std::string_view address) -> ext::task<> {
        const auto conn = co_await rpcdial::dial_direct(
            nullptr,
            "unix",
            address
        );

        EXPECT_TRUE(conn->description().starts_with("unix connection ("));
        EXPECT_EQ(nullptr, dynamic_cast<rpcdial::keep_alive*>(conn.get()));

        co_await rpcdial::write_all(*conn, "ping");
        EXPECT_EQ("pong", co_await read_string(*conn, 4));
    });
}

TEST(Connector, DirectRefused) {
    rpcdial::run([](std::string address) -> ext::task<> {
        auto failed = false;

        try {
            co_await rpcdial::dial_direct(nullptr, "tcp", address);
        }
        catch (const rpcdial::dial_error& ex) {
            failed = true;

            EXPECT_EQ("dial", ex.op());
            EXPECT_EQ("tcp", ex.net());
            EXPECT_EQ(address, ex.address());
            EXPECT_TRUE(ex.cause());
        }

        EXPECT_TRUE(failed);
    }(closed_address()));
}

TEST(Connector, DirectTls) {
    const auto& cert = rpcdial::test::certificate::get();
    auto server = server_socket::loopback();

    auto options = rpcdial::connect_option();
    options.tls = cert.client_context();

    const auto client = rpcdial::client(options);

    run(server, [&cert](rpcdial::socket& sock) -> ext::task<> {
        auto tls = cert.server_context().wrap(std::move(sock));
        co_await tls.accept();

        const auto message = std::string_view("secure");
        co_await tls.write(message.data(), message.size());

        char reply = 0;
        EXPECT_EQ(1, co_await tls.read(&reply, 1));
        EXPECT_EQ('!', reply);
    }, [&client](std::string_view address) -> ext::task<> {
        const auto conn = co_await rpcdial::dial_direct(
            &client,
            "tcp",
            address
        );

        EXPECT_TRUE(conn->description().starts_with("TLS connection ("));
        EXPECT_EQ("secure", co_await read_string(*conn, 6));

        co_await rpcdial::write_all(*conn, "!");
    });
}

TEST(Connector, DirectTlsLocalPort) {
    const auto& cert = rpcdial::test::certificate::get();
    auto server = server_socket::loopback();

    auto options = rpcdial::connect_option();
    options.tls = cert.client_context();

    const auto client = rpcdial::client(options);
    const auto address = fmt::format(":{}", server.port());

    run(server, [&cert](rpcdial::socket& sock) -> ext::task<> {
        auto tls = cert.server_context().wrap(std::move(sock));
        co_await tls.accept();

        EXPECT_EQ("localhost", tls.server_name());

        co_await send_text(tls, "local");
        EXPECT_EQ(0, co_await drain(tls));
    }, [&client, &address](std::string_view) -> ext::task<> {
        const auto conn = co_await rpcdial::dial_direct(
            &client,
            "tcp",
            address
        );

        EXPECT_EQ("local", co_await read_string(*conn, 5));
        conn->close();
    });
}

TEST(Connector, HttpTunnel) {
    auto server = server_socket::loopback();
    const auto client = rpcdial::client();

    run(server, [](rpcdial::socket& sock) -> ext::task<> {
        EXPECT_EQ(tunnel_request, co_await read_head(sock));

        // Bytes after the response head belong to the tunneled protocol.
        co_await rpcdial::test::write_string(
            sock,
            "HTTP/1.0 200 Connected to rpcx\r\n\r\nrpcx"
        );
        EXPECT_EQ(0, co_await drain(sock));
    }, [&client](std::string_view address) -> ext::task<> {
        auto conn = co_await rpcdial::dial_http(&client, "http", address);
        EXPECT_EQ("rpcx", co_await read_string(*conn, 4));
    });
}

TEST(Connector, HttpTunnelTls) {
    const auto& cert = rpcdial::test::certificate::get();
    auto server = server_socket::loopback();

    auto options = rpcdial::connect_option();
    options.tls = cert.client_context();

    const auto client = rpcdial::client(options);

    run(server, [&cert](rpcdial::socket& sock) -> ext::task<> {
        auto tls = cert.server_context().wrap(std::move(sock));
        co_await tls.accept();

        EXPECT_EQ(tunnel_request, co_await read_head(tls));
        co_await send_text(tls, "HTTP/1.0 200 Connected to rpcx\r\n\r\nrpcx");
        EXPECT_EQ(0, co_await drain(tls));
    }, [&client](std::string_view address) -> ext::task<> {
        auto conn = co_await rpcdial::dial_http(&client, "http", address);

        EXPECT_TRUE(conn->description().starts_with("TLS connection ("));
        EXPECT_EQ("rpcx", co_await read_string(*conn, 4));

        conn->close();
    });
}

TEST(Connector, HttpTunnelPath) {
    auto server = server_socket::loopback();

    auto options = rpcdial::connect_option();
    options.rpc_path = "/custom/path";

    const auto client = rpcdial::client(options);

    run(server, [](rpcdial::socket& sock) -> ext::task<> {
        EXPECT_EQ(
            "CONNECT /custom/path HTTP/1.0\r\n\r\n",
            co_await read_head(sock)
        );

        co_await rpcdial::test::write_string(
            sock,
            "HTTP/1.0 200 Connected to rpcx\r\n\r\n"
        );
        EXPECT_EQ(0, co_await drain(sock));
    }, [&client](std::string_view address) -> ext::task<> {
        co_await rpcdial::dial_http(&client, "http", address);
    });
}

TEST(Connector, HttpTunnelRejected) {
    auto server = server_socket::loopback();
    const auto client = rpcdial::client();
    auto closed = false;

    run(server, [&closed](rpcdial::socket& sock) -> ext::task<> {
        co_await read_head(sock);
        co_await rpcdial::test::write_string(
            sock,
            "HTTP/1.0 403 Forbidden\r\n\r\n"
        );

        EXPECT_EQ(0, co_await drain(sock));
        closed = true;
    }, [&client](std::string_view address) -> ext::task<> {
        auto failed = false;

        try {
            co_await rpcdial::dial_http(&client, "http", address);
        }
        catch (const rpcdial::tunnel_error& ex) {
            failed = true;

            EXPECT_EQ("dial-http", ex.op());
            EXPECT_EQ(fmt::format("http {}", address), ex.net());
            EXPECT_EQ(
                "unexpected HTTP response: 403 Forbidden",
                rpcdial::describe(ex.cause())
            );
        }

        EXPECT_TRUE(failed);
    });

    EXPECT_TRUE(closed);
}

TEST(Connector, HttpTunnelTimeout) {
    auto server = server_socket::loopback();

    auto options = rpcdial::connect_option();
    options.connect_timeout = 100ms;

    const auto client = rpcdial::client(options);

    run(server, [](rpcdial::socket& sock) -> ext::task<> {
        EXPECT_EQ(tunnel_request, co_await read_head(sock));
        EXPECT_EQ(0, co_await drain(sock));
    }, [&client](std::string_view address) -> ext::task<> {
        const auto start = rpcdial::clock::now();
        auto failed = false;

        try {
            co_await rpcdial::dial_http(&client, "http", address);
        }
        catch (const rpcdial::tunnel_error& ex) {
            failed = true;
            EXPECT_THROW(
                std::rethrow_exception(ex.cause()),
                rpcdial::timeout_error
            );
        }

        EXPECT_TRUE(failed);
        EXPECT_GE(rpcdial::clock::now() - start, 100ms);
    });
}

TEST(Connector, HttpDialFailure) {
    rpcdial::run([](std::string address) -> ext::task<> {
        const auto client = rpcdial::client();
        auto failed = false;

        try {
            co_await rpcdial::dial_http(&client, "http", address);
        }
        catch (const rpcdial::dial_error& ex) {
            failed = true;
            EXPECT_EQ("tcp", ex.net());
            EXPECT_EQ(address, ex.address());
        }

        EXPECT_TRUE(failed);
    }(closed_address()));
}

TEST(Connector, NullClient) {
    rpcdial::run([]() -> ext::task<> {
        EXPECT_THROW(
            co_await rpcdial::dial_http(nullptr, "http", "127.0.0.1:8972"),
            rpcdial::invalid_argument
        );
        EXPECT_THROW(
            co_await rpcdial::dial_websocket(nullptr, "ws", "127.0.0.1:8972"),
            rpcdial::invalid_argument
        );
    }());
}

TEST(Connector, WebSocket) {
    auto server = server_socket::loopback();
    const auto client = rpcdial::client();

    run(server, [](rpcdial::socket& sock) -> ext::task<> {
        co_await echo_websocket(sock);
    }, [&client](std::string_view address) -> ext::task<> {
        auto conn = co_await rpcdial::dial_websocket(&client, "ws", address);

        EXPECT_TRUE(conn->description().starts_with("ws tcp connection ("));

        co_await rpcdial::write_all(*conn, "abc");
        EXPECT_EQ("ok", co_await read_string(*conn, 2));
    });
}

TEST(Connector, WebSocketPlainIgnoresTls) {
    auto server = server_socket::loopback();

    auto options = rpcdial::connect_option();
    options.tls = rpcdial::test::certificate::get().client_context();

    const auto client = rpcdial::client(options);

    run(server, [](rpcdial::socket& sock) -> ext::task<> {
        co_await echo_websocket(sock);
    }, [&client](std::string_view address) -> ext::task<> {
        auto conn = co_await rpcdial::dial_websocket(&client, "ws", address);

        EXPECT_TRUE(conn->description().starts_with("ws tcp connection ("));

        co_await rpcdial::write_all(*conn, "abc");
        EXPECT_EQ("ok", co_await read_string(*conn, 2));
    });
}

TEST(Connector, WebSocketSecure) {
    const auto& cert = rpcdial::test::certificate::get();
    auto server = server_socket::loopback();

    auto options = rpcdial::connect_option();
    options.tls = cert.client_context();

    const auto client = rpcdial::client(options);

    run(server, [&cert](rpcdial::socket& sock) -> ext::task<> {
        auto tls = cert.server_context().wrap(std::move(sock));
        co_await tls.accept();
        co_await echo_websocket(tls);
    }, [&client](std::string_view address) -> ext::task<> {
        auto conn = co_await rpcdial::dial_websocket(&client, "wss", address);

        EXPECT_TRUE(conn->description().starts_with("ws TLS connection ("));

        co_await rpcdial::write_all(*conn, "abc");
        EXPECT_EQ("ok", co_await read_string(*conn, 2));

        conn->close();
    });
}

TEST(Connector, WebSocketSecureDefaultContext) {
    const auto& cert = rpcdial::test::certificate::get();
    auto server = server_socket::loopback();

    // Without a configured context the system trust store is used, which
    // does not know the test certificate.
    const auto client = rpcdial::client();
    auto handshakes = 0;

    run(server, [&cert, &handshakes](rpcdial::socket& sock) -> ext::task<> {
        auto tls = cert.server_context().wrap(std::move(sock));

        try {
            co_await tls.accept();
            ++handshakes;
        }
        catch (const std::exception& ex) {
            TIMBER_DEBUG("client aborted the handshake: {}", ex.what());
        }
    }, [&client](std::string_view address) -> ext::task<> {
        EXPECT_THROW(
            co_await rpcdial::dial_websocket(&client, "wss", address),
            rpcdial::ssl::error
        );
    });

    EXPECT_EQ(0, handshakes);
}

TEST(Connector, WebSocketRejected) {
    auto server = server_socket::loopback();
    const auto client = rpcdial::client();

    run(server, [](rpcdial::socket& sock) -> ext::task<> {
        co_await read_head(sock);
        co_await rpcdial::test::write_string(
            sock,
            "HTTP/1.1 404 Not Found\r\n\r\n"
        );
        EXPECT_EQ(0, co_await drain(sock));
    }, [&client](std::string_view address) -> ext::task<> {
        EXPECT_THROW(
            co_await rpcdial::dial_websocket(&client, "ws", address),
            rpcdial::websocket_error
        );
    });
}

TEST(Connector, Memory) {
    const auto network = std::make_shared<rpcdial::memory_network>();
    auto listener = network->listen("rpc");

    rpcdial::run([](
        std::shared_ptr<rpcdial::memory_network> network
    ) -> ext::task<> {
        const auto conn = co_await rpcdial::dial_memory(network, "rpc");
        EXPECT_EQ("memory connection (client rpc)", conn->description());

        EXPECT_THROW(
            co_await rpcdial::dial_memory(network, "elsewhere"),
            rpcdial::dial_error
        );
        EXPECT_THROW(
            co_await rpcdial::dial_memory(nullptr, "rpc"),
            rpcdial::invalid_argument
        );
    }(network));
}
