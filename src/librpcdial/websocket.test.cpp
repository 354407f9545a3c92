#include <rpcdial/except.hpp>
#include <rpcdial/memory.hpp>
#include <rpcdial/runtime.hpp>
#include <rpcdial/websocket.hpp>

#include <functional>
#include <gtest/gtest.h>

using rpcdial::ws::opcode;

namespace {
    struct frame {
        rpcdial::ws::opcode op;
        std::string payload;
    };

    auto read_until_blank_line(rpcdial::connection& conn)
        -> ext::task<std::string>
    {
        auto result = std::string();

        while (!result.ends_with("\r\n\r\n")) {
            char c = 0;
            co_await rpcdial::read_exact(conn, &c, 1);
            result.push_back(c);
        }

        co_return result;
    }

    auto header_value(std::string_view request, std::string_view name)
        -> std::string
    {
        const auto start = request.find(name);
        if (start == std::string_view::npos) return {};

        const auto value = start + name.size() + 2;
        return std::string(
            request.substr(value, request.find("\r\n", value) - value)
        );
    }

    /// Answers a client handshake. Returns the request.
    auto accept_handshake(rpcdial::connection& conn)
        -> ext::task<std::string>
    {
        const auto request = co_await read_until_blank_line(conn);
        const auto key = header_value(request, "Sec-WebSocket-Key");

        co_await rpcdial::write_all(conn, fmt::format(
            "HTTP/1.1 101 Switching Protocols\r\n"
            "Upgrade: websocket\r\n"
            "Connection: Upgrade\r\n"
            "Sec-WebSocket-Accept: {}\r\n"
            "\r\n",
            rpcdial::websocket_accept_key(key)
        ));

        co_return request;
    }

    auto server_frame(
        rpcdial::ws::opcode op,
        std::string_view payload,
        bool masked = false
    ) -> std::string {
        auto bytes = std::vector<std::byte>();

        const auto header = rpcdial::ws::frame_header {
            .fin = true,
            .opcode = op,
            .masked = masked,
            .length = payload.size(),
            .mask = {}
        };

        rpcdial::ws::encode_header(header, bytes);

        auto result = std::string(
            reinterpret_cast<const char*>(bytes.data()),
            bytes.size()
        );
        result += payload;

        return result;
    }

    auto read_client_frame(rpcdial::connection& conn) -> ext::task<frame> {
        std::byte fixed[2];
        co_await rpcdial::read_exact(conn, fixed, 2);

        const auto op = static_cast<opcode>(
            std::to_integer<std::uint8_t>(fixed[0] & std::byte(0x0f))
        );
        EXPECT_NE(std::byte(0), fixed[1] & std::byte(0x80));

        auto length = std::to_integer<std::uint64_t>(fixed[1] & std::byte(0x7f));

        if (length == 126) {
            std::byte extended[2];
            co_await rpcdial::read_exact(conn, extended, 2);

            length =
                std::to_integer<std::uint64_t>(extended[0]) << 8 |
                std::to_integer<std::uint64_t>(extended[1]);
        }

        auto mask = rpcdial::ws::mask_key();
        co_await rpcdial::read_exact(conn, mask.data(), mask.size());

        auto payload = std::vector<std::byte>(length);
        co_await rpcdial::read_exact(conn, payload.data(), payload.size());
        rpcdial::ws::xor_mask(payload.data(), payload.size(), mask);

        co_return frame {
            .op = op,
            .payload = std::string(
                reinterpret_cast<const char*>(payload.data()),
                payload.size()
            )
        };
    }

    auto read_string(rpcdial::connection& conn, std::size_t len)
        -> ext::task<std::string>
    {
        auto result = std::string(len, '\0');
        co_await rpcdial::read_exact(conn, result.data(), len);
        co_return result;
    }

    class WebSocketTest : public testing::Test {
        auto task(
            const std::function<ext::task<>(
                rpcdial::connection& client,
                rpcdial::connection& server
            )>& test
        ) -> ext::task<> {
            auto [client, server] = rpcdial::memory_connection::pair("ws");

            auto request = std::string();
            auto accepted = false;

            [](
                rpcdial::connection& server,
                std::string& request,
                bool& accepted
            ) -> ext::detached_task {
                request = co_await accept_handshake(server);
                accepted = true;
            }(*server, request, accepted);

            co_await rpcdial::websocket_handshake(
                *client,
                rpcdial::ws::parse_url("ws://localhost:8972/_rpcx_"),
                "http://localhost:8972"
            );

            EXPECT_TRUE(accepted);
            EXPECT_TRUE(request.starts_with("GET /_rpcx_ HTTP/1.1\r\n"));
            EXPECT_EQ("localhost:8972", header_value(request, "Host"));
            EXPECT_EQ("http://localhost:8972", header_value(request, "Origin"));
            EXPECT_EQ("13", header_value(request, "Sec-WebSocket-Version"));

            auto ws = rpcdial::websocket_connection(std::move(client));
            co_await test(ws, *server);
        }
    protected:
        auto run(
            const std::function<ext::task<>(
                rpcdial::connection& client,
                rpcdial::connection& server
            )>& test
        ) -> void {
            rpcdial::run(task(test));
        }
    };
}

TEST(WebSocket, Url) {
    EXPECT_EQ(
        "ws://localhost:8972/_rpcx_",
        rpcdial::websocket_url("ws", "localhost:8972", "/_rpcx_")
    );
    EXPECT_EQ(
        "wss://localhost:8972/_rpcx_",
        rpcdial::websocket_url("wss", "localhost:8972", "/_rpcx_")
    );
}

TEST(WebSocket, Origin) {
    EXPECT_EQ(
        "http://localhost:8972",
        rpcdial::websocket_origin("ws", "localhost:8972")
    );
    EXPECT_EQ(
        "https://localhost:8972",
        rpcdial::websocket_origin("wss", "localhost:8972")
    );
}

TEST(WebSocket, AcceptKey) {
    // Example from RFC 6455, section 1.3.
    EXPECT_EQ(
        "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=",
        rpcdial::websocket_accept_key("dGhlIHNhbXBsZSBub25jZQ==")
    );
}

TEST(WebSocket, Key) {
    const auto a = rpcdial::websocket_key();
    const auto b = rpcdial::websocket_key();

    EXPECT_EQ(24, a.size());
    EXPECT_NE(a, b);
}

TEST(WebSocket, ParseUrl) {
    const auto location = rpcdial::ws::parse_url("wss://[::1]:8972/_rpcx_");

    EXPECT_TRUE(location.secure);
    EXPECT_EQ("[::1]:8972", location.host);
    EXPECT_EQ("/_rpcx_", location.path);
    EXPECT_EQ("[::1]:8972", location.dial_address());

    EXPECT_EQ("example.com:80", rpcdial::ws::parse_url("ws://example.com")
        .dial_address());
    EXPECT_EQ("example.com:443", rpcdial::ws::parse_url("wss://example.com/x")
        .dial_address());

    EXPECT_THROW(
        rpcdial::ws::parse_url("http://example.com"),
        rpcdial::invalid_argument
    );
}

TEST(WebSocket, EncodeHeader) {
    auto bytes = std::vector<std::byte>();

    rpcdial::ws::encode_header({.length = 300}, bytes);

    ASSERT_EQ(4, bytes.size());
    EXPECT_EQ(std::byte(0x82), bytes[0]);
    EXPECT_EQ(std::byte(126), bytes[1]);
    EXPECT_EQ(std::byte(0x01), bytes[2]);
    EXPECT_EQ(std::byte(0x2c), bytes[3]);
}

TEST(WebSocket, DecodeHeader) {
    auto header = rpcdial::ws::frame_header();

    EXPECT_EQ(
        0,
        rpcdial::ws::decode_header(std::byte(0x82), std::byte(5), header)
    );
    EXPECT_EQ(opcode::binary, header.opcode);
    EXPECT_EQ(5, header.length);

    EXPECT_EQ(
        8,
        rpcdial::ws::decode_header(std::byte(0x02), std::byte(127), header)
    );
    EXPECT_FALSE(header.fin);

    EXPECT_THROW(
        rpcdial::ws::decode_header(std::byte(0xc2), std::byte(0), header),
        rpcdial::websocket_error
    );
    EXPECT_THROW(
        rpcdial::ws::decode_header(std::byte(0x83), std::byte(0), header),
        rpcdial::websocket_error
    );
    EXPECT_THROW(
        rpcdial::ws::decode_header(std::byte(0x89), std::byte(126), header),
        rpcdial::websocket_error
    );
    EXPECT_THROW(
        rpcdial::ws::decode_header(std::byte(0x82), std::byte(0x85), header),
        rpcdial::websocket_error
    );
}

TEST_F(WebSocketTest, Read) {
    run([](
        rpcdial::connection& client,
        rpcdial::connection& server
    ) -> ext::task<> {
        co_await rpcdial::write_all(
            server,
            server_frame(opcode::binary, "hello ") +
            server_frame(opcode::binary, "") +
            server_frame(opcode::binary, "world")
        );

        EXPECT_EQ("hello world", co_await read_string(client, 11));
        EXPECT_EQ("ws memory connection (client ws)", client.description());
    });
}

TEST_F(WebSocketTest, Write) {
    run([](
        rpcdial::connection& client,
        rpcdial::connection& server
    ) -> ext::task<> {
        const auto payload = std::string(200, 'x');

        co_await rpcdial::write_all(client, "abc");
        co_await rpcdial::write_all(client, payload);

        const auto first = co_await read_client_frame(server);
        EXPECT_EQ(opcode::binary, first.op);
        EXPECT_EQ("abc", first.payload);

        const auto second = co_await read_client_frame(server);
        EXPECT_EQ(payload, second.payload);
    });
}

TEST_F(WebSocketTest, Ping) {
    run([](
        rpcdial::connection& client,
        rpcdial::connection& server
    ) -> ext::task<> {
        co_await rpcdial::write_all(
            server,
            server_frame(opcode::ping, "are you there") +
            server_frame(opcode::binary, "data")
        );

        EXPECT_EQ("data", co_await read_string(client, 4));

        const auto pong = co_await read_client_frame(server);
        EXPECT_EQ(opcode::pong, pong.op);
        EXPECT_EQ("are you there", pong.payload);
    });
}

TEST_F(WebSocketTest, Close) {
    run([](
        rpcdial::connection& client,
        rpcdial::connection& server
    ) -> ext::task<> {
        co_await rpcdial::write_all(
            server,
            server_frame(opcode::close, std::string("\x03\xe8", 2))
        );

        char c = 0;
        EXPECT_EQ(0, co_await client.read(&c, 1));

        const auto reply = co_await read_client_frame(server);
        EXPECT_EQ(opcode::close, reply.op);
        EXPECT_EQ(std::string("\x03\xe8", 2), reply.payload);
    });
}

TEST_F(WebSocketTest, MaskedServerFrame) {
    run([](
        rpcdial::connection& client,
        rpcdial::connection& server
    ) -> ext::task<> {
        co_await rpcdial::write_all(
            server,
            server_frame(opcode::binary, "data", true)
        );

        char c = 0;
        EXPECT_THROW(co_await client.read(&c, 1), rpcdial::websocket_error);
    });
}

TEST_F(WebSocketTest, PeerClosed) {
    run([](
        rpcdial::connection& client,
        rpcdial::connection& server
    ) -> ext::task<> {
        co_await rpcdial::write_all(server, server_frame(opcode::binary, "ab"));
        server.close();

        EXPECT_EQ("ab", co_await read_string(client, 2));

        char c = 0;
        EXPECT_EQ(0, co_await client.read(&c, 1));
    });
}

TEST(WebSocketHandshake, Rejected) {
    rpcdial::run([]() -> ext::task<> {
        auto [client, server] = rpcdial::memory_connection::pair("ws");

        co_await rpcdial::write_all(
            *server,
            "HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\n\r\n"
        );

        EXPECT_THROW(
            co_await rpcdial::websocket_handshake(
                *client,
                rpcdial::ws::parse_url("ws://localhost/"),
                "http://localhost"
            ),
            rpcdial::websocket_error
        );
    }());
}

TEST(WebSocketHandshake, BadAcceptKey) {
    rpcdial::run([]() -> ext::task<> {
        auto [client, server] = rpcdial::memory_connection::pair("ws");

        co_await rpcdial::write_all(
            *server,
            "HTTP/1.1 101 Switching Protocols\r\n"
            "Upgrade: websocket\r\n"
            "Connection: Upgrade\r\n"
            "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"
            "\r\n"
        );

        EXPECT_THROW(
            co_await rpcdial::websocket_handshake(
                *client,
                rpcdial::ws::parse_url("ws://localhost/"),
                "http://localhost"
            ),
            rpcdial::websocket_error
        );
    }());
}
