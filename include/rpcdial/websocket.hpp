#pragma once

#include "connection.hpp"
#include "mutex.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rpcdial {
    namespace ws {
        constexpr auto guid = std::string_view(
            "258EAFA5-E914-47DA-95CA-C5AB0DC85B11"
        );

        /// Largest payload a control frame may carry.
        constexpr std::size_t max_control_payload = 125;

        enum class opcode : std::uint8_t {
            continuation = 0x0,
            text = 0x1,
            binary = 0x2,
            close = 0x8,
            ping = 0x9,
            pong = 0xa
        };

        using mask_key = std::array<std::byte, 4>;

        struct frame_header {
            bool fin = true;
            ws::opcode opcode = opcode::binary;
            bool masked = false;
            std::uint64_t length = 0;
            mask_key mask = {};
        };

        /// Target of a WebSocket dial, as derived from a ws:// or wss:// URL.
        struct location {
            bool secure = false;
            /// Authority as it appears in the URL; sent as the Host header.
            std::string host;
            std::string path;

            /// Returns 'host' with the scheme's default port added when
            /// the URL does not name one.
            auto dial_address() const -> std::string;
        };

        /// Appends the encoded header of a client frame to 'out'.
        auto encode_header(
            const frame_header& header,
            std::vector<std::byte>& out
        ) -> void;

        /// Decodes the fixed two bytes of a frame header. Returns the
        /// number of extended length bytes that follow (0, 2 or 8).
        auto decode_header(
            std::byte first,
            std::byte second,
            frame_header& header
        ) -> std::size_t;

        auto parse_url(std::string_view url) -> location;

        auto random_mask() -> mask_key;

        auto xor_mask(
            std::byte* data,
            std::size_t len,
            const mask_key& mask,
            std::uint64_t offset = 0
        ) noexcept -> void;
    }

    /// Returns "ws://<address><path>" or "wss://<address><path>".
    auto websocket_url(
        std::string_view network,
        std::string_view address,
        std::string_view path
    ) -> std::string;

    /// Returns "http://<address>" or "https://<address>".
    auto websocket_origin(
        std::string_view network,
        std::string_view address
    ) -> std::string;

    /// A random, base64 encoded 16-byte nonce.
    auto websocket_key() -> std::string;

    /// The Sec-WebSocket-Accept value a server must answer 'key' with.
    auto websocket_accept_key(std::string_view key) -> std::string;

    /// Performs the client side of the opening handshake over 'conn'.
    auto websocket_handshake(
        connection& conn,
        const ws::location& location,
        std::string_view origin
    ) -> ext::task<>;

    /// Binary WebSocket messages carried over another connection, exposed
    /// as a byte stream. Each write is sent as one masked binary frame;
    /// reads return the payload bytes of received data frames in order.
    class websocket_connection final : public connection {
        std::unique_ptr<connection> inner;
        mutex<std::vector<std::byte>> frames;
        std::uint64_t remaining = 0;
        bool received_close = false;

        auto control(const ws::frame_header& header) -> ext::task<>;

        auto next_frame() -> ext::task<bool>;

        auto read_header() -> ext::task<std::optional<ws::frame_header>>;

        auto send(
            ws::opcode opcode,
            const void* payload,
            std::size_t len
        ) -> ext::task<>;
    public:
        explicit websocket_connection(std::unique_ptr<connection>&& inner);

        auto close() noexcept -> void override;

        auto closed() const noexcept -> bool override;

        auto description() const -> std::string override;

        auto read(void* dest, std::size_t len) -> ext::task<std::size_t>
            override;

        auto set_deadline(clock::time_point time) -> void override;

        auto write(const void* src, std::size_t len) -> ext::task<std::size_t>
            override;
    };
}
