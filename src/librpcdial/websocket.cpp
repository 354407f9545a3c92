#include <rpcdial/except.hpp>
#include <rpcdial/http.hpp>
#include <rpcdial/ssl/error.hpp>
#include <rpcdial/websocket.hpp>

#include <algorithm>
#include <cstring>
#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <timber/timber>

namespace {
    constexpr std::size_t key_size = 16;

    constexpr auto fin_bit = std::byte(0x80);
    constexpr auto reserved_bits = std::byte(0x70);
    constexpr auto opcode_bits = std::byte(0x0f);
    constexpr auto mask_bit = std::byte(0x80);
    constexpr auto length_bits = std::byte(0x7f);

    auto base64(const unsigned char* data, std::size_t len) -> std::string {
        auto result = std::string(4 * ((len + 2) / 3), '\0');

        const auto written = EVP_EncodeBlock(
            reinterpret_cast<unsigned char*>(result.data()),
            data,
            static_cast<int>(len)
        );

        result.resize(written);
        return result;
    }

    auto random_bytes(void* dest, std::size_t len) -> void {
        if (RAND_bytes(static_cast<unsigned char*>(dest), len) != 1) {
            throw rpcdial::ssl::error("Failed to generate random bytes");
        }
    }

    auto is_control(rpcdial::ws::opcode opcode) noexcept -> bool {
        return (static_cast<std::uint8_t>(opcode) & 0x8) != 0;
    }

    auto secure(std::string_view network) noexcept -> bool {
        return network == "wss";
    }
}

namespace rpcdial::ws {
    auto location::dial_address() const -> std::string {
        const auto port = secure ? "443" : "80";

        if (host.starts_with('[')) {
            if (host.find("]:") != std::string::npos) return host;
        }
        else if (host.find(':') != std::string::npos) return host;

        return fmt::format("{}:{}", host, port);
    }

    auto encode_header(
        const frame_header& header,
        std::vector<std::byte>& out
    ) -> void {
        auto first = std::byte(static_cast<std::uint8_t>(header.opcode));
        if (header.fin) first |= fin_bit;

        const auto mask = header.masked ? mask_bit : std::byte(0);

        out.push_back(first);

        if (header.length <= 125) {
            out.push_back(mask | std::byte(header.length));
        }
        else if (header.length <= 0xffff) {
            out.push_back(mask | std::byte(126));
            out.push_back(std::byte(header.length >> 8));
            out.push_back(std::byte(header.length));
        }
        else {
            out.push_back(mask | std::byte(127));
            for (auto shift = 56; shift >= 0; shift -= 8) {
                out.push_back(std::byte(header.length >> shift));
            }
        }

        if (header.masked) {
            out.insert(out.end(), header.mask.begin(), header.mask.end());
        }
    }

    auto decode_header(
        std::byte first,
        std::byte second,
        frame_header& header
    ) -> std::size_t {
        if ((first & reserved_bits) != std::byte(0)) {
            throw websocket_error("frame uses reserved bits");
        }

        header.fin = (first & fin_bit) != std::byte(0);
        header.masked = (second & mask_bit) != std::byte(0);

        const auto op = std::to_integer<std::uint8_t>(first & opcode_bits);

        switch (static_cast<opcode>(op)) {
            case opcode::continuation:
            case opcode::text:
            case opcode::binary:
            case opcode::close:
            case opcode::ping:
            case opcode::pong:
                header.opcode = static_cast<opcode>(op);
                break;
            default:
                throw websocket_error(fmt::format(
                    "frame uses reserved opcode {:#x}",
                    op
                ));
        }

        if (header.masked) {
            throw websocket_error("server sent a masked frame");
        }

        const auto length = std::to_integer<std::uint8_t>(second & length_bits);

        if (is_control(header.opcode)) {
            if (!header.fin) throw websocket_error("fragmented control frame");

            if (length > max_control_payload) {
                throw websocket_error("control frame payload too large");
            }
        }

        switch (length) {
            case 126: return 2;
            case 127: return 8;
            default:
                header.length = length;
                return 0;
        }
    }

    auto parse_url(std::string_view url) -> location {
        auto result = location();

        if (url.starts_with("wss://")) {
            result.secure = true;
            url.remove_prefix(6);
        }
        else if (url.starts_with("ws://")) url.remove_prefix(5);
        else {
            throw invalid_argument(fmt::format(
                "unsupported WebSocket URL: {}",
                url
            ));
        }

        const auto slash = url.find('/');

        result.host = std::string(url.substr(0, slash));
        result.path = slash == std::string_view::npos ?
            std::string("/") : std::string(url.substr(slash));

        if (result.host.empty()) {
            throw invalid_argument("WebSocket URL has no host");
        }

        return result;
    }

    auto random_mask() -> mask_key {
        auto result = mask_key();
        random_bytes(result.data(), result.size());
        return result;
    }

    auto xor_mask(
        std::byte* data,
        std::size_t len,
        const mask_key& mask,
        std::uint64_t offset
    ) noexcept -> void {
        for (std::size_t i = 0; i < len; ++i) {
            data[i] ^= mask[(offset + i) % mask.size()];
        }
    }
}

namespace rpcdial {
    auto websocket_url(
        std::string_view network,
        std::string_view address,
        std::string_view path
    ) -> std::string {
        return fmt::format(
            "{}://{}{}",
            secure(network) ? "wss" : "ws",
            address,
            path
        );
    }

    auto websocket_origin(
        std::string_view network,
        std::string_view address
    ) -> std::string {
        return fmt::format(
            "{}://{}",
            secure(network) ? "https" : "http",
            address
        );
    }

    auto websocket_key() -> std::string {
        unsigned char nonce[key_size];
        random_bytes(nonce, key_size);
        return base64(nonce, key_size);
    }

    auto websocket_accept_key(std::string_view key) -> std::string {
        const auto input = fmt::format("{}{}", key, ws::guid);

        unsigned char digest[SHA_DIGEST_LENGTH];
        SHA1(
            reinterpret_cast<const unsigned char*>(input.data()),
            input.size(),
            digest
        );

        return base64(digest, SHA_DIGEST_LENGTH);
    }

    auto websocket_handshake(
        connection& conn,
        const ws::location& location,
        std::string_view origin
    ) -> ext::task<> {
        const auto key = websocket_key();

        const auto request = fmt::format(
            "GET {} HTTP/1.1\r\n"
            "Host: {}\r\n"
            "Upgrade: websocket\r\n"
            "Connection: Upgrade\r\n"
            "Sec-WebSocket-Key: {}\r\n"
            "Sec-WebSocket-Version: 13\r\n"
            "Origin: {}\r\n"
            "\r\n",
            location.path,
            location.host,
            key,
            origin
        );

        co_await write_all(conn, request);

        const auto response = co_await http::read_response(conn);

        if (response.code != 101) {
            throw websocket_error(fmt::format(
                "handshake rejected: {}",
                response.status
            ));
        }

        const auto upgrade = response.get("Upgrade");
        if (!upgrade || !http::iequals(*upgrade, "websocket")) {
            throw websocket_error("handshake response has a bad Upgrade header");
        }

        const auto connection = response.get("Connection");
        if (!connection || !http::has_token(*connection, "upgrade")) {
            throw websocket_error(
                "handshake response has a bad Connection header"
            );
        }

        const auto accept = response.get("Sec-WebSocket-Accept");
        if (!accept || *accept != websocket_accept_key(key)) {
            throw websocket_error("handshake response has a bad accept key");
        }

        TIMBER_DEBUG(
            "{} upgraded to WebSocket: {}{}",
            conn,
            location.host,
            location.path
        );
    }

    websocket_connection::websocket_connection(
        std::unique_ptr<connection>&& inner
    ) :
        inner(std::move(inner))
    {}

    auto websocket_connection::close() noexcept -> void { inner->close(); }

    auto websocket_connection::closed() const noexcept -> bool {
        return inner->closed();
    }

    auto websocket_connection::control(
        const ws::frame_header& header
    ) -> ext::task<> {
        std::byte payload[ws::max_control_payload];
        co_await read_exact(*inner, payload, header.length);

        switch (header.opcode) {
            case ws::opcode::ping:
                TIMBER_TRACE("{} ping", description());
                co_await send(ws::opcode::pong, payload, header.length);
                break;
            case ws::opcode::close:
                TIMBER_DEBUG("{} received close frame", description());
                received_close = true;

                // Echo the status code, if any, to complete the closing
                // handshake. The peer may already be gone.
                try {
                    co_await send(
                        ws::opcode::close,
                        payload,
                        std::min<std::size_t>(header.length, 2)
                    );
                }
                catch (const std::exception& ex) {
                    TIMBER_DEBUG(
                        "{} failed to answer close frame: {}",
                        description(),
                        ex.what()
                    );
                }
                break;
            default:
                break;
        }
    }

    auto websocket_connection::description() const -> std::string {
        return fmt::format("ws {}", inner->description());
    }

    auto websocket_connection::next_frame() -> ext::task<bool> {
        while (remaining == 0) {
            const auto header = co_await read_header();
            if (!header) co_return false;

            switch (header->opcode) {
                case ws::opcode::continuation:
                case ws::opcode::text:
                case ws::opcode::binary:
                    remaining = header->length;
                    break;
                default:
                    co_await control(*header);
                    if (received_close) co_return false;
                    break;
            }
        }

        co_return true;
    }

    auto websocket_connection::read(
        void* dest,
        std::size_t len
    ) -> ext::task<std::size_t> {
        if (len == 0 || received_close) co_return 0;
        if (!co_await next_frame()) co_return 0;

        const auto bytes = co_await inner->read(
            dest,
            std::min<std::uint64_t>(len, remaining)
        );

        if (bytes == 0) throw websocket_error("unexpected EOF inside frame");

        remaining -= bytes;
        co_return bytes;
    }

    auto websocket_connection::read_header() ->
        ext::task<std::optional<ws::frame_header>>
    {
        std::byte fixed[2];

        // End of stream between frames is a clean EOF.
        if (co_await inner->read(fixed, 1) == 0) co_return std::nullopt;

        auto header = ws::frame_header();
        std::byte extended[8];
        auto extended_size = std::size_t(0);
        auto truncated = false;

        try {
            co_await read_exact(*inner, fixed + 1, 1);

            extended_size = ws::decode_header(fixed[0], fixed[1], header);
            if (extended_size > 0) {
                co_await read_exact(*inner, extended, extended_size);
            }
        }
        catch (const eof&) {
            truncated = true;
        }

        if (truncated) throw websocket_error("unexpected EOF in frame header");

        if (extended_size > 0) {
            header.length = 0;
            for (std::size_t i = 0; i < extended_size; ++i) {
                header.length = (header.length << 8) |
                    std::to_integer<std::uint64_t>(extended[i]);
            }

            if (header.length >> 63) {
                throw websocket_error("frame length out of range");
            }
        }

        co_return header;
    }

    auto websocket_connection::send(
        ws::opcode opcode,
        const void* payload,
        std::size_t len
    ) -> ext::task<> {
        auto frame = co_await frames.lock();
        frame->clear();

        const auto header = ws::frame_header {
            .fin = true,
            .opcode = opcode,
            .masked = true,
            .length = len,
            .mask = ws::random_mask()
        };

        ws::encode_header(header, *frame);

        const auto start = frame->size();
        frame->resize(start + len);
        if (len > 0) std::memcpy(frame->data() + start, payload, len);
        ws::xor_mask(frame->data() + start, len, header.mask);

        co_await write_all(*inner, frame->data(), frame->size());
    }

    auto websocket_connection::set_deadline(clock::time_point time) -> void {
        inner->set_deadline(time);
    }

    auto websocket_connection::write(
        const void* src,
        std::size_t len
    ) -> ext::task<std::size_t> {
        if (len == 0) co_return 0;

        co_await send(ws::opcode::binary, src, len);
        co_return len;
    }
}
