#include <rpcdial/connection.hpp>
#include <rpcdial/except.hpp>

namespace rpcdial {
    auto read_exact(
        connection& conn,
        void* dest,
        std::size_t len
    ) -> ext::task<> {
        auto* bytes = static_cast<std::byte*>(dest);

        while (len > 0) {
            const auto read = co_await conn.read(bytes, len);
            if (read == 0) throw eof();

            bytes += read;
            len -= read;
        }
    }

    auto write_all(
        connection& conn,
        const void* src,
        std::size_t len
    ) -> ext::task<> {
        const auto* bytes = static_cast<const std::byte*>(src);

        while (len > 0) {
            const auto written = co_await conn.write(bytes, len);

            bytes += written;
            len -= written;
        }
    }

    auto write_all(connection& conn, std::string_view data) -> ext::task<> {
        return write_all(conn, data.data(), data.size());
    }
}
