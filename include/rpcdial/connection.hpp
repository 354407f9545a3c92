#pragma once

#include "deadline.hpp"

#include <chrono>
#include <ext/coroutine>
#include <fmt/format.h>
#include <string>
#include <string_view>

namespace rpcdial {
    /// A duplex byte stream to a remote peer.
    ///
    /// One coroutine may read while others write; writers that must not
    /// interleave their data are expected to serialize themselves.
    class connection {
    public:
        virtual ~connection() = default;

        /// Closes the connection. Suspended reads and writes are resumed
        /// and fail; subsequent operations fail with 'closed_error'.
        virtual auto close() noexcept -> void = 0;

        virtual auto closed() const noexcept -> bool = 0;

        virtual auto description() const -> std::string = 0;

        /// Reads up to 'len' bytes. Returns 0 at end of stream.
        virtual auto read(
            void* dest,
            std::size_t len
        ) -> ext::task<std::size_t> = 0;

        /// Sets an absolute deadline for all reads and writes.
        /// Operations past the deadline fail with 'timeout_error'.
        /// A default constructed time point removes the deadline.
        virtual auto set_deadline(clock::time_point time) -> void = 0;

        virtual auto write(
            const void* src,
            std::size_t len
        ) -> ext::task<std::size_t> = 0;
    };

    /// Implemented by connections whose transport supports
    /// TCP keep-alive probes.
    class keep_alive {
    public:
        virtual ~keep_alive() = default;

        virtual auto set_keep_alive(std::chrono::seconds period) -> void = 0;
    };

    /// Reads exactly 'len' bytes or throws 'eof'.
    auto read_exact(
        connection& conn,
        void* dest,
        std::size_t len
    ) -> ext::task<>;

    auto write_all(
        connection& conn,
        const void* src,
        std::size_t len
    ) -> ext::task<>;

    auto write_all(connection& conn, std::string_view data) -> ext::task<>;
}

template <>
struct fmt::formatter<rpcdial::connection> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const rpcdial::connection& conn, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", conn.description());
    }
};
