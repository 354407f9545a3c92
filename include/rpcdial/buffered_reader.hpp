#pragma once

#include "connection.hpp"

#include <cstddef>
#include <ext/coroutine>
#include <span>
#include <vector>

namespace rpcdial {
    /// Reads from a connection through a fixed-size buffer.
    class buffered_reader {
        connection* source;
        std::vector<std::byte> storage;
        std::size_t head = 0;
        std::size_t tail = 0;

        /// Refills the empty buffer.
        /// Returns false once the connection reached EOF.
        auto fill() -> ext::task<bool>;
    public:
        static constexpr std::size_t default_capacity = 4096;

        explicit buffered_reader(
            connection& source,
            std::size_t capacity = default_capacity
        );

        /// Number of bytes received but not yet consumed.
        auto buffered() const noexcept -> std::size_t;

        auto capacity() const noexcept -> std::size_t;

        /// Consumes everything buffered, receiving more first if the
        /// buffer is empty. An empty span means EOF.
        auto read() -> ext::task<std::span<const std::byte>>;

        /// Fills 'dest' completely. Throws 'eof' if the connection ends
        /// first.
        auto read(void* dest, std::size_t len) -> ext::task<>;
    };
}
