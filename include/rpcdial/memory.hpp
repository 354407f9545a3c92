#pragma once

#include "connection.hpp"
#include "event.hpp"

#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rpcdial {
    namespace detail {
        /// One direction of an in-process byte stream.
        struct memory_pipe {
            std::deque<std::byte> data;
            event readable;
            /// The writing end closed: the reader sees EOF once 'data'
            /// is drained.
            bool writer_closed = false;
            /// The reading end closed: further writes fail.
            bool reader_closed = false;
        };

        struct memory_endpoint {
            std::string address;
            std::deque<std::unique_ptr<connection>> backlog;
            event arrivals;
            bool closed = false;
        };
    }

    /// One end of an in-process connection.
    class memory_connection final : public connection {
        std::string address;
        std::string side;
        std::shared_ptr<detail::memory_pipe> in;
        std::shared_ptr<detail::memory_pipe> out;
        rpcdial::deadline timeout;
        bool is_closed = false;

        auto check() const -> void;
    public:
        /// Creates both ends of a connection to 'address'.
        static auto pair(std::string_view address) -> std::pair<
            std::unique_ptr<memory_connection>,
            std::unique_ptr<memory_connection>
        >;

        memory_connection(
            std::string_view address,
            std::string_view side,
            std::shared_ptr<detail::memory_pipe> in,
            std::shared_ptr<detail::memory_pipe> out
        );

        ~memory_connection();

        auto close() noexcept -> void override;

        auto closed() const noexcept -> bool override;

        auto description() const -> std::string override;

        auto read(void* dest, std::size_t len) -> ext::task<std::size_t>
            override;

        auto set_deadline(clock::time_point time) -> void override;

        auto write(const void* src, std::size_t len) -> ext::task<std::size_t>
            override;
    };

    class memory_listener {
        std::shared_ptr<detail::memory_endpoint> endpoint;
    public:
        memory_listener() = default;

        explicit memory_listener(
            std::shared_ptr<detail::memory_endpoint> endpoint
        );

        memory_listener(const memory_listener&) = delete;

        memory_listener(memory_listener&&) = default;

        ~memory_listener();

        auto operator=(const memory_listener&) -> memory_listener& = delete;

        auto operator=(memory_listener&&) -> memory_listener& = default;

        /// Waits for the next connection. Throws 'closed_error' once the
        /// listener is closed.
        auto accept() -> ext::task<std::unique_ptr<connection>>;

        auto address() const noexcept -> std::string_view;

        /// Stops accepting connections and closes any that were not
        /// accepted yet.
        auto close() noexcept -> void;

        auto listening() const noexcept -> bool;
    };

    /// A table of in-process listeners. Connections dialed through it never
    /// leave the process.
    class memory_network {
        std::unordered_map<std::string, std::shared_ptr<detail::memory_endpoint>>
            endpoints;
    public:
        /// Connects to the listener bound to 'address'.
        /// Throws 'dial_error' when nothing listens there.
        auto dial(std::string_view address) -> std::unique_ptr<connection>;

        /// Binds a listener to 'address'.
        /// Throws 'invalid_argument' when the address is in use.
        auto listen(std::string_view address) -> memory_listener;
    };
}
