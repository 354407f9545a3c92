#pragma once

#include "buffered_reader.hpp"
#include "connection.hpp"

#include <string>

namespace rpcdial {
    /// The RPC layer running on top of an established connection.
    class protocol {
    public:
        virtual ~protocol() = default;

        /// Consumes inbound bytes for the lifetime of the connection.
        /// Returning or throwing ends the connection.
        virtual auto input(buffered_reader& reader)
            -> ext::task<> = 0;

        /// Payload written by each heartbeat. An empty payload skips
        /// the write.
        virtual auto heartbeat() -> std::string = 0;
    };

    /// Drains inbound bytes without interpreting them.
    class discard_protocol : public protocol {
        std::string payload;
    public:
        discard_protocol() = default;

        explicit discard_protocol(std::string heartbeat_payload);

        auto heartbeat() -> std::string override;

        auto input(buffered_reader& reader) -> ext::task<> override;
    };
}
