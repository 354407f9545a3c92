#include <rpcdial/protocol.hpp>

#include <timber/timber>

namespace rpcdial {
    discard_protocol::discard_protocol(std::string heartbeat_payload) :
        payload(std::move(heartbeat_payload))
    {}

    auto discard_protocol::heartbeat() -> std::string { return payload; }

    auto discard_protocol::input(
        buffered_reader& reader
    ) -> ext::task<> {
        std::size_t total = 0;

        while (true) {
            const auto bytes = co_await reader.read();
            if (bytes.empty()) break;

            total += bytes.size();
        }

        TIMBER_DEBUG("discarded {:L} byte{}", total, total == 1 ? "" : "s");
    }
}
