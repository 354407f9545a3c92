#pragma once

#include "connection.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rpcdial::http {
    /// Upper bound on the size of a response head (status line and headers).
    constexpr std::size_t max_head_size = 8192;

    struct header {
        std::string name;
        std::string value;
    };

    struct status_line {
        std::string proto;
        int code = 0;
        /// Status code and reason phrase, e.g. "200 OK".
        std::string status;
    };

    struct response : status_line {
        std::vector<header> headers;

        /// Returns the first value of the named header (case-insensitive).
        auto get(std::string_view name) const -> std::optional<std::string_view>;
    };

    auto parse_status_line(std::string_view line) -> status_line;

    auto parse_header(std::string_view line) -> header;

    /// Reads a response head from 'conn'. Bytes are consumed one at a time
    /// so that nothing past the blank line ending the head is read.
    auto read_response(connection& conn) -> ext::task<response>;

    /// Case-insensitive ASCII comparison.
    auto iequals(std::string_view a, std::string_view b) noexcept -> bool;

    /// Returns true if the comma-separated header value contains 'token'.
    auto has_token(std::string_view value, std::string_view token) -> bool;
}
