#include <rpcdial/except.hpp>
#include <rpcdial/http.hpp>

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <timber/timber>

namespace {
    auto trim(std::string_view string) -> std::string_view {
        constexpr auto whitespace = std::string_view(" \t");

        const auto begin = string.find_first_not_of(whitespace);
        if (begin == std::string_view::npos) return {};

        const auto end = string.find_last_not_of(whitespace);
        return string.substr(begin, end - begin + 1);
    }

    auto valid_proto(std::string_view proto) -> bool {
        // HTTP/<digit>.<digit>
        return
            proto.size() == 8 &&
            proto.starts_with("HTTP/") &&
            std::isdigit(static_cast<unsigned char>(proto[5])) &&
            proto[6] == '.' &&
            std::isdigit(static_cast<unsigned char>(proto[7]));
    }

    auto read_line(
        rpcdial::connection& conn,
        std::size_t& budget
    ) -> ext::task<std::string> {
        auto line = std::string();

        while (true) {
            if (budget == 0) {
                throw rpcdial::http_error("response head too large");
            }

            char c = 0;

            try {
                co_await rpcdial::read_exact(conn, &c, 1);
            }
            catch (const rpcdial::eof&) {
                throw rpcdial::http_error("unexpected EOF");
            }

            --budget;

            if (c == '\n') break;
            line.push_back(c);
        }

        if (line.ends_with('\r')) line.pop_back();
        co_return line;
    }
}

namespace rpcdial::http {
    auto response::get(
        std::string_view name
    ) const -> std::optional<std::string_view> {
        const auto result = std::find_if(
            headers.begin(),
            headers.end(),
            [name](const header& h) { return iequals(h.name, name); }
        );

        if (result == headers.end()) return std::nullopt;
        return result->value;
    }

    auto parse_status_line(std::string_view line) -> status_line {
        const auto space = line.find(' ');

        if (space == std::string_view::npos) {
            throw http_error(fmt::format("malformed HTTP response: {}", line));
        }

        const auto proto = line.substr(0, space);
        const auto status = trim(line.substr(space + 1));

        if (!valid_proto(proto)) {
            throw http_error(fmt::format("malformed HTTP version: {}", proto));
        }

        if (
            status.size() < 3 ||
            (status.size() > 3 && status[3] != ' ') ||
            !std::all_of(status.begin(), status.begin() + 3, [](char c) {
                return std::isdigit(static_cast<unsigned char>(c));
            })
        ) {
            throw http_error(fmt::format("malformed HTTP status code: {}", status));
        }

        return {
            .proto = std::string(proto),
            .code = std::stoi(std::string(status.substr(0, 3))),
            .status = std::string(status)
        };
    }

    auto parse_header(std::string_view line) -> header {
        const auto colon = line.find(':');

        if (colon == std::string_view::npos || colon == 0) {
            throw http_error(fmt::format("malformed MIME header line: {}", line));
        }

        const auto name = line.substr(0, colon);

        if (name.find_first_of(" \t") != std::string_view::npos) {
            throw http_error(fmt::format("malformed MIME header line: {}", line));
        }

        return {
            .name = std::string(name),
            .value = std::string(trim(line.substr(colon + 1)))
        };
    }

    auto read_response(connection& conn) -> ext::task<response> {
        auto budget = max_head_size;
        auto result = response();

        static_cast<status_line&>(result) =
            parse_status_line(co_await read_line(conn, budget));

        while (true) {
            const auto line = co_await read_line(conn, budget);
            if (line.empty()) break;

            result.headers.push_back(parse_header(line));
        }

        TIMBER_DEBUG(
            "{} HTTP response: {} {} ({} header{})",
            conn,
            result.proto,
            result.status,
            result.headers.size(),
            result.headers.size() == 1 ? "" : "s"
        );

        co_return result;
    }

    auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
        return std::equal(
            a.begin(),
            a.end(),
            b.begin(),
            b.end(),
            [](char x, char y) {
                return
                    std::tolower(static_cast<unsigned char>(x)) ==
                    std::tolower(static_cast<unsigned char>(y));
            }
        );
    }

    auto has_token(std::string_view value, std::string_view token) -> bool {
        while (!value.empty()) {
            const auto comma = value.find(',');
            const auto item = trim(value.substr(0, comma));

            if (iequals(item, token)) return true;
            if (comma == std::string_view::npos) break;

            value.remove_prefix(comma + 1);
        }

        return false;
    }
}
