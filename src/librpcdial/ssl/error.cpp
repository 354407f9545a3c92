#include <rpcdial/ssl/error.hpp>

#include <array>
#include <fmt/format.h>
#include <openssl/err.h>

namespace {
    auto describe(std::string_view what, unsigned long code) -> std::string {
        if (code == 0) return fmt::format("{}: no further details", what);

        auto reason = std::array<char, 256>();
        ERR_error_string_n(code, reason.data(), reason.size());

        return fmt::format("{}: {}", what, reason.data());
    }

    auto take_error() -> unsigned long {
        const auto code = ERR_get_error();
        ERR_clear_error();
        return code;
    }
}

namespace rpcdial::ssl {
    error::error(std::string_view what) : error(what, take_error()) {}

    error::error(std::string_view what, unsigned long code) :
        std::runtime_error(describe(what, code)),
        reason(code)
    {}

    auto error::code() const noexcept -> unsigned long { return reason; }
}
