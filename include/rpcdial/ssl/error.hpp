#pragma once

#include <stdexcept>
#include <string_view>

namespace rpcdial::ssl {
    /// An OpenSSL failure. The message ends with the oldest error on the
    /// thread's OpenSSL error queue, which is emptied.
    class error : public std::runtime_error {
        unsigned long reason;
    public:
        explicit error(std::string_view what);

        error(std::string_view what, unsigned long code);

        /// The OpenSSL error code, or 0 if the queue was empty.
        auto code() const noexcept -> unsigned long;
    };
}
