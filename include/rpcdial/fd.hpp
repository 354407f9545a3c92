#pragma once

#include <fmt/format.h>

namespace rpcdial {
    /// Owns a file descriptor and closes it on destruction.
    class fd {
        int value = -1;
    public:
        fd() noexcept = default;

        explicit fd(int value) noexcept;

        fd(const fd&) = delete;

        fd(fd&& other) noexcept;

        ~fd();

        auto operator=(const fd&) -> fd& = delete;

        auto operator=(fd&& other) noexcept -> fd&;

        operator int() const noexcept;

        auto close() noexcept -> void;

        auto valid() const noexcept -> bool;
    };
}

template <>
struct fmt::formatter<rpcdial::fd> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const rpcdial::fd& fd, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "fd ({})", static_cast<int>(fd));
    }
};
