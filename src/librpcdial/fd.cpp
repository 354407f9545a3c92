#include <rpcdial/fd.hpp>

#include <cerrno>
#include <cstring>
#include <timber/timber>
#include <unistd.h>
#include <utility>

namespace rpcdial {
    fd::fd(int value) noexcept : value(value) {}

    fd::fd(fd&& other) noexcept : value(std::exchange(other.value, -1)) {}

    fd::~fd() { close(); }

    auto fd::operator=(fd&& other) noexcept -> fd& {
        auto previous = fd(std::exchange(other.value, -1));
        std::swap(value, previous.value);
        return *this;
    }

    fd::operator int() const noexcept { return value; }

    auto fd::close() noexcept -> void {
        const auto descriptor = std::exchange(value, -1);
        if (descriptor < 0) return;

        // The descriptor is released even when close reports an error.
        if (::close(descriptor) == 0) {
            TIMBER_TRACE("fd ({}) closed", descriptor);
            return;
        }

        TIMBER_WARNING(
            "close fd ({}): {}",
            descriptor,
            std::strerror(errno)
        );
    }

    auto fd::valid() const noexcept -> bool { return value >= 0; }
}
