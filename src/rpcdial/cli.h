#pragma once

#include <commline/commline>
#include <timber/timber>

namespace commline {
    template<>
    auto parse(std::string_view argument) -> timber::level;
}

namespace rpcdial::cli {
    /// Messages less severe than this level are not printed.
    extern timber::level log_level;

    auto console_logger(const timber::log& log) noexcept -> void;
}
