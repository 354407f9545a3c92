#include "cli.h"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <cstdio>

namespace rpcdial::cli {
    timber::level log_level = timber::level::info;

    auto console_logger(const timber::log& log) noexcept -> void {
        if (log.log_level > log_level) return;

        fmt::print(
            stderr,
            "{:%r} [{}] {}\n",
            log.timestamp,
            log.log_level,
            log.message
        );
    }
}
