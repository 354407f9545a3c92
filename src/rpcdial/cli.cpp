#include "cli.h"

#include <fmt/format.h>

namespace commline {
    template <>
    auto parse(std::string_view argument) -> timber::level {
        if (const auto level = timber::parse_level(argument)) return *level;

        throw cli_error(fmt::format(
            "'{}' is not a log level; expected one of: "
            "emergency, alert, critical, error, warning, notice, info, "
            "debug, trace",
            argument
        ));
    }
}
