#pragma once

#include <commline/commline>

namespace rpcdial::cli {
    auto connect() -> std::unique_ptr<commline::command_node>;
}
