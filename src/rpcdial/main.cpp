#include "cli.h"
#include "commands.h"

#include <fmt/format.h>

namespace {
    constexpr auto about =
        "Dial RPC servers over TCP, TLS, Unix sockets, HTTP tunnels "
        "and WebSockets.";

    auto $main(const commline::app& app, const commline::argv& argv)
        -> void
    {
        fmt::print("{} {}\n{}\n", app.name, app.version, app.description);
        fmt::print("Run '{} connect --help' to dial a server.\n", app.name);
    }
}

auto main(int argc, const char** argv) -> int {
    timber::thread_name = std::string("main");
    timber::log_handler = &rpcdial::cli::console_logger;

    auto app = commline::application(NAME, VERSION, about, $main);
    app.subcommand(rpcdial::cli::connect());

    return app.run(argc, argv);
}
