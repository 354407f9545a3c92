#include "cli.h"
#include "commands.h"

#include <rpcdial/rpcdial>

#include <cstdio>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {
    /// Copies everything the server sends to standard output.
    class print_protocol : public rpcdial::protocol {
        std::string payload;
    public:
        explicit print_protocol(std::string heartbeat_payload) :
            payload(std::move(heartbeat_payload))
        {}

        auto heartbeat() -> std::string override { return payload; }

        auto input(rpcdial::buffered_reader& reader)
            -> ext::task<> override
        {
            while (true) {
                const auto bytes = co_await reader.read();
                if (bytes.empty()) break;

                std::fwrite(bytes.data(), 1, bytes.size(), stdout);
                std::fflush(stdout);
            }
        }
    };

    auto session(
        rpcdial::client& client,
        std::string_view network,
        std::string_view address,
        std::string_view message
    ) -> ext::task<> {
        co_await client.connect(network, address);

        TIMBER_INFO(
            "connected to {} {}: {}",
            network,
            address,
            *client.connection()
        );

        if (!message.empty()) co_await client.write(message);
    }
}

static auto $connect(
    const commline::app& app,
    const commline::argv& argv,
    timber::level log_level,
    unsigned int connect_timeout,
    std::string rpc_path,
    bool tls,
    bool insecure,
    std::string ca,
    unsigned int keep_alive,
    unsigned int idle_timeout,
    unsigned int heartbeat,
    std::string heartbeat_payload,
    std::string message,
    std::string network,
    std::string address
) -> void {
    rpcdial::cli::log_level = log_level;

    TIMBER_DEBUG(
        "{} version {} starting: [PID {}]",
        app.name,
        app.version,
        getpid()
    );

    auto options = rpcdial::connect_option();

    options.connect_timeout = std::chrono::milliseconds(connect_timeout);
    options.rpc_path = std::move(rpc_path);
    options.tcp_keep_alive_period = std::chrono::seconds(keep_alive);
    options.idle_timeout = std::chrono::milliseconds(idle_timeout);
    options.heartbeat = heartbeat > 0;
    options.heartbeat_interval = std::chrono::milliseconds(heartbeat);

    if (tls || insecure || !ca.empty()) {
        auto ctx = rpcdial::ssl::context::client();

        if (!ca.empty()) ctx.certificate_authority(ca);
        if (insecure) ctx.verify(false);

        options.tls = std::move(ctx);
    }

    // Outlives the client: closing a connection wakes its waiters.
    const auto runtime = rpcdial::runtime();

    auto client = rpcdial::client(
        std::move(options),
        nullptr,
        std::make_shared<print_protocol>(std::move(heartbeat_payload))
    );

    // Runs until the server closes the connection.
    rpcdial::run(session(client, network, address, message));

    TIMBER_DEBUG("connection to {} {} closed", network, address);
}

namespace rpcdial::cli {
    using namespace commline;

    auto connect() -> std::unique_ptr<command_node> {
        return command(
            "connect",
            "Connect to a server and print the data it sends.",
            options(
                option<timber::level>(
                    {"log-level", "l"},
                    "Minimum log level to display.",
                    "level",
                    timber::level::info
                ),
                option<unsigned int>(
                    {"connect-timeout", "t"},
                    "Milliseconds allowed for dialing and handshakes.",
                    "ms",
                    10'000
                ),
                option<std::string>(
                    {"rpc-path", "p"},
                    "Path for HTTP tunnels and WebSockets.",
                    "path",
                    std::string(rpcdial::default_rpc_path)
                ),
                flag(
                    {"tls"},
                    "Secure the connection with TLS."
                ),
                flag(
                    {"insecure", "k"},
                    "Use TLS without verifying the server's certificate."
                ),
                option<std::string>(
                    {"ca"},
                    "Trust the certificates in this PEM file.",
                    "file",
                    ""
                ),
                option<unsigned int>(
                    {"keep-alive"},
                    "Seconds between TCP keep-alive probes.",
                    "seconds",
                    0
                ),
                option<unsigned int>(
                    {"idle-timeout"},
                    "Close the connection after this many milliseconds.",
                    "ms",
                    0
                ),
                option<unsigned int>(
                    {"heartbeat"},
                    "Milliseconds between heartbeats.",
                    "ms",
                    0
                ),
                option<std::string>(
                    {"heartbeat-payload"},
                    "Data sent with every heartbeat.",
                    "data",
                    ""
                ),
                option<std::string>(
                    {"send", "s"},
                    "Data sent once the connection is established.",
                    "data",
                    ""
                )
            ),
            arguments(
                required<std::string>("network"),
                required<std::string>("address")
            ),
            $connect
        );
    }
}
