#include <rpcdial/client.hpp>
#include <rpcdial/connector.hpp>
#include <rpcdial/except.hpp>
#include <rpcdial/mutex.hpp>
#include <rpcdial/timer.hpp>

#include <timber/timber>

using namespace std::chrono_literals;

namespace rpcdial {
    struct client::session {
        std::unique_ptr<rpcdial::connection> conn;
        buffered_reader reader;
        /// Serializes writers; counts completed writes.
        mutex<std::size_t> writer;
        timer ticker;
        bool reading = false;
        bool heartbeating = false;

        session(
            std::unique_ptr<rpcdial::connection>&& conn,
            std::size_t buffer_size
        ) :
            conn(std::move(conn)),
            reader(*this->conn, buffer_size)
        {}

        auto close() noexcept -> void {
            conn->close();

            if (!ticker.valid()) return;

            try {
                ticker.disarm();
            }
            catch (const std::exception& ex) {
                TIMBER_ERROR("failed to stop heartbeat: {}", ex.what());
            }
        }
    };

    client::client(
        connect_option options,
        std::shared_ptr<const transport_registry> registry,
        std::shared_ptr<protocol> proto,
        std::shared_ptr<plugin_chain> plugins
    ) :
        opts(std::move(options)),
        transports(registry ? std::move(registry) :
            std::make_shared<const transport_registry>(
                transport_registry::defaults()
            )),
        proto(proto ? std::move(proto) : std::make_shared<discard_protocol>()),
        chain(std::move(plugins))
    {}

    client::~client() { close(); }

    auto client::operator=(client&& other) -> client& {
        if (this == &other) return *this;

        close();

        opts = std::move(other.opts);
        transports = std::move(other.transports);
        proto = std::move(other.proto);
        chain = std::move(other.chain);
        current = std::move(other.current);

        return *this;
    }

    auto client::close() noexcept -> void {
        if (const auto s = std::exchange(current, nullptr)) s->close();
    }

    auto client::configure(rpcdial::connection& conn) const -> void {
        if (opts.tcp_keep_alive_period > 0s) {
            if (auto* const ka = dynamic_cast<keep_alive*>(&conn)) {
                // Keep-alive is an optimization: the connection is usable
                // without it.
                try {
                    ka->set_keep_alive(opts.tcp_keep_alive_period);
                }
                catch (const std::exception& ex) {
                    TIMBER_WARNING(
                        "{} failed to enable keep-alive: {}",
                        conn,
                        ex.what()
                    );
                }
            }
        }

        if (opts.idle_timeout != 0ms) {
            conn.set_deadline(clock::now() + opts.idle_timeout);
        }
    }

    auto client::connect(
        std::string_view network,
        std::string_view address
    ) -> ext::task<> {
        auto conn = co_await dial(network, address);

        try {
            configure(*conn);
            if (chain) co_await chain->connection_created(conn);
        }
        catch (const std::exception& ex) {
            TIMBER_DEBUG(
                "connection to {} {} rejected: {}",
                network,
                address,
                ex.what()
            );

            if (conn) conn->close();
            throw;
        }

        auto next = std::make_shared<session>(
            std::move(conn),
            opts.reader_buffer_size
        );

        if (opts.heartbeat && opts.heartbeat_interval > 0ms) {
            next->ticker = timer::monotonic();
        }

        const auto previous = std::exchange(current, next);
        if (previous) previous->close();

        TIMBER_DEBUG("{} connected to {} {}", *next->conn, network, address);

        read(next, proto);

        if (next->ticker.valid()) {
            heartbeat(next, proto, opts.heartbeat_interval);
        }
    }

    auto client::connected() const noexcept -> bool {
        return current && !current->conn->closed();
    }

    auto client::connection() const noexcept -> rpcdial::connection* {
        return current ? current->conn.get() : nullptr;
    }

    auto client::dial(
        std::string_view network,
        std::string_view address
    ) const -> ext::task<std::unique_ptr<rpcdial::connection>> {
        if (network == "http") {
            co_return co_await dial_http(this, network, address);
        }

        if (network == "ws" || network == "wss") {
            co_return co_await dial_websocket(this, network, address);
        }

        if (const auto* const connector = transports->find(network)) {
            auto conn = co_await (*connector)(this, network, address);

            if (!conn) {
                throw dial_error(network, address, std::make_exception_ptr(
                    invalid_argument("connector returned no connection")
                ));
            }

            co_return conn;
        }

        TIMBER_DEBUG(
            "no connector registered for '{}': dialing directly",
            network
        );

        co_return co_await dial_direct(this, network, address);
    }

    auto client::heartbeat(
        std::shared_ptr<session> s,
        std::shared_ptr<protocol> proto,
        std::chrono::milliseconds interval
    ) -> ext::detached_task {
        s->heartbeating = true;

        auto failed = false;

        try {
            s->ticker.arm(interval, interval);

            while (!s->conn->closed()) {
                if (co_await s->ticker.wait() == 0) break;

                const auto payload = proto->heartbeat();
                if (payload.empty()) continue;

                auto writes = co_await s->writer.lock();
                co_await write_all(*s->conn, payload);
                ++*writes;

                TIMBER_TRACE("{} heartbeat", *s->conn);
            }
        }
        catch (const std::exception& ex) {
            if (!s->conn->closed()) {
                TIMBER_ERROR("{} heartbeat failed: {}", *s->conn, ex.what());
                failed = true;
            }
        }

        s->heartbeating = false;
        if (failed) s->close();
    }

    auto client::heartbeating() const noexcept -> bool {
        return current && current->heartbeating;
    }

    auto client::options() const noexcept -> const connect_option& {
        return opts;
    }

    auto client::plugins() const noexcept -> plugin_chain* {
        return chain.get();
    }

    auto client::read(
        std::shared_ptr<session> s,
        std::shared_ptr<protocol> proto
    ) -> ext::detached_task {
        s->reading = true;

        try {
            co_await proto->input(s->reader);
            TIMBER_DEBUG("{} input finished", *s->conn);
        }
        catch (const eof&) {
            TIMBER_DEBUG("{} closed by peer", *s->conn);
        }
        catch (const std::exception& ex) {
            if (s->conn->closed()) {
                TIMBER_DEBUG("{} reader stopped: {}", *s->conn, ex.what());
            }
            else TIMBER_ERROR("{} read failed: {}", *s->conn, ex.what());
        }

        s->reading = false;
        s->close();
    }

    auto client::reading() const noexcept -> bool {
        return current && current->reading;
    }

    auto client::registry() const noexcept -> const transport_registry& {
        return *transports;
    }

    auto client::write(const void* src, std::size_t len) -> ext::task<> {
        const auto s = current;
        if (!s || s->conn->closed()) throw closed_error();

        auto writes = co_await s->writer.lock();
        co_await write_all(*s->conn, src, len);
        ++*writes;
    }

    auto client::write(std::string_view data) -> ext::task<> {
        return write(data.data(), data.size());
    }
}
