#include <rpcdial/except.hpp>
#include <rpcdial/memory.hpp>

#include <algorithm>
#include <cerrno>
#include <ext/except.h>
#include <timber/timber>

namespace rpcdial {
    auto memory_connection::pair(std::string_view address) -> std::pair<
        std::unique_ptr<memory_connection>,
        std::unique_ptr<memory_connection>
    > {
        auto upstream = std::make_shared<detail::memory_pipe>();
        auto downstream = std::make_shared<detail::memory_pipe>();

        return {
            std::make_unique<memory_connection>(
                address,
                "client",
                downstream,
                upstream
            ),
            std::make_unique<memory_connection>(
                address,
                "server",
                upstream,
                downstream
            )
        };
    }

    memory_connection::memory_connection(
        std::string_view address,
        std::string_view side,
        std::shared_ptr<detail::memory_pipe> in,
        std::shared_ptr<detail::memory_pipe> out
    ) :
        address(address),
        side(side),
        in(std::move(in)),
        out(std::move(out)),
        timeout([in = this->in] {
            if (in->readable.listening()) in->readable.cancel();
        })
    {}

    memory_connection::~memory_connection() { close(); }

    auto memory_connection::check() const -> void {
        if (is_closed) throw closed_error();
        if (timeout.expired()) throw timeout_error();
    }

    auto memory_connection::close() noexcept -> void {
        if (is_closed) return;

        TIMBER_DEBUG("{} closing", description());

        is_closed = true;
        timeout.clear();

        out->writer_closed = true;
        if (out->readable.listening()) out->readable.emit();

        in->reader_closed = true;
        if (in->readable.listening()) in->readable.cancel();
    }

    auto memory_connection::closed() const noexcept -> bool {
        return is_closed;
    }

    auto memory_connection::description() const -> std::string {
        return fmt::format("memory connection ({} {})", side, address);
    }

    auto memory_connection::read(
        void* dest,
        std::size_t len
    ) -> ext::task<std::size_t> {
        if (len == 0) co_return 0;

        while (true) {
            check();

            if (!in->data.empty()) {
                const auto bytes = std::min(len, in->data.size());
                const auto end = in->data.begin() + bytes;

                std::copy(in->data.begin(), end, static_cast<std::byte*>(dest));
                in->data.erase(in->data.begin(), end);

                co_return bytes;
            }

            if (in->writer_closed) co_return 0;

            auto canceled = false;

            try {
                co_await in->readable.listen();
            }
            catch (const task_canceled&) {
                canceled = true;
            }

            if (canceled) {
                check();
                throw task_canceled();
            }
        }
    }

    auto memory_connection::set_deadline(clock::time_point time) -> void {
        if (is_closed) throw closed_error();
        timeout.set(time);
    }

    auto memory_connection::write(
        const void* src,
        std::size_t len
    ) -> ext::task<std::size_t> {
        check();

        if (out->reader_closed) {
            errno = EPIPE;
            throw ext::system_error("failed to send data");
        }

        const auto* bytes = static_cast<const std::byte*>(src);
        out->data.insert(out->data.end(), bytes, bytes + len);

        if (out->readable.listening()) out->readable.emit();

        co_return len;
    }

    memory_listener::memory_listener(
        std::shared_ptr<detail::memory_endpoint> endpoint
    ) :
        endpoint(std::move(endpoint))
    {}

    memory_listener::~memory_listener() { close(); }

    auto memory_listener::accept() -> ext::task<std::unique_ptr<connection>> {
        if (!endpoint) throw closed_error();

        while (endpoint->backlog.empty()) {
            if (endpoint->closed) throw closed_error();

            auto canceled = false;

            try {
                co_await endpoint->arrivals.listen();
            }
            catch (const task_canceled&) {
                canceled = true;
            }

            if (canceled) {
                if (endpoint->closed) throw closed_error();
                throw task_canceled();
            }
        }

        auto conn = std::move(endpoint->backlog.front());
        endpoint->backlog.pop_front();

        co_return conn;
    }

    auto memory_listener::address() const noexcept -> std::string_view {
        if (!endpoint) return {};
        return endpoint->address;
    }

    auto memory_listener::close() noexcept -> void {
        if (!endpoint || endpoint->closed) return;

        TIMBER_DEBUG("memory listener ({}) closing", endpoint->address);

        endpoint->closed = true;
        endpoint->backlog.clear();

        if (endpoint->arrivals.listening()) endpoint->arrivals.cancel();
    }

    auto memory_listener::listening() const noexcept -> bool {
        return endpoint && !endpoint->closed;
    }

    auto memory_network::dial(
        std::string_view address
    ) -> std::unique_ptr<connection> {
        const auto key = std::string(address);
        const auto it = endpoints.find(key);

        if (it == endpoints.end() || it->second->closed) {
            if (it != endpoints.end()) endpoints.erase(it);

            errno = ECONNREFUSED;
            throw dial_error(
                "memu",
                address,
                std::make_exception_ptr(ext::system_error("failed to connect"))
            );
        }

        auto& endpoint = *it->second;
        auto [client, server] = memory_connection::pair(address);

        endpoint.backlog.push_back(std::move(server));
        if (endpoint.arrivals.listening()) endpoint.arrivals.emit();

        TIMBER_DEBUG("{} established", client->description());

        return client;
    }

    auto memory_network::listen(std::string_view address) -> memory_listener {
        const auto key = std::string(address);
        const auto it = endpoints.find(key);

        if (it != endpoints.end() && !it->second->closed) {
            throw invalid_argument(fmt::format(
                "address already in use: {}",
                address
            ));
        }

        auto endpoint = std::make_shared<detail::memory_endpoint>();
        endpoint->address = key;

        endpoints.insert_or_assign(key, endpoint);

        TIMBER_DEBUG("memory listener ({}) listening", key);

        return memory_listener(std::move(endpoint));
    }
}
