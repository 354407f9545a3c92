#include <rpcdial/buffered_reader.hpp>
#include <rpcdial/except.hpp>

#include <algorithm>
#include <cstring>

namespace rpcdial {
    buffered_reader::buffered_reader(
        connection& source,
        std::size_t capacity
    ) :
        source(&source),
        storage(std::max<std::size_t>(capacity, 1))
    {}

    auto buffered_reader::buffered() const noexcept -> std::size_t {
        return tail - head;
    }

    auto buffered_reader::capacity() const noexcept -> std::size_t {
        return storage.size();
    }

    auto buffered_reader::fill() -> ext::task<bool> {
        head = 0;
        tail = co_await source->read(storage.data(), storage.size());
        co_return tail > 0;
    }

    auto buffered_reader::read() -> ext::task<std::span<const std::byte>> {
        if (head == tail && !co_await fill()) co_return {};

        const auto result = std::span<const std::byte>(
            storage.data() + head,
            tail - head
        );

        head = tail;
        co_return result;
    }

    auto buffered_reader::read(void* dest, std::size_t len) -> ext::task<> {
        auto* out = static_cast<std::byte*>(dest);

        while (len > 0) {
            if (head == tail) {
                // Large reads bypass the buffer.
                if (len >= storage.size()) {
                    const auto n = co_await source->read(out, len);
                    if (n == 0) throw eof();

                    out += n;
                    len -= n;
                    continue;
                }

                if (!co_await fill()) throw eof();
            }

            const auto n = std::min(len, tail - head);
            std::memcpy(out, storage.data() + head, n);

            head += n;
            out += n;
            len -= n;
        }
    }
}
