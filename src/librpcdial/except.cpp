#include <rpcdial/except.hpp>

#include <fmt/format.h>

namespace {
    auto format_op_error(
        std::string_view op,
        std::string_view net,
        std::string_view address,
        std::exception_ptr cause
    ) -> std::string {
        if (address.empty()) {
            return fmt::format("{} {}: {}", op, net, rpcdial::describe(cause));
        }

        return fmt::format(
            "{} {} {}: {}",
            op,
            net,
            address,
            rpcdial::describe(cause)
        );
    }
}

namespace rpcdial {
    auto eof::what() const noexcept -> const char* {
        return "Unexpected EOF";
    }

    task_canceled::task_canceled() : std::runtime_error("task canceled") {}

    closed_error::closed_error() :
        std::runtime_error("use of closed network connection") {}

    timeout_error::timeout_error() :
        std::runtime_error("i/o timeout") {}

    timeout_error::timeout_error(std::string_view what) :
        std::runtime_error(std::string(what)) {}

    op_error::op_error(
        std::string_view op,
        std::string_view net,
        std::string_view address,
        std::exception_ptr cause
    ) :
        std::runtime_error(format_op_error(op, net, address, cause)),
        operation(op),
        network(net),
        addr(address),
        inner(cause)
    {}

    auto op_error::address() const noexcept -> std::string_view {
        return addr;
    }

    auto op_error::cause() const noexcept -> std::exception_ptr {
        return inner;
    }

    auto op_error::net() const noexcept -> std::string_view {
        return network;
    }

    auto op_error::op() const noexcept -> std::string_view {
        return operation;
    }

    dial_error::dial_error(
        std::string_view network,
        std::string_view address,
        std::exception_ptr cause
    ) :
        op_error("dial", network, address, cause)
    {}

    tunnel_error::tunnel_error(
        std::string_view network,
        std::string_view address,
        std::exception_ptr cause
    ) :
        op_error("dial-http", fmt::format("{} {}", network, address), "", cause)
    {}

    auto describe(std::exception_ptr ex) -> std::string {
        if (!ex) return "no error";

        try {
            std::rethrow_exception(ex);
        }
        catch (const std::exception& e) {
            return e.what();
        }
        catch (...) {
            return "unknown error";
        }
    }
}
