#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rpcdial {
    struct eof : std::exception {
        auto what() const noexcept -> const char* override;
    };

    struct task_canceled : std::runtime_error {
        task_canceled();
    };

    /// An operation was attempted on a connection that was closed.
    struct closed_error : std::runtime_error {
        closed_error();
    };

    struct timeout_error : std::runtime_error {
        timeout_error();

        explicit timeout_error(std::string_view what);
    };

    struct invalid_argument : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct http_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct websocket_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /// Thrown by connection-created plugins to veto a new connection.
    struct plugin_rejection : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /// An error scoped to a network operation: the operation name, the
    /// network, an optional address and the error that caused it.
    class op_error : public std::runtime_error {
        std::string operation;
        std::string network;
        std::string addr;
        std::exception_ptr inner;
    public:
        op_error(
            std::string_view op,
            std::string_view net,
            std::string_view address,
            std::exception_ptr cause
        );

        auto address() const noexcept -> std::string_view;

        auto cause() const noexcept -> std::exception_ptr;

        auto net() const noexcept -> std::string_view;

        auto op() const noexcept -> std::string_view;
    };

    struct dial_error : op_error {
        dial_error(
            std::string_view network,
            std::string_view address,
            std::exception_ptr cause
        );
    };

    /// The HTTP CONNECT exchange did not establish a tunnel.
    struct tunnel_error : op_error {
        tunnel_error(
            std::string_view network,
            std::string_view address,
            std::exception_ptr cause
        );
    };

    auto describe(std::exception_ptr ex) -> std::string;
}
