#pragma once
#include <cstddef>
#include <string>

namespace feedlink {

    /**
     * @brief Represents an error that occurred while talking to an origin or
     * reading a stream source.
     *
     * Besides the code and message, an error carries enough context to
     * diagnose a terminal failure without retrying blindly.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,         /**< The provided URL is malformed or invalid. */
            InvalidArgument,    /**< Malformed input (e.g. batch indices). */
            ConnectionFailed,   /**< Failed to resolve or connect. */
            TlsHandshakeFailed, /**< Failed to perform TLS handshake. */
            Timeout,            /**< An attempt exceeded its deadline. */
            SendFailed,         /**< Failed to send the request. */
            ReceiveFailed,      /**< Failed to receive the response. */
            NetworkError,       /**< General network error. */
            HttpStatus,         /**< Non-2xx response, see status_code. */
            CircuitOpen,        /**< Breaker rejected without network I/O. */
            RetryExhausted,     /**< All attempts failed, see cause. */
            Parse,              /**< Body could not be decoded. */
            Io,                 /**< Streaming source read failure. */
            Unknown,            /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;

        /** @brief Origin the failing request targeted ("" if none). */
        std::string origin{};
        /** @brief Number of network attempts made (0 if none). */
        std::size_t attempts{0};
        /** @brief Last HTTP status observed (0 if none). */
        int status_code{0};
        /** @brief Code of the last underlying failure for RetryExhausted. */
        Code cause{Code::Unknown};

        /// @brief True for failures produced by the transport layer.
        [[nodiscard]] bool is_network() const noexcept {
            switch (code) {
                case Code::ConnectionFailed:
                case Code::TlsHandshakeFailed:
                case Code::SendFailed:
                case Code::ReceiveFailed:
                case Code::NetworkError:
                    return true;
                default:
                    return false;
            }
        }

        /// @brief One-line diagnostic used in logs.
        [[nodiscard]] std::string describe() const;
    };

    /// @brief Convert an error code to a stable name for logs and tests.
    inline const char* to_string(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::InvalidArgument:
                return "InvalidArgument";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::NetworkError:
                return "NetworkError";
            case Error::Code::HttpStatus:
                return "HttpStatus";
            case Error::Code::CircuitOpen:
                return "CircuitOpen";
            case Error::Code::RetryExhausted:
                return "RetryExhausted";
            case Error::Code::Parse:
                return "Parse";
            case Error::Code::Io:
                return "Io";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    inline std::string Error::describe() const {
        std::string out = to_string(code);
        if (!origin.empty()) {
            out += " origin=";
            out += origin;
        }
        if (attempts > 0) {
            out += " attempts=";
            out += std::to_string(attempts);
        }
        if (status_code != 0) {
            out += " status=";
            out += std::to_string(status_code);
        }
        if (code == Code::RetryExhausted) {
            out += " cause=";
            out += to_string(cause);
        }
        if (!message.empty()) {
            out += ": ";
            out += message;
        }
        return out;
    }

}  // namespace feedlink
