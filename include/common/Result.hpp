#pragma once
#include <variant>
#include <string>
#include <stdexcept>

namespace common {

    struct Ok {};

    enum class ErrorCode {
        Success = 0,
        Cancelled,           // Interrupt requested (SIGINT/SIGTERM)
        ConfigError,         // Unknown method or malformed setting, nothing started yet
        NegotiationError,    // A portal handshake step failed
        NoSource,            // Portal returned zero streams
        StartupTimeout,      // Readiness artifact never appeared
        NodeNotFound,        // Stream registry never showed the expected node
        ProcessSpawnError,   // Auxiliary or pipeline process failed to launch
        Timeout,             // Bounded poll exhausted (generic)
        ExternalToolMissing, // Missing dependency (e.g. weston, pw-dump)
        DeviceNotFound,      // Display / uinput not reachable
        Unknown
    };

    inline const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::Success:             return "Success";
            case ErrorCode::Cancelled:           return "Cancelled";
            case ErrorCode::ConfigError:         return "ConfigError";
            case ErrorCode::NegotiationError:    return "NegotiationError";
            case ErrorCode::NoSource:            return "NoSourceError";
            case ErrorCode::StartupTimeout:      return "StartupTimeout";
            case ErrorCode::NodeNotFound:        return "NodeNotFound";
            case ErrorCode::ProcessSpawnError:   return "ProcessSpawnError";
            case ErrorCode::Timeout:             return "TimeoutError";
            case ErrorCode::ExternalToolMissing: return "ExternalToolMissing";
            case ErrorCode::DeviceNotFound:      return "DeviceNotFound";
            case ErrorCode::Unknown:             break;
        }
        return "Unknown";
    }

    struct AppError {
        ErrorCode code;
        std::string message;
        std::string location; // __FILE__:__LINE__
    };

    template <typename T = Ok>
    class Result {
        std::variant<T, AppError> value;

    public:
        // Constructors
        Result(T v) : value(std::move(v)) {}
        Result(AppError e) : value(std::move(e)) {}

        // Static Builders
        static Result<T> ok(T v) { return Result(std::move(v)); }

        static Result<T> err(ErrorCode code, const std::string& msg, const std::string& loc = "") {
            return Result(AppError{code, msg, loc});
        }

        // Checkers
        bool is_ok() const { return std::holds_alternative<T>(value); }
        bool is_err() const { return std::holds_alternative<AppError>(value); }

        // Unwrappers
        const T& unwrap() const {
            if (is_err()) {
                const auto& e = std::get<AppError>(value);
                throw std::runtime_error("Result::unwrap failed: " + e.message);
            }
            return std::get<T>(value);
        }

        const AppError& error() const {
            if (is_ok()) {
                throw std::logic_error("Result::error called on success value");
            }
            return std::get<AppError>(value);
        }

        // For void-like results (Result<Ok>)
        static Result<Ok> success() { return Result<Ok>(Ok{}); }
    };

    using EmptyResult = Result<Ok>;

} // namespace common
