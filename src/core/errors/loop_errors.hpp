#pragma once
#include <string>
#include <variant>

namespace autoloop::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., an unknown CLI flag or a bad --limit value
        Execution,  // E.g., a tool or shell command failed
        Provider,   // E.g., the decision provider could not produce a decision
        Policy,     // E.g., a path resolved outside the working directory
        Config,     // E.g., missing working directory or instruction path
        Internal    // E.g., pipe creation failed
    };

    // The standardized error payload
    struct LoopError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a LoopError.
    template <typename T>
    using Result = std::variant<T, LoopError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<LoopError>(result);
    }

    template <typename T>
    const LoopError& get_error(const Result<T>& result) {
        return std::get<LoopError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Provider: return "provider";
            case ErrorCategory::Policy: return "policy";
            case ErrorCategory::Config: return "config";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace autoloop::core::errors
