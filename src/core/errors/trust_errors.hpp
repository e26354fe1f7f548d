#pragma once
#include <string>
#include <variant>

namespace cmdtrust::core::errors {

    enum class ErrorCategory {
        Input,         // Bad CLI flag or malformed protocol request
        Safety,        // Command matched a destructive pattern
        Validation,    // Command does not look like the declared intent
        Verification,  // Dry run misbehaved (output, mutation, duration)
        Execution,     // Process-level failure: pipe, fork, missing binary
        Storage,       // Ledger or audit log could not be read or written
        Internal       // Logic bug or unexpected state
    };

    struct TrustError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a value of type T or a TrustError.
    template <typename T>
    using Result = std::variant<T, TrustError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<TrustError>(result);
    }

    template <typename T>
    const TrustError& get_error(const Result<T>& result) {
        return std::get<TrustError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:        return "input";
            case ErrorCategory::Safety:       return "safety";
            case ErrorCategory::Validation:   return "validation";
            case ErrorCategory::Verification: return "verification";
            case ErrorCategory::Execution:    return "execution";
            case ErrorCategory::Storage:      return "storage";
            case ErrorCategory::Internal:     return "internal";
            default: return "unknown";
        }
    }

} // namespace cmdtrust::core::errors
