#pragma once

/// @file error.h
/// @brief chartcalc status helpers built on absl::Status

#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace chartcalc {

/// @brief Error categories raised at chartcalc API boundaries
///
/// Formula evaluation itself never fails (it yields NA); these codes cover
/// parsing for validation, configuration and metadata fetches.
enum class ErrorCode {
    kOk = 0,

    // Formula errors
    kParseError,
    kUnbalancedParentheses,
    kUnknownFunction,

    // Metadata source errors
    kFetchFailed,
    kMalformedResponse,
    kTimeout,

    kConfigurationError,
};

/// @brief Map a chartcalc error code onto the canonical absl code
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Build a status from a chartcalc error code
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Parse failure in a formula or arithmetic expression
inline absl::Status ParseError(std::string_view message) {
    return MakeError(ErrorCode::kParseError, message);
}

/// @brief Configuration could not be loaded or is inconsistent
inline absl::Status ConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

/// @brief The metadata API could not be reached or refused the request
inline absl::Status FetchFailedError(std::string_view message) {
    return MakeError(ErrorCode::kFetchFailed, message);
}

/// @brief A metadata request ran past its connection timeout
inline absl::Status TimeoutError(std::string_view message) {
    return MakeError(ErrorCode::kTimeout, message);
}

/// @brief A metadata endpoint answered with something we cannot use
inline absl::Status MalformedResponseError(std::string_view message) {
    return MakeError(ErrorCode::kMalformedResponse, message);
}

#define CHARTCALC_RETURN_IF_ERROR(expr)                                        \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

#define CHARTCALC_ASSIGN_OR_RETURN(lhs, rhs)                                   \
    CHARTCALC_ASSIGN_OR_RETURN_IMPL(                                           \
        CHARTCALC_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define CHARTCALC_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                    \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define CHARTCALC_CONCAT(a, b) CHARTCALC_CONCAT_IMPL(a, b)
#define CHARTCALC_CONCAT_IMPL(a, b) a##b

}  // namespace chartcalc
