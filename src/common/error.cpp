#include "error.h"

namespace chartcalc {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kParseError:
        case ErrorCode::kUnbalancedParentheses:
        case ErrorCode::kUnknownFunction:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kFetchFailed:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kMalformedResponse:
            return absl::StatusCode::kInternal;
        case ErrorCode::kTimeout:
            return absl::StatusCode::kDeadlineExceeded;
    }
    return absl::StatusCode::kUnknown;
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), message);
}

}  // namespace chartcalc
