#include "error.h"

#include <absl/strings/match.h>

namespace reviewscope {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
        case ErrorCode::kParseError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
        case ErrorCode::kEmptyInput:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kOutOfRange:
            return absl::StatusCode::kOutOfRange;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "ok";
        case ErrorCode::kInvalidArgument: return "invalid argument";
        case ErrorCode::kNotFound: return "not found";
        case ErrorCode::kFailedPrecondition: return "failed precondition";
        case ErrorCode::kOutOfRange: return "out of range";
        case ErrorCode::kInternal: return "internal";
        case ErrorCode::kConfigurationError: return "configuration error";
        case ErrorCode::kParseError: return "parse error";
        case ErrorCode::kValidationError: return "validation error";
        case ErrorCode::kEmptyInput: return "empty input";
        case ErrorCode::kUnknown:
        default:
            return "unknown";
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    if (code == ErrorCode::kOk) {
        return absl::OkStatus();
    }
    return absl::Status(ToAbslCode(code),
                        absl::StrCat(ErrorCodeName(code), ": ", message));
}

bool IsConfigurationError(const absl::Status& status) {
    return status.code() == absl::StatusCode::kFailedPrecondition &&
           absl::StartsWith(status.message(),
                            ErrorCodeName(ErrorCode::kConfigurationError));
}

}  // namespace reviewscope
