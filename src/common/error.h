#pragma once

/// @file error.h
/// @brief ReviewScope status helpers built on absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace reviewscope {

/// @brief Error categories raised by ReviewScope
///
/// Each category maps onto a canonical absl::StatusCode so callers can keep
/// switching on `status.code()`.
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kOutOfRange,
    kInternal,

    // ReviewScope-specific categories
    kConfigurationError,
    kParseError,
    kValidationError,
    kEmptyInput,
};

/// @brief Map a ReviewScope error category onto absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Human readable name of an error category
std::string_view ErrorCodeName(ErrorCode code);

/// @brief Build an error status, prefixing the message with the category name
absl::Status MakeError(ErrorCode code, std::string_view message);

inline absl::Status InvalidArgumentError(std::string_view message) {
    return absl::InvalidArgumentError(message);
}

inline absl::Status NotFoundError(std::string_view message) {
    return absl::NotFoundError(message);
}

/// @brief True if the status was produced by MakeError(kConfigurationError, ...)
bool IsConfigurationError(const absl::Status& status);

#define REVIEWSCOPE_RETURN_IF_ERROR(expr)                                      \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

#define REVIEWSCOPE_ASSIGN_OR_RETURN(lhs, rhs)                                 \
    REVIEWSCOPE_ASSIGN_OR_RETURN_IMPL(                                         \
        REVIEWSCOPE_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define REVIEWSCOPE_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                  \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define REVIEWSCOPE_CONCAT(a, b) REVIEWSCOPE_CONCAT_IMPL(a, b)
#define REVIEWSCOPE_CONCAT_IMPL(a, b) a##b

/// @brief Return `error_status` when `condition` does not hold
#define REVIEWSCOPE_CHECK_OR_RETURN(condition, error_status)                   \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace reviewscope
