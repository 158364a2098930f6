#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace opd {

enum class ErrorCode : uint8_t {
    ValidationError = 0,
    SlotCapacityExceeded,
    SlotNotAvailable,
    SlotNotFound,
    TokenNotFound,
    TokenAlreadyProcessed,
    InvalidTokenStatus,
    SchedulingConflict,
    ConcurrentModification,
    OperationInProgress,
    MaxRetriesExceeded,
    ServiceUnavailable,
    InternalServerError
};

/**
 * @brief Recovery class of an error
 *
 * Concurrency errors are retried automatically, system errors are retried a
 * bounded number of times, validation and business errors surface at once.
 */
enum class ErrorCategory : uint8_t {
    Validation = 0,
    BusinessLogic = 1,
    Concurrency = 2,
    System = 3,
    External = 4
};

/**
 * @brief Wire name of an error code, e.g. "SLOT_CAPACITY_EXCEEDED"
 */
const char *to_string(ErrorCode code);
const char *to_string(ErrorCategory category);
ErrorCategory category_of(ErrorCode code);

/**
 * @brief Structured description of a failed operation
 */
struct ErrorInfo {
    ErrorCode code = ErrorCode::InternalServerError;
    ErrorCategory category = ErrorCategory::System;
    std::string message;
    std::map<std::string, std::string> details;
    std::vector<std::string> suggestions;

    static ErrorInfo make(ErrorCode code, std::string message,
                          std::map<std::string, std::string> details = {},
                          std::vector<std::string> suggestions = {});

    std::string toString() const;
};

/**
 * @brief Exception carrying an ErrorInfo
 *
 * Thrown by lifecycle operations and by engine internals. The allocator
 * converts it into a Rejected outcome.
 */
class Error : public std::runtime_error {
public:
    explicit Error(ErrorInfo info);
    Error(ErrorCode code, const std::string& message,
          std::map<std::string, std::string> details = {},
          std::vector<std::string> suggestions = {});

    const ErrorInfo& info() const noexcept {
        return info_;
    }
    ErrorCode code() const noexcept {
        return info_.code;
    }
    ErrorCategory category() const noexcept {
        return info_.category;
    }

private:
    ErrorInfo info_;
};

} // namespace opd
