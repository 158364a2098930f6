#include <opd/core/error.hpp>

#include <sstream>
#include <utility>

namespace opd {

const char *to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::ValidationError:
        return "VALIDATION_ERROR";
    case ErrorCode::SlotCapacityExceeded:
        return "SLOT_CAPACITY_EXCEEDED";
    case ErrorCode::SlotNotAvailable:
        return "SLOT_NOT_AVAILABLE";
    case ErrorCode::SlotNotFound:
        return "SLOT_NOT_FOUND";
    case ErrorCode::TokenNotFound:
        return "TOKEN_NOT_FOUND";
    case ErrorCode::TokenAlreadyProcessed:
        return "TOKEN_ALREADY_PROCESSED";
    case ErrorCode::InvalidTokenStatus:
        return "INVALID_TOKEN_STATUS";
    case ErrorCode::SchedulingConflict:
        return "SCHEDULING_CONFLICT";
    case ErrorCode::ConcurrentModification:
        return "CONCURRENT_MODIFICATION";
    case ErrorCode::OperationInProgress:
        return "OPERATION_IN_PROGRESS";
    case ErrorCode::MaxRetriesExceeded:
        return "MAX_RETRIES_EXCEEDED";
    case ErrorCode::ServiceUnavailable:
        return "SERVICE_UNAVAILABLE";
    case ErrorCode::InternalServerError:
        return "INTERNAL_SERVER_ERROR";
    }
    return "INTERNAL_SERVER_ERROR";
}

const char *to_string(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::Validation:
        return "VALIDATION";
    case ErrorCategory::BusinessLogic:
        return "BUSINESS_LOGIC";
    case ErrorCategory::Concurrency:
        return "CONCURRENCY";
    case ErrorCategory::System:
        return "SYSTEM";
    case ErrorCategory::External:
        return "EXTERNAL";
    }
    return "SYSTEM";
}

ErrorCategory category_of(ErrorCode code) {
    switch (code) {
    case ErrorCode::ValidationError:
        return ErrorCategory::Validation;
    case ErrorCode::SlotCapacityExceeded:
    case ErrorCode::SlotNotAvailable:
    case ErrorCode::SlotNotFound:
    case ErrorCode::TokenNotFound:
    case ErrorCode::TokenAlreadyProcessed:
    case ErrorCode::InvalidTokenStatus:
    case ErrorCode::SchedulingConflict:
        return ErrorCategory::BusinessLogic;
    case ErrorCode::ConcurrentModification:
    case ErrorCode::OperationInProgress:
        return ErrorCategory::Concurrency;
    case ErrorCode::MaxRetriesExceeded:
    case ErrorCode::ServiceUnavailable:
    case ErrorCode::InternalServerError:
        return ErrorCategory::System;
    }
    return ErrorCategory::System;
}

ErrorInfo ErrorInfo::make(ErrorCode code, std::string message,
                          std::map<std::string, std::string> details,
                          std::vector<std::string> suggestions) {
    ErrorInfo info;
    info.code = code;
    info.category = category_of(code);
    info.message = std::move(message);
    info.details = std::move(details);
    info.suggestions = std::move(suggestions);
    return info;
}

std::string ErrorInfo::toString() const {
    std::ostringstream oss;
    oss << to_string(code) << " (" << to_string(category) << "): " << message;
    if (!details.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : details) {
            if (!first)
                oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }
    return oss.str();
}

Error::Error(ErrorInfo info)
    : std::runtime_error(info.message), info_(std::move(info)) {}

Error::Error(ErrorCode code, const std::string& message,
             std::map<std::string, std::string> details,
             std::vector<std::string> suggestions)
    : std::runtime_error(message),
      info_(ErrorInfo::make(code, message, std::move(details), std::move(suggestions))) {}

} // namespace opd
