#include <opd/core/types.hpp>

#include <array>
#include <utility>

namespace opd {

namespace {

template <typename E, size_t N>
std::optional<E> lookup(const std::array<std::pair<std::string_view, E>, N> &table,
                        std::string_view text) {
    for (const auto& [name, value] : table) {
        if (name == text)
            return value;
    }
    return std::nullopt;
}

constexpr std::array<std::pair<std::string_view, TokenSource>, 6> kSources{{
    {"online", TokenSource::Online},
    {"walkin", TokenSource::Walkin},
    {"priority", TokenSource::Priority},
    {"priority_patient", TokenSource::Priority},
    {"followup", TokenSource::Followup},
    {"emergency", TokenSource::Emergency},
}};

constexpr std::array<std::pair<std::string_view, TokenStatus>, 6> kTokenStatuses{{
    {"allocated", TokenStatus::Allocated},
    {"confirmed", TokenStatus::Confirmed},
    {"in_consultation", TokenStatus::InConsultation},
    {"completed", TokenStatus::Completed},
    {"cancelled", TokenStatus::Cancelled},
    {"noshow", TokenStatus::NoShow},
}};

constexpr std::array<std::pair<std::string_view, SlotStatus>, 4> kSlotStatuses{{
    {"active", SlotStatus::Active},
    {"suspended", SlotStatus::Suspended},
    {"completed", SlotStatus::Completed},
    {"cancelled", SlotStatus::Cancelled},
}};

constexpr std::array<std::pair<std::string_view, UrgencyLevel>, 6> kUrgencies{{
    {"normal", UrgencyLevel::Normal},
    {"low", UrgencyLevel::Normal},
    {"medium", UrgencyLevel::Normal},
    {"high", UrgencyLevel::High},
    {"critical", UrgencyLevel::Critical},
    {"emergency", UrgencyLevel::Emergency},
}};

constexpr std::array<std::pair<std::string_view, AllocationMethod>, 3> kMethods{{
    {"direct", AllocationMethod::Direct},
    {"preemption", AllocationMethod::Preemption},
    {"reallocation", AllocationMethod::Reallocation},
}};

constexpr std::array<std::pair<std::string_view, ReallocationStatus>, 3> kReallocations{{
    {"none", ReallocationStatus::None},
    {"pending", ReallocationStatus::Pending},
    {"reallocated", ReallocationStatus::Reallocated},
}};

constexpr std::array<std::pair<std::string_view, CancellationReason>, 7> kReasons{{
    {"patient_request", CancellationReason::PatientRequest},
    {"doctor_unavailable", CancellationReason::DoctorUnavailable},
    {"emergency", CancellationReason::Emergency},
    {"system_error", CancellationReason::SystemError},
    {"other", CancellationReason::Other},
    {"preempted", CancellationReason::Preempted},
    {"moved", CancellationReason::Moved},
}};

} // namespace

const char *to_string(TokenSource source) {
    switch (source) {
    case TokenSource::Online:
        return "online";
    case TokenSource::Walkin:
        return "walkin";
    case TokenSource::Priority:
        return "priority";
    case TokenSource::Followup:
        return "followup";
    case TokenSource::Emergency:
        return "emergency";
    }
    return "unknown";
}

const char *to_string(TokenStatus status) {
    switch (status) {
    case TokenStatus::Allocated:
        return "allocated";
    case TokenStatus::Confirmed:
        return "confirmed";
    case TokenStatus::InConsultation:
        return "in_consultation";
    case TokenStatus::Completed:
        return "completed";
    case TokenStatus::Cancelled:
        return "cancelled";
    case TokenStatus::NoShow:
        return "noshow";
    }
    return "unknown";
}

const char *to_string(SlotStatus status) {
    switch (status) {
    case SlotStatus::Active:
        return "active";
    case SlotStatus::Suspended:
        return "suspended";
    case SlotStatus::Completed:
        return "completed";
    case SlotStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char *to_string(PriorityLevel level) {
    switch (level) {
    case PriorityLevel::Low:
        return "low";
    case PriorityLevel::Medium:
        return "medium";
    case PriorityLevel::High:
        return "high";
    case PriorityLevel::Emergency:
        return "emergency";
    }
    return "unknown";
}

const char *to_string(UrgencyLevel level) {
    switch (level) {
    case UrgencyLevel::Normal:
        return "normal";
    case UrgencyLevel::High:
        return "high";
    case UrgencyLevel::Critical:
        return "critical";
    case UrgencyLevel::Emergency:
        return "emergency";
    }
    return "unknown";
}

const char *to_string(AllocationMethod method) {
    switch (method) {
    case AllocationMethod::Direct:
        return "direct";
    case AllocationMethod::Preemption:
        return "preemption";
    case AllocationMethod::Reallocation:
        return "reallocation";
    }
    return "unknown";
}

const char *to_string(ReallocationStatus status) {
    switch (status) {
    case ReallocationStatus::None:
        return "none";
    case ReallocationStatus::Pending:
        return "pending";
    case ReallocationStatus::Reallocated:
        return "reallocated";
    }
    return "unknown";
}

const char *to_string(CancellationReason reason) {
    switch (reason) {
    case CancellationReason::PatientRequest:
        return "patient_request";
    case CancellationReason::DoctorUnavailable:
        return "doctor_unavailable";
    case CancellationReason::Emergency:
        return "emergency";
    case CancellationReason::SystemError:
        return "system_error";
    case CancellationReason::Other:
        return "other";
    case CancellationReason::Preempted:
        return "preempted";
    case CancellationReason::Moved:
        return "moved";
    }
    return "unknown";
}

std::optional<TokenSource> parse_token_source(std::string_view text) {
    return lookup(kSources, text);
}

std::optional<TokenStatus> parse_token_status(std::string_view text) {
    return lookup(kTokenStatuses, text);
}

std::optional<SlotStatus> parse_slot_status(std::string_view text) {
    return lookup(kSlotStatuses, text);
}

std::optional<UrgencyLevel> parse_urgency_level(std::string_view text) {
    return lookup(kUrgencies, text);
}

std::optional<AllocationMethod> parse_allocation_method(std::string_view text) {
    return lookup(kMethods, text);
}

std::optional<ReallocationStatus> parse_reallocation_status(std::string_view text) {
    return lookup(kReallocations, text);
}

std::optional<CancellationReason> parse_cancellation_reason(std::string_view text) {
    return lookup(kReasons, text);
}

} // namespace opd
