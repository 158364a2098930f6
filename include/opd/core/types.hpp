#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace opd {

/**
 * @brief Channel through which an appointment request arrived
 */
enum class TokenSource : uint8_t {
    Online = 0,
    Walkin = 1,
    Priority = 2,
    Followup = 3,
    Emergency = 4
};

/**
 * @brief Token lifecycle states
 *
 * Allocated, Confirmed and InConsultation occupy slot capacity. Completed,
 * Cancelled and NoShow are terminal.
 */
enum class TokenStatus : uint8_t {
    Allocated = 0,
    Confirmed = 1,
    InConsultation = 2,
    Completed = 3,
    Cancelled = 4,
    NoShow = 5
};

enum class SlotStatus : uint8_t {
    Active = 0,
    Suspended = 1,
    Completed = 2,
    Cancelled = 3
};

/**
 * @brief Coarse band derived from a final priority score
 */
enum class PriorityLevel : uint8_t {
    Low = 0,       ///< below 400
    Medium = 1,    ///< 400 and above
    High = 2,      ///< 700 and above
    Emergency = 3  ///< 1000 and above
};

enum class UrgencyLevel : uint8_t {
    Normal = 0,
    High = 1,
    Critical = 2,
    Emergency = 3
};

enum class AllocationMethod : uint8_t {
    Direct = 0,
    Preemption = 1,
    Reallocation = 2
};

/**
 * @brief Progress of relocating a displaced token
 */
enum class ReallocationStatus : uint8_t {
    None = 0,
    Pending = 1,
    Reallocated = 2
};

enum class CancellationReason : uint8_t {
    PatientRequest = 0,
    DoctorUnavailable = 1,
    Emergency = 2,
    SystemError = 3,
    Other = 4,
    Preempted = 5,
    Moved = 6
};

const char *to_string(TokenSource source);
const char *to_string(TokenStatus status);
const char *to_string(SlotStatus status);
const char *to_string(PriorityLevel level);
const char *to_string(UrgencyLevel level);
const char *to_string(AllocationMethod method);
const char *to_string(ReallocationStatus status);
const char *to_string(CancellationReason reason);

std::optional<TokenSource> parse_token_source(std::string_view text);
std::optional<TokenStatus> parse_token_status(std::string_view text);
std::optional<SlotStatus> parse_slot_status(std::string_view text);
std::optional<UrgencyLevel> parse_urgency_level(std::string_view text);
std::optional<AllocationMethod> parse_allocation_method(std::string_view text);
std::optional<ReallocationStatus> parse_reallocation_status(std::string_view text);
std::optional<CancellationReason> parse_cancellation_reason(std::string_view text);

/**
 * @brief True when a token in this state occupies one unit of slot capacity
 */
constexpr bool is_counted(TokenStatus status) noexcept {
    return status == TokenStatus::Allocated || status == TokenStatus::Confirmed ||
           status == TokenStatus::InConsultation;
}

constexpr bool is_terminal(TokenStatus status) noexcept {
    return status == TokenStatus::Completed || status == TokenStatus::Cancelled ||
           status == TokenStatus::NoShow;
}

constexpr bool is_terminal(SlotStatus status) noexcept {
    return status == SlotStatus::Completed || status == SlotStatus::Cancelled;
}

/**
 * @brief Only tokens that have not yet reached the consultation room may be
 * displaced by a higher priority arrival
 */
constexpr bool is_preemptable(TokenStatus status) noexcept {
    return status == TokenStatus::Allocated || status == TokenStatus::Confirmed;
}

} // namespace opd
