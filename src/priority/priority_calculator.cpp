#include <opd/priority/priority_calculator.hpp>

#include <algorithm>

namespace opd {
namespace priority {

namespace {

constexpr int kSeniorAge = 65;
constexpr int kChildAge = 12;
constexpr int kSeniorBonus = 50;
constexpr int kChildBonus = 30;
constexpr int kCriticalConditionBonus = 100;
constexpr int kChronicConditionBonus = 40;
constexpr int kCriticalUrgencyBonus = 150;
constexpr int kHighUrgencyBonus = 75;
constexpr int kContinuityBonus = 25;
constexpr int kWaitingMinutesPerPoint = 5;
constexpr int kMaxWaitingBonus = 100;
constexpr int kPregnancyBonus = 75;
constexpr int kDisabilityBonus = 50;

} // namespace

PriorityScore PriorityCalculator::calculate(TokenSource source, const PatientInfo& patient,
                                            int waiting_time_minutes,
                                            const std::string& target_doctor_id) const {
    PriorityScore score;
    score.base_priority = config_.base_for(source);

    auto add = [&](const char *factor, int points) {
        score.breakdown.push_back({factor, points});
    };

    if (patient.age) {
        if (*patient.age >= kSeniorAge)
            add("age_senior", kSeniorBonus);
        else if (*patient.age <= kChildAge)
            add("age_child", kChildBonus);
    }

    if (patient.critical)
        add("medical_critical", kCriticalConditionBonus);
    if (patient.chronic)
        add("medical_chronic", kChronicConditionBonus);

    // Emergency urgency from an insertion request scores as critical.
    if (patient.urgency == UrgencyLevel::Critical || patient.urgency == UrgencyLevel::Emergency)
        add("urgency_critical", kCriticalUrgencyBonus);
    else if (patient.urgency == UrgencyLevel::High)
        add("urgency_high", kHighUrgencyBonus);

    bool followup = source == TokenSource::Followup || patient.is_followup;
    if (followup && !target_doctor_id.empty() &&
        patient.last_visited_doctor == target_doctor_id) {
        add("followup_continuity", kContinuityBonus);
    }

    int waiting = std::max(0, waiting_time_minutes);
    int waiting_bonus = std::min(kMaxWaitingBonus, waiting / kWaitingMinutesPerPoint);
    if (waiting_bonus > 0)
        add("waiting_time", waiting_bonus);

    if (patient.pregnancy)
        add("pregnancy", kPregnancyBonus);
    if (patient.disability)
        add("disability", kDisabilityBonus);

    int total = score.base_priority;
    for (const auto& adjustment : score.breakdown)
        total += adjustment.points;

    score.final_priority = std::clamp(total, kMinPriority, kMaxPriority);
    score.level = level_for(score.final_priority);
    return score;
}

std::variant<PriorityScore, ErrorInfo>
PriorityCalculator::calculate(std::string_view source, const PatientInfo& patient,
                              int waiting_time_minutes,
                              const std::string& target_doctor_id) const {
    auto parsed = parse_token_source(source);
    if (!parsed) {
        return ErrorInfo::make(ErrorCode::ValidationError,
                               "Unknown token source '" + std::string(source) + "'",
                               {{"source", std::string(source)}},
                               {"Use one of: online, walkin, priority, followup, emergency"});
    }
    return calculate(*parsed, patient, waiting_time_minutes, target_doctor_id);
}

PriorityLevel PriorityCalculator::level_for(int priority) {
    if (priority >= 1000)
        return PriorityLevel::Emergency;
    if (priority >= 700)
        return PriorityLevel::High;
    if (priority >= 400)
        return PriorityLevel::Medium;
    return PriorityLevel::Low;
}

} // namespace priority
} // namespace opd
