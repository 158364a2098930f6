#pragma once

#include <opd/config/config.hpp>
#include <opd/core/error.hpp>
#include <opd/core/request.hpp>
#include <opd/core/types.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace opd {
namespace priority {

constexpr int kMinPriority = 0;
constexpr int kMaxPriority = 2000;

/**
 * @brief One contribution to a final score
 */
struct PriorityAdjustment {
    std::string factor;  ///< e.g. "age_senior", "urgency_critical"
    int points = 0;
};

struct PriorityScore {
    int base_priority = 0;
    int final_priority = 0;
    PriorityLevel level = PriorityLevel::Low;
    std::vector<PriorityAdjustment> breakdown;
};

/**
 * @brief Maps (source, patient attributes, waiting time, target doctor) to
 * a score in [0, 2000]
 *
 * Pure: the result depends only on the arguments and the PriorityConfig the
 * calculator was built with.
 */
class PriorityCalculator {
public:
    explicit PriorityCalculator(const config::PriorityConfig& config) : config_(config) {}

    PriorityScore calculate(TokenSource source, const PatientInfo& patient,
                            int waiting_time_minutes,
                            const std::string& target_doctor_id = {}) const;

    /**
     * @brief Same as above for a source given by name
     *
     * @return the score, or a VALIDATION_ERROR when the source is unknown
     */
    std::variant<PriorityScore, ErrorInfo>
    calculate(std::string_view source, const PatientInfo& patient, int waiting_time_minutes,
              const std::string& target_doctor_id = {}) const;

    static PriorityLevel level_for(int priority);

private:
    config::PriorityConfig config_;
};

} // namespace priority
} // namespace opd
