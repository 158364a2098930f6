#pragma once

#include <opd/allocation/token_issuer.hpp>
#include <opd/opd.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <variant>

namespace opd {
namespace test {

/// Monday 2026-03-02 08:00:00 UTC
constexpr int64_t kStartMs = 1772438400000;
constexpr const char *kToday = "2026-03-02";
constexpr const char *kTomorrow = "2026-03-03";
constexpr const char *kYesterday = "2026-03-01";

/**
 * @brief Base fixture: an in-memory engine on a manual clock
 *
 * Subclasses override make_config() to tune the snapshot every request
 * sees.
 */
class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_level(3);
        clock_ = std::make_shared<ManualClock>(kStartMs);
        config_view_ = std::make_shared<config::StaticConfigView>(make_config());

        service::TokenService::Options options;
        options.start_sweeper = false;
        options.worker_threads = 4;
        service_ = std::make_unique<service::TokenService>(options, clock_, config_view_);
    }

    void TearDown() override {
        service_.reset();
    }

    virtual config::ConfigSnapshot make_config() {
        return config::ConfigSnapshot{};
    }

    /**
     * @brief Create an active slot
     */
    Slot add_slot(const std::string& slot_id, const std::string& doctor_id, int max_capacity,
                  int emergency_reserved = 0, const std::string& date = kToday,
                  const std::string& start_time = "09:00", const std::string& end_time = "12:00",
                  const std::string& specialty = "cardiology") {
        capacity::SlotSpec spec;
        spec.slot_id = slot_id;
        spec.doctor_id = doctor_id;
        spec.date = date;
        spec.start_time = start_time;
        spec.end_time = end_time;
        spec.specialty = specialty;
        spec.max_capacity = max_capacity;
        spec.emergency_reserved = emergency_reserved;
        return service_->create_slot(spec);
    }

    /**
     * @brief Put a token with a fixed priority straight into a slot
     *
     * The clock moves one second per seeded token so creation times are
     * distinct.
     */
    Token seed_token(const std::string& slot_id, const std::string& patient_id,
                     TokenSource source, int priority) {
        clock_->advance(std::chrono::seconds(1));
        allocation::TokenIssuer issuer(service_->tokens(), service_->capacity(), *clock_);
        return service_->database().transaction([&]() {
            Slot slot = service_->slot(slot_id);
            Token draft;
            draft.patient_id = patient_id;
            draft.source = source;
            draft.priority = priority;
            return issuer.issue(draft, slot, true);
        });
    }

    AllocationRequest request_for(const std::string& patient_id, const std::string& slot_id,
                                  TokenSource source = TokenSource::Online, int age = 30) {
        AllocationRequest request;
        request.patient_id = patient_id;
        request.slot_id = slot_id;
        request.source = source;
        request.patient.age = age;
        request.actor_id = "test";
        return request;
    }

    static const Allocated& allocated(const Outcome& outcome) {
        EXPECT_TRUE(std::holds_alternative<Allocated>(outcome)) << describe(outcome);
        static const Allocated empty{};
        const auto *result = std::get_if<Allocated>(&outcome);
        return result ? *result : empty;
    }

    static std::string describe(const Outcome& outcome) {
        if (const auto *rejected = std::get_if<Rejected>(&outcome))
            return "Rejected: " + rejected->error.toString();
        if (const auto *alternatives = std::get_if<Alternatives>(&outcome))
            return "Alternatives: " + alternatives->recommended_action;
        return "Allocated";
    }

    void expect_invariants() {
        for (const auto& violation : service_->check_invariants())
            ADD_FAILURE() << violation.slot_id << ": " << violation.description;
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<config::StaticConfigView> config_view_;
    std::unique_ptr<service::TokenService> service_;
};

} // namespace test
} // namespace opd
