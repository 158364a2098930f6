#include <opd/config/config.hpp>
#include <opd/config/config_store.hpp>
#include <opd/core/clock.hpp>
#include <opd/core/error.hpp>
#include <opd/store/database.hpp>
#include <opd/store/schema.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>

using namespace opd;
using namespace opd::config;

TEST(ConfigSnapshotTest, Defaults) {
    ConfigSnapshot snapshot;
    EXPECT_EQ(snapshot.priority.emergency, 1000);
    EXPECT_EQ(snapshot.priority.priority_patient, 800);
    EXPECT_EQ(snapshot.priority.followup, 600);
    EXPECT_EQ(snapshot.priority.online_booking, 400);
    EXPECT_EQ(snapshot.priority.walkin, 200);
    EXPECT_EQ(snapshot.priority.preemption_threshold, 200);
    EXPECT_EQ(snapshot.capacity.default_slot_capacity, 10);
    EXPECT_EQ(snapshot.capacity.emergency_reserve_percentage, 20);
    EXPECT_EQ(snapshot.timing.default_consultation_minutes, 15);
    EXPECT_EQ(snapshot.timing.buffer_minutes, 5);
    EXPECT_EQ(snapshot.timing.reallocation_window_hours, 4);
    EXPECT_EQ(snapshot.allocation.max_alternatives, 5u);
    EXPECT_EQ(snapshot.allocation.soft_deadline, std::chrono::seconds(30));
    EXPECT_EQ(snapshot.retry.max_retries, 1);
    EXPECT_EQ(snapshot.retry.base_delay, std::chrono::milliseconds(50));
    EXPECT_EQ(snapshot.retry.max_delay, std::chrono::milliseconds(200));
    ASSERT_EQ(snapshot.allocation.reallocation_order.size(), 3u);
    EXPECT_EQ(snapshot.allocation.reallocation_order[0], ReallocationTier::SameDoctorSameDay);
    EXPECT_EQ(snapshot.allocation.reallocation_order[1], ReallocationTier::SameSpecialtySameDay);
    EXPECT_EQ(snapshot.allocation.reallocation_order[2], ReallocationTier::SameDoctorNextDay);
}

TEST(ConfigSnapshotTest, ApplySettingValidatesRanges) {
    ConfigSnapshot snapshot;
    EXPECT_EQ(apply_setting(snapshot, "priority.preemption_threshold", "250"), "");
    EXPECT_EQ(snapshot.priority.preemption_threshold, 250);

    EXPECT_NE(apply_setting(snapshot, "priority.emergency", "2500"), "");
    EXPECT_EQ(snapshot.priority.emergency, 1000);

    EXPECT_NE(apply_setting(snapshot, "capacity.emergency_reserve_percentage", "60"), "");
    EXPECT_NE(apply_setting(snapshot, "timing.buffer_minutes", "abc"), "");
    EXPECT_NE(apply_setting(snapshot, "retry.max_retries", "1.5"), "");
    EXPECT_NE(apply_setting(snapshot, "priority.unknown", "1"), "");
    EXPECT_EQ(snapshot.timing.buffer_minutes, 5);

    EXPECT_EQ(apply_setting(snapshot, "retry.backoff_factor", "2.5"), "");
    EXPECT_DOUBLE_EQ(snapshot.retry.backoff_factor, 2.5);
}

TEST(ConfigSnapshotTest, ReallocationOrderSetting) {
    ConfigSnapshot snapshot;
    EXPECT_EQ(apply_setting(snapshot, "allocation.reallocation_order",
                            "same_doctor_next_day, same_doctor_same_day"),
              "");
    ASSERT_EQ(snapshot.allocation.reallocation_order.size(), 2u);
    EXPECT_EQ(snapshot.allocation.reallocation_order[0], ReallocationTier::SameDoctorNextDay);

    EXPECT_NE(apply_setting(snapshot, "allocation.reallocation_order", "somewhere_else"), "");
    EXPECT_EQ(snapshot.allocation.reallocation_order.size(), 2u);
}

TEST(ConfigSnapshotTest, Profiles) {
    ConfigSnapshot testing;
    apply_profile(testing, Profile::Testing);
    EXPECT_EQ(testing.capacity.default_slot_capacity, 3);
    EXPECT_EQ(testing.timing.default_consultation_minutes, 5);

    ConfigSnapshot production;
    apply_profile(production, Profile::Production);
    EXPECT_EQ(production.capacity.default_slot_capacity, 15);
    EXPECT_EQ(production.profile, Profile::Production);

    EXPECT_EQ(parse_profile("development"), Profile::Development);
    EXPECT_EQ(parse_profile("test"), Profile::Testing);
    EXPECT_FALSE(parse_profile("staging").has_value());
}

TEST(ConfigSnapshotTest, KnownKeysAreAccepted) {
    auto keys = known_keys();
    EXPECT_NE(std::find(keys.begin(), keys.end(), "priority.preemption_threshold"), keys.end());
    EXPECT_NE(std::find(keys.begin(), keys.end(), "allocation.reallocation_order"), keys.end());
}

class ConfigurationStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_.open(":memory:");
        store::ensure_schema(db_);
    }

    store::Database db_;
    ConfigurationStore store_{db_};
    ManualClock clock_{1772438400000};
};

TEST_F(ConfigurationStoreTest, SetGetRemove) {
    store_.set_value("priority.walkin", "250", "walk-in base", "admin");
    EXPECT_EQ(store_.get_value("priority.walkin"), "250");

    store_.set_value("priority.walkin", "300");
    EXPECT_EQ(store_.get_value("priority.walkin"), "300");

    store_.set_value("timing.buffer_minutes", "10");
    EXPECT_EQ(store_.all().size(), 2u);
    EXPECT_EQ(store_.all("priority").size(), 1u);

    EXPECT_TRUE(store_.remove("priority.walkin"));
    EXPECT_FALSE(store_.remove("priority.walkin"));
    EXPECT_FALSE(store_.get_value("priority.walkin").has_value());
}

TEST_F(ConfigurationStoreTest, RejectsInvalidValues) {
    try {
        store_.set_value("capacity.default_slot_capacity", "0");
        FAIL() << "expected a validation error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::ValidationError);
        EXPECT_EQ(e.info().details.at("config_key"), "capacity.default_slot_capacity");
    }
    EXPECT_FALSE(store_.get_value("capacity.default_slot_capacity").has_value());
}

TEST_F(ConfigurationStoreTest, CachedViewHonoursTtl) {
    CachedConfigView::Options options;
    options.profile = Profile::Default;
    options.read_environment = false;
    CachedConfigView view(store_, clock_, options);

    auto first = view.snapshot();
    EXPECT_EQ(first->priority.preemption_threshold, 200);
    EXPECT_EQ(view.reloads(), 1u);

    store_.set_value("priority.preemption_threshold", "300");
    clock_.advance(std::chrono::minutes(4));
    auto cached = view.snapshot();
    EXPECT_EQ(cached, first);
    EXPECT_EQ(cached->priority.preemption_threshold, 200);

    clock_.advance(std::chrono::minutes(1));
    auto reloaded = view.snapshot();
    EXPECT_EQ(reloaded->priority.preemption_threshold, 300);
    EXPECT_EQ(view.reloads(), 2u);

    // Snapshots already handed out do not change.
    EXPECT_EQ(first->priority.preemption_threshold, 200);
}

TEST_F(ConfigurationStoreTest, InvalidateForcesReload) {
    CachedConfigView::Options options;
    options.profile = Profile::Default;
    options.read_environment = false;
    CachedConfigView view(store_, clock_, options);

    view.snapshot();
    store_.set_value("timing.reallocation_window_hours", "6");
    view.invalidate();
    EXPECT_EQ(view.snapshot()->timing.reallocation_window_hours, 6);
}

TEST_F(ConfigurationStoreTest, LayersProfileStoreAndEnvironment) {
    store_.set_value("capacity.default_slot_capacity", "8");
    store_.set_value("priority.walkin", "210");
    db_.run("INSERT INTO configurations (config_key, config_value, category, description, "
            "updated_by, updated_at) VALUES ('timing.buffer_minutes', '999', 'timing', '', "
            "'system', 0)");

    ::setenv("OPD_PRIORITY_WALKIN", "220", 1);
    ::setenv("OPD_PRIORITY_FOLLOWUP", "not-a-number", 1);

    CachedConfigView::Options options;
    options.profile = Profile::Production;
    CachedConfigView view(store_, clock_, options);
    auto snapshot = view.snapshot();

    ::unsetenv("OPD_PRIORITY_WALKIN");
    ::unsetenv("OPD_PRIORITY_FOLLOWUP");

    EXPECT_EQ(snapshot->profile, Profile::Production);
    EXPECT_EQ(snapshot->timing.default_consultation_minutes, 20);  // profile
    EXPECT_EQ(snapshot->capacity.default_slot_capacity, 8);        // stored row beats profile
    EXPECT_EQ(snapshot->timing.buffer_minutes, 10);                // invalid row skipped
    EXPECT_EQ(snapshot->priority.walkin, 220);                     // environment beats row
    EXPECT_EQ(snapshot->priority.followup, 600);                   // invalid variable skipped
}

TEST(StaticConfigViewTest, ServesTheSameSnapshot) {
    ConfigSnapshot snapshot;
    snapshot.priority.preemption_threshold = 150;
    StaticConfigView view(snapshot);
    EXPECT_EQ(view.snapshot(), view.snapshot());
    EXPECT_EQ(view.snapshot()->priority.preemption_threshold, 150);
}
