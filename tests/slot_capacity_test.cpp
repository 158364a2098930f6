#include "test_fixtures.hpp"

using namespace opd;
using namespace opd::test;

class SlotCapacityTest : public EngineTest {};

TEST_F(SlotCapacityTest, ReserveIssuesSequentialNumbers) {
    add_slot("s1", "dr_a", 3);
    auto& capacity = service_->capacity();

    auto first = capacity.reserve_capacity("s1", false);
    auto second = capacity.reserve_capacity("s1", false);
    EXPECT_EQ(first.new_count, 1);
    EXPECT_EQ(first.token_number, 1);
    EXPECT_EQ(second.new_count, 2);
    EXPECT_EQ(second.token_number, 2);

    Slot slot = service_->slot("s1");
    EXPECT_EQ(slot.current_allocation, 2);
    EXPECT_EQ(slot.last_token_number, 2);
}

TEST_F(SlotCapacityTest, ReleaseKeepsNumbering) {
    add_slot("s1", "dr_a", 3);
    auto& capacity = service_->capacity();

    capacity.reserve_capacity("s1", false);
    capacity.reserve_capacity("s1", false);
    EXPECT_EQ(capacity.release_capacity("s1"), 1);

    auto next = capacity.reserve_capacity("s1", false);
    EXPECT_EQ(next.new_count, 2);
    EXPECT_EQ(next.token_number, 3);
}

TEST_F(SlotCapacityTest, ReleaseAtZeroStaysAtZero) {
    add_slot("s1", "dr_a", 3);
    EXPECT_EQ(service_->capacity().release_capacity("s1"), 0);
    EXPECT_EQ(service_->slot("s1").current_allocation, 0);
}

TEST_F(SlotCapacityTest, EmergencyReserveBoundary) {
    add_slot("s1", "dr_a", 5, 2);
    auto& capacity = service_->capacity();

    for (int i = 0; i < 3; ++i)
        capacity.reserve_capacity("s1", false);

    try {
        capacity.reserve_capacity("s1", false);
        FAIL() << "regular arrivals must stop at the reserve";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::SlotCapacityExceeded);
        EXPECT_EQ(e.info().details.at("limit"), "3");
    }

    auto availability = capacity.check_availability("s1", false);
    EXPECT_EQ(availability.regular_available, 0);
    EXPECT_EQ(availability.emergency_available, 2);
    EXPECT_EQ(availability.available, 0);
    EXPECT_TRUE(availability.bookable);

    capacity.reserve_capacity("s1", true);
    capacity.reserve_capacity("s1", true);
    EXPECT_THROW(capacity.reserve_capacity("s1", true), Error);

    Slot slot = service_->slot("s1");
    EXPECT_EQ(slot.current_allocation, 5);
    EXPECT_EQ(slot.last_token_number, 5);
}

TEST_F(SlotCapacityTest, UnbookableSlotsRefuseSeats) {
    add_slot("s1", "dr_a", 3);
    service_->change_slot_status("s1", SlotStatus::Suspended);

    try {
        service_->capacity().reserve_capacity("s1", true);
        FAIL() << "expected SLOT_NOT_AVAILABLE";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::SlotNotAvailable);
    }
    try {
        service_->capacity().reserve_capacity("missing", true);
        FAIL() << "expected SLOT_NOT_FOUND";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::SlotNotFound);
    }
    EXPECT_FALSE(service_->capacity().check_availability("s1", false).bookable);
}

TEST_F(SlotCapacityTest, SwapWithinSlotKeepsTheCounter) {
    add_slot("s1", "dr_a", 2);
    auto& capacity = service_->capacity();
    capacity.reserve_capacity("s1", false);
    capacity.reserve_capacity("s1", false);

    auto swapped = capacity.swap_within_slot("s1", 2);
    EXPECT_EQ(swapped.new_count, 2);
    EXPECT_EQ(swapped.token_number, 3);

    try {
        capacity.swap_within_slot("s1", 1);
        FAIL() << "expected CONCURRENT_MODIFICATION";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConcurrentModification);
        EXPECT_EQ(e.info().details.at("actual"), "2");
    }
}

TEST_F(SlotCapacityTest, TerminalSlotsCannotReopen) {
    add_slot("s1", "dr_a", 3);
    service_->change_slot_status("s1", SlotStatus::Suspended);
    service_->change_slot_status("s1", SlotStatus::Active);
    service_->change_slot_status("s1", SlotStatus::Cancelled);

    try {
        service_->change_slot_status("s1", SlotStatus::Active);
        FAIL() << "expected SLOT_NOT_AVAILABLE";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::SlotNotAvailable);
    }
    EXPECT_EQ(service_->slot("s1").status, SlotStatus::Cancelled);
}

TEST_F(SlotCapacityTest, ChangeCapacity) {
    add_slot("s1", "dr_a", 3);
    seed_token("s1", "p1", TokenSource::Online, 400);
    seed_token("s1", "p2", TokenSource::Online, 400);

    Slot grown = service_->change_capacity("s1", 6, 1);
    EXPECT_EQ(grown.max_capacity, 6);
    EXPECT_EQ(grown.emergency_reserved, 1);
    EXPECT_EQ(grown.current_allocation, 2);

    try {
        service_->change_capacity("s1", 1, 0);
        FAIL() << "expected SCHEDULING_CONFLICT";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::SchedulingConflict);
    }
    try {
        service_->change_capacity("s1", 4, 5);
        FAIL() << "expected VALIDATION_ERROR";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::ValidationError);
    }
    EXPECT_EQ(service_->slot("s1").max_capacity, 6);
    expect_invariants();
}

TEST_F(SlotCapacityTest, CreateSlotDerivesCapacityFromTiming) {
    // 180 minutes at 15 + 5 per patient fits 9, under the default of 10
    Slot derived = add_slot("s1", "dr_a", 0, -1);
    EXPECT_EQ(derived.max_capacity, 9);
    EXPECT_EQ(derived.emergency_reserved, 1);

    Slot short_slot = add_slot("s2", "dr_a", 0, -1, kToday, "09:00", "10:00");
    EXPECT_EQ(short_slot.max_capacity, 3);
    EXPECT_EQ(short_slot.emergency_reserved, 0);

    Slot long_slot = add_slot("s3", "dr_a", 0, -1, kToday, "08:00", "18:00");
    EXPECT_EQ(long_slot.max_capacity, 10);
    EXPECT_EQ(long_slot.emergency_reserved, 2);

    Slot tiny = add_slot("s4", "dr_a", 0, -1, kToday, "09:00", "09:10");
    EXPECT_EQ(tiny.max_capacity, 1);
}

TEST_F(SlotCapacityTest, CreateSlotRejectsBadInput) {
    add_slot("s1", "dr_a", 3);
    try {
        add_slot("s1", "dr_a", 3);
        FAIL() << "expected SCHEDULING_CONFLICT";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::SchedulingConflict);
    }

    EXPECT_THROW(add_slot("s2", "dr_a", 3, 0, kToday, "12:00", "09:00"), Error);
    EXPECT_THROW(add_slot("s3", "dr_a", 3, 0, "2026-13-40"), Error);
    EXPECT_THROW(add_slot("s4", "dr_a", 3, 4), Error);
    EXPECT_THROW(add_slot("s5", "", 3), Error);
}

TEST_F(SlotCapacityTest, MalformedDatesAreRejected) {
    for (const char *date : {"2026-+3-10", "2026- 1-05", "+026-03-10", "2026-03-1x", "2026/03/10",
                             "2026-02-30"}) {
        try {
            add_slot("bad", "dr_a", 3, 0, date);
            ADD_FAILURE() << "accepted " << date;
        } catch (const Error& e) {
            EXPECT_EQ(e.code(), ErrorCode::ValidationError) << date;
        }
    }
    EXPECT_THROW(service_->slot("bad"), Error);

    add_slot("s1", "dr_a", 3, 0, kTomorrow);
    AllocationRequest request = request_for("p1", "");
    request.doctor_id = "dr_a";
    request.preferences.preferred_date = "2026-+3-03";
    Outcome outcome = service_->allocate(request);
    EXPECT_TRUE(is_rejected(outcome, ErrorCode::ValidationError)) << describe(outcome);

    request.preferences.preferred_date = kTomorrow;
    outcome = service_->allocate(request);
    EXPECT_EQ(allocated(outcome).token.slot_id, "s1");
}

TEST_F(SlotCapacityTest, GeneratedSlotIds) {
    capacity::SlotSpec spec;
    spec.doctor_id = "dr_a";
    spec.date = kToday;
    spec.start_time = "09:00";
    spec.end_time = "10:00";
    Slot slot = service_->create_slot(spec);
    EXPECT_EQ(slot.slot_id.rfind("slot_", 0), 0u);
    EXPECT_EQ(service_->slot(slot.slot_id).doctor_id, "dr_a");
}
