#include <opd/core/error.hpp>
#include <opd/store/database.hpp>
#include <opd/store/invariants.hpp>
#include <opd/store/schema.hpp>
#include <opd/store/slot_store.hpp>
#include <opd/store/token_store.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace opd;
using namespace opd::store;

class StoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_.open(":memory:");
        ensure_schema(db_);
    }

    Slot make_slot(const std::string& id, const std::string& doctor, const std::string& date,
                   const std::string& start = "09:00") {
        Slot slot;
        slot.slot_id = id;
        slot.doctor_id = doctor;
        slot.date = date;
        slot.start_time = start;
        slot.end_time = "12:00";
        slot.specialty = "cardiology";
        slot.max_capacity = 5;
        return slot;
    }

    Token make_token(const std::string& id, const std::string& slot_id, int64_t number,
                     int priority, int64_t created_at,
                     TokenStatus status = TokenStatus::Allocated) {
        Token token;
        token.token_id = id;
        token.patient_id = "patient_" + id;
        token.doctor_id = "dr_a";
        token.slot_id = slot_id;
        token.token_number = number;
        token.priority = priority;
        token.status = status;
        token.created_at = created_at;
        token.updated_at = created_at;
        return token;
    }

    Database db_;
    SlotStore slots_{db_};
    TokenStore tokens_{db_};
};

TEST_F(StoreTest, SchemaVersionIsRecorded) {
    EXPECT_EQ(db_.get_user_version(), kSchemaVersion);
    ensure_schema(db_);
    EXPECT_EQ(db_.get_user_version(), kSchemaVersion);
}

TEST_F(StoreTest, TransactionRollsBackOnException) {
    slots_.insert(make_slot("s1", "dr_a", "2026-03-02"));

    EXPECT_THROW(db_.transaction([&]() {
        Slot slot = slots_.get("s1");
        slot.current_allocation = 3;
        slots_.save(slot);
        throw std::runtime_error("abort");
    }),
                 std::runtime_error);

    Slot slot = slots_.get("s1");
    EXPECT_EQ(slot.current_allocation, 0);
    EXPECT_EQ(slot.version, 0);
    EXPECT_FALSE(db_.in_transaction());
}

TEST_F(StoreTest, NestedTransactionsJoinTheOuterOne) {
    slots_.insert(make_slot("s1", "dr_a", "2026-03-02"));

    db_.transaction([&]() {
        EXPECT_TRUE(db_.in_transaction());
        db_.transaction([&]() {
            Slot slot = slots_.get("s1");
            slot.current_allocation = 1;
            slots_.save(slot);
        });
        Slot slot = slots_.get("s1");
        EXPECT_EQ(slot.current_allocation, 1);
    });
    EXPECT_EQ(slots_.get("s1").version, 1);
}

TEST_F(StoreTest, SlotSaveChecksVersion) {
    slots_.insert(make_slot("s1", "dr_a", "2026-03-02"));

    Slot first = slots_.get("s1");
    Slot second = slots_.get("s1");

    first.current_allocation = 1;
    slots_.save(first);
    EXPECT_EQ(first.version, 1);

    second.current_allocation = 2;
    try {
        slots_.save(second);
        FAIL() << "expected a version conflict";
    } catch (const VersionConflict& e) {
        EXPECT_EQ(e.entity(), "slot");
        EXPECT_EQ(e.id(), "s1");
        EXPECT_EQ(e.expected_version(), 0);
    }
    EXPECT_EQ(slots_.get("s1").current_allocation, 1);
}

TEST_F(StoreTest, MissingRecordsThrowNotFound) {
    EXPECT_FALSE(slots_.load("nope").has_value());
    try {
        slots_.get("nope");
        FAIL() << "expected SLOT_NOT_FOUND";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::SlotNotFound);
    }
    try {
        tokens_.get("nope");
        FAIL() << "expected TOKEN_NOT_FOUND";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::TokenNotFound);
    }
}

TEST_F(StoreTest, DuplicateTokenNumberIsRejected) {
    slots_.insert(make_slot("s1", "dr_a", "2026-03-02"));
    tokens_.insert(make_token("t1", "s1", 1, 400, 1000));
    try {
        tokens_.insert(make_token("t2", "s1", 1, 400, 2000));
        FAIL() << "expected a unique constraint failure";
    } catch (const StoreError& e) {
        EXPECT_TRUE(e.transient());
    }
}

TEST_F(StoreTest, SlotQueryFiltersAndOrders) {
    slots_.insert(make_slot("s3", "dr_a", "2026-03-03", "09:00"));
    slots_.insert(make_slot("s2", "dr_a", "2026-03-02", "13:00"));
    slots_.insert(make_slot("s1", "dr_a", "2026-03-02", "09:00"));
    Slot suspended = make_slot("s4", "dr_a", "2026-03-02", "15:00");
    suspended.status = SlotStatus::Suspended;
    slots_.insert(suspended);
    slots_.insert(make_slot("s5", "dr_b", "2026-03-02"));

    SlotQuery query;
    query.doctor_id = "dr_a";
    auto bookable = slots_.query(query);
    ASSERT_EQ(bookable.size(), 3u);
    EXPECT_EQ(bookable[0].slot_id, "s1");
    EXPECT_EQ(bookable[1].slot_id, "s2");
    EXPECT_EQ(bookable[2].slot_id, "s3");

    query.bookable_only = false;
    query.date_to = "2026-03-02";
    EXPECT_EQ(slots_.query(query).size(), 3u);
}

TEST_F(StoreTest, TokenRoundTripKeepsMetadata) {
    slots_.insert(make_slot("s1", "dr_a", "2026-03-02"));
    Token token = make_token("t1", "s1", 1, 650, 1000);
    token.source = TokenSource::Followup;
    token.metadata.urgency_level = UrgencyLevel::High;
    token.metadata.allocation_method = AllocationMethod::Reallocation;
    token.metadata.original_slot_id = "s0";
    token.metadata.reallocated_from = "t0";
    token.metadata.waiting_time = 25;
    token.metadata.notes = "bring reports";
    tokens_.insert(token);

    Token loaded = tokens_.get("t1");
    EXPECT_EQ(loaded.source, TokenSource::Followup);
    EXPECT_EQ(loaded.priority, 650);
    EXPECT_EQ(loaded.metadata.urgency_level, UrgencyLevel::High);
    EXPECT_EQ(loaded.metadata.allocation_method, AllocationMethod::Reallocation);
    EXPECT_EQ(loaded.metadata.original_slot_id, "s0");
    EXPECT_EQ(loaded.metadata.reallocated_from, "t0");
    EXPECT_EQ(loaded.metadata.waiting_time, 25);
    EXPECT_EQ(loaded.metadata.notes, "bring reports");
}

TEST_F(StoreTest, ActiveTokensOrderedCheapestFirst) {
    slots_.insert(make_slot("s1", "dr_a", "2026-03-02"));
    tokens_.insert(make_token("t_a", "s1", 1, 400, 1000));
    tokens_.insert(make_token("t_b", "s1", 2, 300, 1000));
    tokens_.insert(make_token("t_c", "s1", 3, 400, 2000));
    tokens_.insert(make_token("t_d", "s1", 4, 100, 500, TokenStatus::Cancelled));
    tokens_.insert(make_token("t_e", "s1", 5, 400, 1000));

    auto active = tokens_.active_in_slot("s1");
    ASSERT_EQ(active.size(), 4u);
    EXPECT_EQ(active[0].token_id, "t_b");
    EXPECT_EQ(active[1].token_id, "t_c");  // newer first
    EXPECT_EQ(active[2].token_id, "t_e");  // then larger id first
    EXPECT_EQ(active[3].token_id, "t_a");
    EXPECT_EQ(tokens_.count_active("s1"), 4);
}

TEST_F(StoreTest, TokenQueryOrdersByPriorityThenAge) {
    slots_.insert(make_slot("s1", "dr_a", "2026-03-02"));
    slots_.insert(make_slot("s2", "dr_a", "2026-03-05"));
    tokens_.insert(make_token("t1", "s1", 1, 500, 2000));
    tokens_.insert(make_token("t2", "s1", 2, 700, 3000));
    tokens_.insert(make_token("t3", "s1", 3, 500, 1000));
    tokens_.insert(make_token("t4", "s2", 1, 900, 1000));
    tokens_.insert(make_token("t5", "s1", 4, 800, 1000, TokenStatus::Completed));

    TokenQuery query;
    query.doctor_id = "dr_a";
    query.date_to = "2026-03-02";
    query.statuses = {TokenStatus::Allocated};
    auto tokens = tokens_.query(query);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].token_id, "t2");
    EXPECT_EQ(tokens[1].token_id, "t3");
    EXPECT_EQ(tokens[2].token_id, "t1");
}

TEST_F(StoreTest, FindActiveTokenForPatient) {
    slots_.insert(make_slot("s1", "dr_a", "2026-03-02"));
    tokens_.insert(make_token("t1", "s1", 1, 400, 1000, TokenStatus::Cancelled));
    EXPECT_FALSE(tokens_.find_active_for_patient("s1", "patient_t1").has_value());

    tokens_.insert(make_token("t2", "s1", 2, 400, 1000));
    auto found = tokens_.find_active_for_patient("s1", "patient_t2");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->token_id, "t2");
}

TEST_F(StoreTest, InvariantCheckReportsDrift) {
    Slot slot = make_slot("s1", "dr_a", "2026-03-02");
    slot.current_allocation = 2;
    slot.last_token_number = 2;
    slots_.insert(slot);
    tokens_.insert(make_token("t1", "s1", 1, 400, 1000));
    tokens_.insert(make_token("t2", "s1", 2, 400, 1000));
    EXPECT_TRUE(check_invariants(slots_, tokens_).empty());

    Slot drifted = slots_.get("s1");
    drifted.current_allocation = 3;
    slots_.save(drifted);

    auto violations = check_invariants(slots_, tokens_);
    ASSERT_FALSE(violations.empty());
    EXPECT_EQ(violations[0].slot_id, "s1");
}
