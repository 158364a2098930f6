#include "test_fixtures.hpp"

#include <functional>

using namespace opd;
using namespace opd::test;

class TokenLifecycleTest : public EngineTest {
protected:
    void SetUp() override {
        EngineTest::SetUp();
        add_slot("s1", "dr_a", 3);
        add_slot("s2", "dr_a", 2, 0, kToday, "13:00", "16:00");
        token_ = seed_token("s1", "p1", TokenSource::Online, 400);
    }

    ErrorCode code_of(const std::function<void()>& operation) {
        try {
            operation();
        } catch (const Error& e) {
            return e.code();
        }
        ADD_FAILURE() << "operation did not throw";
        return ErrorCode::InternalServerError;
    }

    Token token_;
};

TEST_F(TokenLifecycleTest, FullVisit) {
    Token confirmed = service_->confirm(token_.token_id, "desk", "arrived early");
    EXPECT_EQ(confirmed.status, TokenStatus::Confirmed);
    EXPECT_EQ(confirmed.metadata.notes, "arrived early");
    EXPECT_EQ(confirmed.metadata.actor_id, "desk");
    EXPECT_EQ(service_->slot("s1").current_allocation, 1);

    Token started = service_->start_consultation(token_.token_id, "dr_a");
    EXPECT_EQ(started.status, TokenStatus::InConsultation);
    EXPECT_EQ(service_->slot("s1").current_allocation, 1);

    clock_->advance(std::chrono::minutes(15));
    Token completed = service_->complete(token_.token_id, "dr_a", "follow up in a week");
    EXPECT_EQ(completed.status, TokenStatus::Completed);
    EXPECT_EQ(completed.updated_at, clock_->now_ms());
    EXPECT_EQ(completed.metadata.notes, "follow up in a week");
    EXPECT_EQ(service_->slot("s1").current_allocation, 0);

    Token stored = service_->token(token_.token_id);
    EXPECT_EQ(stored.status, TokenStatus::Completed);
    EXPECT_EQ(stored.token_number, token_.token_number);
    expect_invariants();
}

TEST_F(TokenLifecycleTest, StepsCannotBeSkipped) {
    EXPECT_EQ(code_of([&] { service_->start_consultation(token_.token_id, "dr_a"); }),
              ErrorCode::InvalidTokenStatus);
    EXPECT_EQ(code_of([&] { service_->complete(token_.token_id, "dr_a"); }),
              ErrorCode::InvalidTokenStatus);

    service_->confirm(token_.token_id, "desk");
    EXPECT_EQ(code_of([&] { service_->confirm(token_.token_id, "desk"); }),
              ErrorCode::InvalidTokenStatus);

    service_->start_consultation(token_.token_id, "dr_a");
    EXPECT_EQ(code_of([&] {
                  service_->cancel(token_.token_id, CancellationReason::PatientRequest, "p1");
              }),
              ErrorCode::InvalidTokenStatus);
    EXPECT_EQ(code_of([&] { service_->mark_no_show(token_.token_id, "desk"); }),
              ErrorCode::InvalidTokenStatus);
    EXPECT_EQ(service_->token(token_.token_id).status, TokenStatus::InConsultation);
}

TEST_F(TokenLifecycleTest, CancelReleasesCapacity) {
    Token cancelled =
        service_->cancel(token_.token_id, CancellationReason::PatientRequest, "p1");
    EXPECT_EQ(cancelled.status, TokenStatus::Cancelled);
    EXPECT_EQ(cancelled.metadata.cancellation_reason, "patient_request");
    EXPECT_EQ(cancelled.metadata.actor_id, "p1");

    Slot slot = service_->slot("s1");
    EXPECT_EQ(slot.current_allocation, 0);
    EXPECT_EQ(slot.last_token_number, 1);
    expect_invariants();
}

TEST_F(TokenLifecycleTest, ConfirmedTokensCanBeCancelled) {
    service_->confirm(token_.token_id, "desk");
    Token cancelled =
        service_->cancel(token_.token_id, CancellationReason::DoctorUnavailable, "admin");
    EXPECT_EQ(cancelled.metadata.cancellation_reason, "doctor_unavailable");
    EXPECT_EQ(service_->slot("s1").current_allocation, 0);
}

TEST_F(TokenLifecycleTest, NoShowReleasesCapacity) {
    service_->confirm(token_.token_id, "desk");
    Token missed = service_->mark_no_show(token_.token_id, "desk", "called twice");
    EXPECT_EQ(missed.status, TokenStatus::NoShow);
    EXPECT_EQ(missed.metadata.notes, "called twice");
    EXPECT_EQ(service_->slot("s1").current_allocation, 0);
    expect_invariants();
}

TEST_F(TokenLifecycleTest, TerminalTokensAreAlreadyProcessed) {
    service_->cancel(token_.token_id, CancellationReason::PatientRequest, "p1");

    EXPECT_EQ(code_of([&] {
                  service_->cancel(token_.token_id, CancellationReason::PatientRequest, "p1");
              }),
              ErrorCode::TokenAlreadyProcessed);
    EXPECT_EQ(code_of([&] { service_->confirm(token_.token_id, "desk"); }),
              ErrorCode::TokenAlreadyProcessed);
    EXPECT_EQ(code_of([&] { service_->move(token_.token_id, "s2", "desk"); }),
              ErrorCode::TokenAlreadyProcessed);

    // A second cancel must not release a seat again
    EXPECT_EQ(service_->slot("s1").current_allocation, 0);
    expect_invariants();
}

TEST_F(TokenLifecycleTest, UnknownTokens) {
    EXPECT_EQ(code_of([&] { service_->confirm("tok_missing", "desk"); }),
              ErrorCode::TokenNotFound);
    EXPECT_EQ(code_of([&] { service_->move("tok_missing", "s2", "desk"); }),
              ErrorCode::TokenNotFound);
}

TEST_F(TokenLifecycleTest, OperationInProgressIsRefused) {
    auto guard = service_->in_flight().acquire(
        concurrency::InFlightRegistry::token_key("cancel", token_.token_id));
    EXPECT_EQ(code_of([&] {
                  service_->cancel(token_.token_id, CancellationReason::PatientRequest, "p1");
              }),
              ErrorCode::OperationInProgress);

    // Other operations on the same token use their own keys
    EXPECT_EQ(service_->confirm(token_.token_id, "desk").status, TokenStatus::Confirmed);
}

TEST_F(TokenLifecycleTest, MoveIssuesANewToken) {
    service_->confirm(token_.token_id, "desk");
    Token moved = service_->move(token_.token_id, "s2", "desk");

    EXPECT_NE(moved.token_id, token_.token_id);
    EXPECT_EQ(moved.slot_id, "s2");
    EXPECT_EQ(moved.patient_id, "p1");
    EXPECT_EQ(moved.token_number, 1);
    EXPECT_EQ(moved.status, TokenStatus::Allocated);
    EXPECT_EQ(moved.priority, token_.priority);
    EXPECT_EQ(moved.source, token_.source);
    EXPECT_EQ(moved.metadata.allocation_method, AllocationMethod::Reallocation);
    EXPECT_EQ(moved.metadata.original_slot_id, "s1");
    EXPECT_EQ(moved.metadata.reallocated_from, token_.token_id);

    Token original = service_->token(token_.token_id);
    EXPECT_EQ(original.status, TokenStatus::Cancelled);
    EXPECT_EQ(original.metadata.cancellation_reason, "moved");
    EXPECT_EQ(original.metadata.reallocated_to, moved.token_id);

    EXPECT_EQ(service_->slot("s1").current_allocation, 0);
    EXPECT_EQ(service_->slot("s2").current_allocation, 1);
    expect_invariants();
}

TEST_F(TokenLifecycleTest, MoveChecksTheTarget) {
    EXPECT_EQ(code_of([&] { service_->move(token_.token_id, "s1", "desk"); }),
              ErrorCode::ValidationError);
    EXPECT_EQ(code_of([&] { service_->move(token_.token_id, "nowhere", "desk"); }),
              ErrorCode::SlotNotFound);

    add_slot("past", "dr_a", 2, 0, kYesterday);
    EXPECT_EQ(code_of([&] { service_->move(token_.token_id, "past", "desk"); }),
              ErrorCode::SlotNotAvailable);

    service_->change_slot_status("s2", SlotStatus::Suspended);
    EXPECT_EQ(code_of([&] { service_->move(token_.token_id, "s2", "desk"); }),
              ErrorCode::SlotNotAvailable);

    add_slot("s3", "dr_b", 1);
    seed_token("s3", "p9", TokenSource::Walkin, 200);
    EXPECT_EQ(code_of([&] { service_->move(token_.token_id, "s3", "desk"); }),
              ErrorCode::SlotCapacityExceeded);

    add_slot("s4", "dr_b", 2);
    seed_token("s4", "p1", TokenSource::Online, 400);
    EXPECT_EQ(code_of([&] { service_->move(token_.token_id, "s4", "desk"); }),
              ErrorCode::SchedulingConflict);

    // Every failed move left the original untouched
    Token original = service_->token(token_.token_id);
    EXPECT_EQ(original.status, TokenStatus::Allocated);
    EXPECT_EQ(original.slot_id, "s1");
    EXPECT_EQ(service_->slot("s1").current_allocation, 1);
    expect_invariants();
}

TEST_F(TokenLifecycleTest, TokensInConsultationCannotMove) {
    service_->confirm(token_.token_id, "desk");
    service_->start_consultation(token_.token_id, "dr_a");
    EXPECT_EQ(code_of([&] { service_->move(token_.token_id, "s2", "desk"); }),
              ErrorCode::InvalidTokenStatus);
}

TEST_F(TokenLifecycleTest, FreedSeatIsReusedWithAFreshNumber) {
    seed_token("s1", "p2", TokenSource::Online, 400);
    seed_token("s1", "p3", TokenSource::Online, 400);
    service_->cancel(token_.token_id, CancellationReason::PatientRequest, "p1");

    Outcome outcome = service_->allocate(request_for("p4", "s1"));
    const Allocated& result = allocated(outcome);
    EXPECT_EQ(result.token.token_number, 4);
    EXPECT_EQ(service_->slot("s1").current_allocation, 3);
    expect_invariants();
}
