#include "test_fixtures.hpp"

#include <atomic>
#include <future>
#include <set>
#include <thread>
#include <vector>

using namespace opd;
using namespace opd::test;

class ConcurrentAllocationTest : public EngineTest {
protected:
    struct Tally {
        int allocated = 0;
        int full = 0;
        int other = 0;
        std::set<int64_t> numbers;
    };

    Tally tally(const std::vector<Outcome>& outcomes) {
        Tally result;
        for (const Outcome& outcome : outcomes) {
            if (const auto *placed = std::get_if<Allocated>(&outcome)) {
                result.allocated++;
                result.numbers.insert(placed->token.token_number);
            } else if (is_rejected(outcome, ErrorCode::SlotCapacityExceeded) ||
                       std::holds_alternative<Alternatives>(outcome)) {
                result.full++;
            } else {
                ADD_FAILURE() << describe(outcome);
                result.other++;
            }
        }
        return result;
    }
};

TEST_F(ConcurrentAllocationTest, WorkerPoolNeverOverbooks) {
    add_slot("s1", "dr_a", 5);

    std::vector<std::future<Outcome>> futures;
    for (int i = 0; i < 10; ++i)
        futures.push_back(service_->allocate_async(request_for("p" + std::to_string(i), "s1")));

    std::vector<Outcome> outcomes;
    for (auto& future : futures)
        outcomes.push_back(future.get());

    Tally result = tally(outcomes);
    EXPECT_EQ(result.allocated, 5);
    EXPECT_EQ(result.full, 5);
    EXPECT_EQ(result.numbers, (std::set<int64_t>{1, 2, 3, 4, 5}));

    Slot slot = service_->slot("s1");
    EXPECT_EQ(slot.current_allocation, 5);
    EXPECT_EQ(slot.last_token_number, 5);
    EXPECT_EQ(service_->in_flight().size(), 0u);
    expect_invariants();
}

TEST_F(ConcurrentAllocationTest, RawThreadsNeverOverbook) {
    add_slot("s1", "dr_a", 5);

    std::vector<Outcome> outcomes(10);
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&, i]() {
            while (!go.load())
                std::this_thread::yield();
            outcomes[i] = service_->allocate(request_for("p" + std::to_string(i), "s1"));
        });
    }
    go.store(true);
    for (auto& thread : threads)
        thread.join();

    Tally result = tally(outcomes);
    EXPECT_EQ(result.allocated, 5);
    EXPECT_EQ(result.full, 5);
    EXPECT_EQ(result.numbers.size(), 5u);
    EXPECT_EQ(service_->slot("s1").current_allocation, 5);
    expect_invariants();
}

TEST_F(ConcurrentAllocationTest, SamePatientIsBookedOnce) {
    add_slot("s1", "dr_a", 5);

    std::vector<std::future<Outcome>> futures;
    for (int i = 0; i < 6; ++i)
        futures.push_back(service_->allocate_async(request_for("p1", "s1")));

    int allocated = 0;
    for (auto& future : futures) {
        Outcome outcome = future.get();
        if (is_allocated(outcome)) {
            allocated++;
            continue;
        }
        EXPECT_TRUE(is_rejected(outcome, ErrorCode::OperationInProgress) ||
                    is_rejected(outcome, ErrorCode::SchedulingConflict))
            << describe(outcome);
    }
    EXPECT_EQ(allocated, 1);
    EXPECT_EQ(service_->slot("s1").current_allocation, 1);
    expect_invariants();
}

TEST_F(ConcurrentAllocationTest, CancellationsAndAllocationsInterleave) {
    add_slot("s1", "dr_a", 4);
    std::vector<Token> seeded;
    for (int i = 0; i < 4; ++i)
        seeded.push_back(seed_token("s1", "seed" + std::to_string(i), TokenSource::Online, 400));

    std::vector<std::future<Outcome>> allocations;
    std::vector<std::thread> cancellers;
    for (int i = 0; i < 4; ++i) {
        cancellers.emplace_back([&, i]() {
            service_->cancel(seeded[i].token_id, CancellationReason::PatientRequest, "patient");
        });
        allocations.push_back(
            service_->allocate_async(request_for("new" + std::to_string(i), "s1")));
    }
    for (auto& thread : cancellers)
        thread.join();

    std::vector<Outcome> outcomes;
    for (auto& future : allocations)
        outcomes.push_back(future.get());
    Tally result = tally(outcomes);

    Slot slot = service_->slot("s1");
    EXPECT_EQ(slot.current_allocation, result.allocated);
    EXPECT_LE(slot.current_allocation, slot.max_capacity);
    EXPECT_EQ(slot.last_token_number, 4 + result.allocated);
    expect_invariants();

    // Every seat freed by a cancellation can be taken afterwards
    for (int i = result.allocated; i < 4; ++i) {
        Outcome late = service_->allocate(request_for("late" + std::to_string(i), "s1"));
        EXPECT_TRUE(is_allocated(late)) << describe(late);
    }
    EXPECT_EQ(service_->slot("s1").current_allocation, 4);
    expect_invariants();
}
