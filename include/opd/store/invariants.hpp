#pragma once

#include <opd/store/slot_store.hpp>
#include <opd/store/token_store.hpp>

#include <string>
#include <vector>

namespace opd {
namespace store {

struct InvariantViolation {
    std::string slot_id;
    std::string description;
};

/**
 * @brief Check the capacity and numbering invariants of every slot
 *
 * - the allocation counter equals the number of tokens occupying capacity
 * - the counter never exceeds the slot capacity
 * - token numbers are unique, strictly increasing and the highest one
 *   is the slot's last issued number
 */
std::vector<InvariantViolation> check_invariants(SlotStore& slots, TokenStore& tokens);

} // namespace store
} // namespace opd
