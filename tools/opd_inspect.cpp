/**
 * @file opd_inspect.cpp
 * @brief Read-only inspection of an OPD token database
 *
 * Usage: opd_inspect <database> [slots | tokens <slot_id> | check]
 *
 * - slots: every slot with its allocation counter
 * - tokens: the tokens of one slot in number order
 * - check: verify the capacity and numbering invariants, exit 2 on a
 *   violation
 */

#include <opd/opd.hpp>
#include <opd/store/invariants.hpp>
#include <opd/store/schema.hpp>

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace opd;

namespace term {
const std::string RED = "\033[31m";
const std::string GREEN = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
} // namespace term

namespace {

void print_usage(const char *program) {
    std::cout << "Usage: " << program << " <database> [slots | tokens <slot_id> | check]"
              << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --log-level <level>  trace, debug, info, warn, error or off" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
}

int print_slots(store::SlotStore& slots) {
    store::SlotQuery query;
    query.bookable_only = false;
    auto all = slots.query(query);

    std::cout << term::BOLD << std::left << std::setw(28) << "SLOT" << std::setw(14) << "DOCTOR"
              << std::setw(12) << "DATE" << std::setw(13) << "TIME" << std::setw(12)
              << "STATUS" << std::setw(10) << "ALLOC" << "LAST#" << term::RESET << std::endl;
    for (const Slot& slot : all) {
        const std::string& color = slot.current_allocation >= slot.max_capacity ? term::YELLOW
                                                                                : term::GREEN;
        std::cout << std::left << std::setw(28) << slot.slot_id << std::setw(14)
                  << slot.doctor_id << std::setw(12) << slot.date << std::setw(13)
                  << (slot.start_time + "-" + slot.end_time) << std::setw(12)
                  << to_string(slot.status) << color << std::setw(10)
                  << (std::to_string(slot.current_allocation) + "/" +
                      std::to_string(slot.max_capacity))
                  << term::RESET << slot.last_token_number
                  << (slot.deleted ? " (deleted)" : "") << std::endl;
    }
    std::cout << all.size() << " slot(s)" << std::endl;
    return 0;
}

int print_tokens(store::SlotStore& slots, store::TokenStore& tokens, const std::string& slot_id) {
    Slot slot = slots.get(slot_id);
    std::cout << term::BOLD << slot.slot_id << term::RESET << " " << slot.doctor_id << " "
              << slot.date << " " << slot.start_time << "-" << slot.end_time << " ("
              << slot.current_allocation << "/" << slot.max_capacity << ", "
              << slot.emergency_reserved << " reserved)" << std::endl;

    std::cout << term::BOLD << std::left << std::setw(5) << "#" << std::setw(30) << "TOKEN"
              << std::setw(14) << "PATIENT" << std::setw(11) << "SOURCE" << std::setw(10)
              << "PRIORITY" << std::setw(17) << "STATUS" << "METHOD" << term::RESET
              << std::endl;
    for (const Token& token : tokens.in_slot(slot_id)) {
        std::cout << std::left << std::setw(5) << token.token_number << std::setw(30)
                  << token.token_id << std::setw(14) << token.patient_id << std::setw(11)
                  << to_string(token.source) << std::setw(10) << token.priority
                  << std::setw(17) << to_string(token.status)
                  << to_string(token.metadata.allocation_method);
        if (token.metadata.reallocation_status != ReallocationStatus::None)
            std::cout << " [" << to_string(token.metadata.reallocation_status) << "]";
        if (!token.metadata.cancellation_reason.empty())
            std::cout << " (" << token.metadata.cancellation_reason << ")";
        std::cout << std::endl;
    }
    return 0;
}

int check(store::SlotStore& slots, store::TokenStore& tokens) {
    auto violations = store::check_invariants(slots, tokens);
    if (violations.empty()) {
        std::cout << term::GREEN << "All slot invariants hold" << term::RESET << std::endl;
        return 0;
    }
    for (const auto& violation : violations) {
        std::cout << term::RED << violation.slot_id << ": " << violation.description
                  << term::RESET << std::endl;
    }
    std::cout << violations.size() << " violation(s)" << std::endl;
    return 2;
}

} // namespace

int main(int argc, char *argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--log-level" && i + 1 < argc) {
            if (!set_log_level(std::string_view(argv[++i]))) {
                print_usage(argv[0]);
                return 1;
            }
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = args.size() > 1 ? args[1] : "slots";
    if (command == "tokens" && args.size() < 3) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        store::Database db;
        db.open(args[0]);
        store::ensure_schema(db);

        store::SlotStore slots(db);
        store::TokenStore tokens(db);

        if (command == "slots")
            return print_slots(slots);
        if (command == "tokens")
            return print_tokens(slots, tokens, args[2]);
        if (command == "check")
            return check(slots, tokens);

        std::cerr << "Unknown command '" << command << "'" << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const Error& e) {
        std::cerr << "Error: " << e.info().toString() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
