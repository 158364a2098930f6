#include <opd/store/token_store.hpp>

#include <opd/core/error.hpp>

#include <algorithm>

namespace opd {
namespace store {

namespace {

constexpr const char *kTokenColumns =
    "token_id, patient_id, doctor_id, slot_id, token_number, source, priority, status, "
    "created_at, updated_at, version, original_slot_id, preempted_by, urgency_level, "
    "reallocated_to, reallocated_from, reallocation_status, allocation_method, waiting_time, "
    "cancellation_reason, actor_id, notes";

constexpr const char *kJoinedTokenColumns =
    "t.token_id, t.patient_id, t.doctor_id, t.slot_id, t.token_number, t.source, t.priority, "
    "t.status, t.created_at, t.updated_at, t.version, t.original_slot_id, t.preempted_by, "
    "t.urgency_level, t.reallocated_to, t.reallocated_from, t.reallocation_status, "
    "t.allocation_method, t.waiting_time, t.cancellation_reason, t.actor_id, t.notes";

constexpr const char *kActiveStatuses = "('allocated', 'confirmed', 'in_consultation')";

Token read_token(const Statement& stmt) {
    Token token;
    token.token_id = stmt.column_text(0);
    token.patient_id = stmt.column_text(1);
    token.doctor_id = stmt.column_text(2);
    token.slot_id = stmt.column_text(3);
    token.token_number = stmt.column_int64(4);
    token.source = parse_token_source(stmt.column_text(5)).value_or(TokenSource::Online);
    token.priority = stmt.column_int(6);
    token.status = parse_token_status(stmt.column_text(7)).value_or(TokenStatus::Cancelled);
    token.created_at = stmt.column_int64(8);
    token.updated_at = stmt.column_int64(9);
    token.version = stmt.column_int64(10);

    TokenMetadata& meta = token.metadata;
    meta.original_slot_id = stmt.column_text(11);
    meta.preempted_by = stmt.column_text(12);
    meta.urgency_level =
        parse_urgency_level(stmt.column_text(13)).value_or(UrgencyLevel::Normal);
    meta.reallocated_to = stmt.column_text(14);
    meta.reallocated_from = stmt.column_text(15);
    meta.reallocation_status =
        parse_reallocation_status(stmt.column_text(16)).value_or(ReallocationStatus::None);
    meta.allocation_method =
        parse_allocation_method(stmt.column_text(17)).value_or(AllocationMethod::Direct);
    meta.waiting_time = stmt.column_int(18);
    meta.cancellation_reason = stmt.column_text(19);
    meta.actor_id = stmt.column_text(20);
    meta.notes = stmt.column_text(21);
    return token;
}

std::vector<Token> read_all(Statement& stmt) {
    std::vector<Token> tokens;
    while (stmt.step())
        tokens.push_back(read_token(stmt));
    return tokens;
}

} // namespace

void TokenStore::insert(const Token& token) {
    const TokenMetadata& meta = token.metadata;
    db_.transaction([&]() {
        db_.run(std::string("INSERT INTO tokens (") + kTokenColumns +
                    ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                {token.token_id, token.patient_id, token.doctor_id, token.slot_id,
                 token.token_number, to_string(token.source), token.priority,
                 to_string(token.status), token.created_at, token.updated_at, token.version,
                 meta.original_slot_id, meta.preempted_by, to_string(meta.urgency_level),
                 meta.reallocated_to, meta.reallocated_from,
                 to_string(meta.reallocation_status), to_string(meta.allocation_method),
                 meta.waiting_time, meta.cancellation_reason, meta.actor_id, meta.notes});
    });
}

std::optional<Token> TokenStore::load(const std::string& token_id) {
    Statement stmt = db_.prepare(
        std::string("SELECT ") + kTokenColumns + " FROM tokens WHERE token_id = ?", {token_id});
    if (!stmt.step())
        return std::nullopt;
    return read_token(stmt);
}

Token TokenStore::get(const std::string& token_id) {
    auto token = load(token_id);
    if (!token) {
        throw Error(ErrorCode::TokenNotFound, "Token '" + token_id + "' not found",
                    {{"token_id", token_id}});
    }
    return *token;
}

void TokenStore::save(Token& token) {
    const TokenMetadata& meta = token.metadata;
    int changed = db_.transaction([&]() {
        return db_.run(
            "UPDATE tokens SET status = ?, priority = ?, updated_at = ?, original_slot_id = ?, "
            "preempted_by = ?, urgency_level = ?, reallocated_to = ?, reallocated_from = ?, "
            "reallocation_status = ?, allocation_method = ?, waiting_time = ?, "
            "cancellation_reason = ?, actor_id = ?, notes = ?, version = version + 1 "
            "WHERE token_id = ? AND version = ?",
            {to_string(token.status), token.priority, token.updated_at, meta.original_slot_id,
             meta.preempted_by, to_string(meta.urgency_level), meta.reallocated_to,
             meta.reallocated_from, to_string(meta.reallocation_status),
             to_string(meta.allocation_method), meta.waiting_time, meta.cancellation_reason,
             meta.actor_id, meta.notes, token.token_id, token.version});
    });
    if (changed == 0)
        throw VersionConflict(entity_name(), token.token_id, token.version);
    token.version++;
}

std::vector<Token> TokenStore::active_in_slot(const std::string& slot_id) {
    Statement stmt = db_.prepare(std::string("SELECT ") + kTokenColumns +
                                     " FROM tokens WHERE slot_id = ? AND status IN " +
                                     kActiveStatuses +
                                     " ORDER BY priority ASC, created_at DESC, token_id DESC",
                                 {slot_id});
    return read_all(stmt);
}

std::vector<Token> TokenStore::in_slot(const std::string& slot_id) {
    Statement stmt = db_.prepare(std::string("SELECT ") + kTokenColumns +
                                     " FROM tokens WHERE slot_id = ? ORDER BY token_number",
                                 {slot_id});
    return read_all(stmt);
}

int TokenStore::count_active(const std::string& slot_id) {
    Statement stmt = db_.prepare(
        std::string("SELECT COUNT(*) FROM tokens WHERE slot_id = ? AND status IN ") +
            kActiveStatuses,
        {slot_id});
    if (!stmt.step())
        return 0;
    return stmt.column_int(0);
}

std::optional<Token> TokenStore::find_active_for_patient(const std::string& slot_id,
                                                         const std::string& patient_id) {
    Statement stmt = db_.prepare(std::string("SELECT ") + kTokenColumns +
                                     " FROM tokens WHERE slot_id = ? AND patient_id = ?"
                                     " AND status IN " +
                                     kActiveStatuses + " LIMIT 1",
                                 {slot_id, patient_id});
    if (!stmt.step())
        return std::nullopt;
    return read_token(stmt);
}

std::vector<Token> TokenStore::query(const TokenQuery& query) {
    Statement stmt = db_.prepare(
        std::string("SELECT ") + kJoinedTokenColumns +
            " FROM tokens t JOIN slots s ON s.slot_id = t.slot_id"
            " WHERE (?1 = '' OR t.doctor_id = ?1)"
            "   AND (?2 = '' OR t.slot_id = ?2)"
            "   AND (?3 = '' OR t.patient_id = ?3)"
            "   AND (?4 = '' OR s.date >= ?4)"
            "   AND (?5 = '' OR s.date <= ?5)"
            " ORDER BY t.priority DESC, t.created_at ASC, t.token_id ASC",
        {query.doctor_id, query.slot_id, query.patient_id, query.date_from, query.date_to});

    std::vector<Token> tokens = read_all(stmt);
    if (!query.statuses.empty()) {
        std::erase_if(tokens, [&](const Token& token) {
            return std::find(query.statuses.begin(), query.statuses.end(), token.status) ==
                   query.statuses.end();
        });
    }
    return tokens;
}

} // namespace store
} // namespace opd
