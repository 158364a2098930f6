#pragma once

#include <opd/core/records.hpp>
#include <opd/store/database.hpp>

#include <optional>
#include <string>
#include <vector>

namespace opd {
namespace store {

/**
 * @brief Filter for TokenStore::query
 *
 * Date bounds apply to the date of the slot a token belongs to. An empty
 * status list matches every status.
 */
struct TokenQuery {
    std::string doctor_id;
    std::string slot_id;
    std::string patient_id;
    std::string date_from;
    std::string date_to;
    std::vector<TokenStatus> statuses;
};

/**
 * @brief Persistent tokens with version-checked updates
 */
class TokenStore {
public:
    using record_type = Token;

    explicit TokenStore(Database& db) : db_(db) {}

    void insert(const Token& token);

    std::optional<Token> load(const std::string& token_id);

    /**
     * @brief Load a token or throw TOKEN_NOT_FOUND
     */
    Token get(const std::string& token_id);

    /**
     * @brief Conditional update on the stored version; bumps token.version
     *
     * @throws VersionConflict when the stored version moved on
     */
    void save(Token& token);

    /**
     * @brief Tokens occupying capacity in a slot, cheapest to displace
     * first: priority ascending, then newest first, then token id descending
     */
    std::vector<Token> active_in_slot(const std::string& slot_id);

    /**
     * @brief Every token of a slot ordered by token number
     */
    std::vector<Token> in_slot(const std::string& slot_id);

    int count_active(const std::string& slot_id);

    std::optional<Token> find_active_for_patient(const std::string& slot_id,
                                                 const std::string& patient_id);

    /**
     * @brief Matching tokens, highest priority first, ties broken by
     * earlier creation then smaller token id
     */
    std::vector<Token> query(const TokenQuery& query);

    static const char *entity_name() {
        return "token";
    }

private:
    Database& db_;
};

} // namespace store
} // namespace opd
