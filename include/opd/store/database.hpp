#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

struct sqlite3;
struct sqlite3_stmt;

namespace opd {
namespace store {

/**
 * @brief SQLite failure with its extended result code
 */
class StoreError : public std::runtime_error {
public:
    StoreError(int result_code, const std::string& message);

    int result_code() const noexcept {
        return result_code_;
    }

    /**
     * @brief Busy or locked database, or a unique-key write conflict
     */
    bool transient() const noexcept;

private:
    int result_code_;
};

/**
 * @brief Conditional write found a different version than the one read
 */
class VersionConflict : public std::runtime_error {
public:
    VersionConflict(const std::string& entity, const std::string& id, int64_t expected_version);

    const std::string& entity() const noexcept {
        return entity_;
    }
    const std::string& id() const noexcept {
        return id_;
    }
    int64_t expected_version() const noexcept {
        return expected_version_;
    }

private:
    std::string entity_;
    std::string id_;
    int64_t expected_version_;
};

/**
 * @brief A value bound to a statement parameter
 */
struct Binding {
    std::variant<std::nullptr_t, int64_t, double, std::string> value;

    Binding() : value(nullptr) {}
    Binding(std::nullptr_t) : value(nullptr) {}
    Binding(int i) : value(static_cast<int64_t>(i)) {}
    Binding(int64_t i) : value(i) {}
    Binding(size_t i) : value(static_cast<int64_t>(i)) {}
    Binding(bool b) : value(static_cast<int64_t>(b ? 1 : 0)) {}
    Binding(double d) : value(d) {}
    Binding(const char *str) : value(std::string(str)) {}
    Binding(std::string str) : value(std::move(str)) {}
    Binding(std::string_view str) : value(std::string(str)) {}
};

class Database;

/**
 * @brief Prepared statement holding a shared lock on its database until
 * finalized
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    /**
     * @brief Advance to the next row
     * @return true when a row is available
     */
    bool step();

    /**
     * @brief Execute to completion, ignoring any rows
     */
    void run();

    void finalize();

    int64_t column_int64(int index) const;
    int column_int(int index) const;
    double column_double(int index) const;
    std::string column_text(int index) const;
    bool column_is_null(int index) const;

private:
    friend class Database;

    Database *db_ = nullptr;
    sqlite3_stmt *stmt_ = nullptr;
    bool unlock_ = false;
};

/**
 * @brief RAII SQLite connection shared by every store
 *
 * Access is serialized by a reentrant FIFO lock: transactions take it
 * exclusively, statements outside a transaction take it shared. A thread
 * that holds the exclusive lock may nest transactions and statements.
 */
class Database {
public:
    Database();
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open or create a database file (":memory:" for a private
     * in-memory database)
     */
    void open(const std::string& filename);
    void close();

    bool is_open() const {
        return db_ != nullptr;
    }

    Statement prepare(const std::string& sql, std::initializer_list<Binding> bindings = {});

    /**
     * @brief Prepare, bind and run a statement
     * @return number of rows changed
     */
    int run(const std::string& sql, std::initializer_list<Binding> bindings = {});

    /**
     * @brief Execute several statements without bindings
     */
    void exec_many(const std::string& sql);

    int get_user_version();
    void set_user_version(int version);

    /**
     * @brief Run @p func inside BEGIN IMMEDIATE ... COMMIT
     *
     * Any exception rolls the transaction back and propagates. Nested calls
     * from the owning thread join the outer transaction.
     */
    template <typename F>
    auto transaction(F&& func) -> std::invoke_result_t<F&> {
        bool nested = lock_exclusive();
        ExclusiveUnlock unlock{this};

        if (nested)
            return func();

        execute_raw("BEGIN IMMEDIATE TRANSACTION");
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<F&>>) {
                func();
                execute_raw("COMMIT");
            } else {
                auto result = func();
                execute_raw("COMMIT");
                return result;
            }
        } catch (...) {
            rollback();
            throw;
        }
    }

    /**
     * @brief True when the calling thread is inside transaction()
     */
    bool in_transaction() const;

private:
    friend class Statement;

    struct ExclusiveUnlock {
        Database *db;
        ~ExclusiveUnlock() {
            db->unlock_exclusive();
        }
    };

    struct LockWaiter {
        LockWaiter *prev = nullptr;
        LockWaiter *next = nullptr;
        bool shared = false;
        bool run = false;
    };

    void execute_raw(const char *sql);
    void rollback() noexcept;

    bool lock_exclusive();
    void unlock_exclusive();
    void lock_shared();
    void unlock_shared();
    void wait(std::unique_lock<std::mutex>& lock, bool shared);
    void wake_up_waiters();

    sqlite3 *db_ = nullptr;

    mutable std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    int running_exclusive_ = 0;
    std::thread::id running_exclusive_thread_;
    int running_shared_ = 0;
    LockWaiter wait_root_;
};

} // namespace store
} // namespace opd
