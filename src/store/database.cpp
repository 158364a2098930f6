#include <opd/store/database.hpp>

#include "utils/logger.hpp"

#include <sqlite3.h>

namespace opd {
namespace store {

StoreError::StoreError(int result_code, const std::string& message)
    : std::runtime_error(message), result_code_(result_code) {}

bool StoreError::transient() const noexcept {
    int primary = result_code_ & 0xFF;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED)
        return true;
    return result_code_ == SQLITE_CONSTRAINT_UNIQUE ||
           result_code_ == SQLITE_CONSTRAINT_PRIMARYKEY;
}

VersionConflict::VersionConflict(const std::string& entity, const std::string& id,
                                 int64_t expected_version)
    : std::runtime_error(entity + " '" + id + "' was modified concurrently (expected version " +
                         std::to_string(expected_version) + ")"),
      entity_(entity), id_(id), expected_version_(expected_version) {}

// Statement

Statement::~Statement() {
    finalize();
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), unlock_(other.unlock_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
    other.unlock_ = false;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        finalize();
        db_ = other.db_;
        stmt_ = other.stmt_;
        unlock_ = other.unlock_;
        other.db_ = nullptr;
        other.stmt_ = nullptr;
        other.unlock_ = false;
    }
    return *this;
}

void Statement::finalize() {
    if (db_) {
        sqlite3_finalize(stmt_);
        if (unlock_)
            db_->unlock_shared();
    }
    db_ = nullptr;
    stmt_ = nullptr;
    unlock_ = false;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;

    int extended = sqlite3_extended_errcode(sqlite3_db_handle(stmt_));
    std::string message = sqlite3_errmsg(sqlite3_db_handle(stmt_));
    log_debug("SQLite step failed: ", message, " (", extended, ")");
    throw StoreError(extended, "SQLite error: " + message);
}

void Statement::run() {
    while (step()) {
    }
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_, index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string Statement::column_text(int index) const {
    const unsigned char *text = sqlite3_column_text(stmt_, index);
    if (!text)
        return {};
    return std::string(reinterpret_cast<const char *>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

// Database

Database::Database() {
    wait_root_.prev = &wait_root_;
    wait_root_.next = &wait_root_;
}

Database::~Database() {
    close();
}

void Database::open(const std::string& filename) {
    static const char *const pragmas = R"(
        PRAGMA locking_mode = NORMAL;
        PRAGMA foreign_keys = ON;
        PRAGMA synchronous = FULL;
    )";

    if (db_)
        throw std::logic_error("Database is already open");

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(filename.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError(rc, "SQLite failed to open '" + filename + "': " + message);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 15000);

    char *error = nullptr;
    if (sqlite3_exec(db_, pragmas, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        close();
        throw StoreError(SQLITE_ERROR, "SQLite failed to open '" + filename + "': " + message);
    }

    if (filename != ":memory:" && !filename.empty())
        exec_many("PRAGMA journal_mode = WAL;");

    log_debug("Opened database ", filename);
}

void Database::close() {
    if (!db_)
        return;
    if (sqlite3_close(db_) != SQLITE_OK) {
        log_error("Failed to close SQLite database: ", sqlite3_errmsg(db_));
        sqlite3_close_v2(db_);
    }
    db_ = nullptr;
}

Statement Database::prepare(const std::string& sql, std::initializer_list<Binding> bindings) {
    if (!db_)
        throw std::logic_error("Database is not open");

    lock_shared();

    Statement stmt;
    stmt.db_ = this;
    stmt.unlock_ = true;

    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt.stmt_,
                           nullptr) != SQLITE_OK) {
        int rc = sqlite3_extended_errcode(db_);
        std::string message = sqlite3_errmsg(db_);
        stmt.finalize();
        throw StoreError(rc, "SQLite request failed: " + message);
    }

    int index = 1;
    for (const Binding& binding : bindings) {
        std::visit(
            [&](const auto& value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    sqlite3_bind_null(stmt.stmt_, index);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    sqlite3_bind_int64(stmt.stmt_, index, value);
                } else if constexpr (std::is_same_v<T, double>) {
                    sqlite3_bind_double(stmt.stmt_, index, value);
                } else {
                    sqlite3_bind_text(stmt.stmt_, index, value.c_str(),
                                      static_cast<int>(value.size()), SQLITE_TRANSIENT);
                }
            },
            binding.value);
        index++;
    }

    return stmt;
}

int Database::run(const std::string& sql, std::initializer_list<Binding> bindings) {
    Statement stmt = prepare(sql, bindings);
    stmt.run();
    return sqlite3_changes(db_);
}

void Database::exec_many(const std::string& sql) {
    bool nested = lock_exclusive();
    ExclusiveUnlock unlock{this};
    (void)nested;

    char *error = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errmsg(db_);
        sqlite3_free(error);
        throw StoreError(sqlite3_extended_errcode(db_), "SQLite request failed: " + message);
    }
}

int Database::get_user_version() {
    Statement stmt = prepare("PRAGMA user_version");
    if (!stmt.step())
        throw StoreError(SQLITE_ERROR, "Missing user_version");
    return stmt.column_int(0);
}

void Database::set_user_version(int version) {
    exec_many("PRAGMA user_version = " + std::to_string(version) + ";");
}

bool Database::in_transaction() const {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    return running_exclusive_ && running_exclusive_thread_ == std::this_thread::get_id();
}

void Database::execute_raw(const char *sql) {
    char *error = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errmsg(db_);
        sqlite3_free(error);
        throw StoreError(sqlite3_extended_errcode(db_),
                         std::string("SQLite '") + sql + "' failed: " + message);
    }
}

void Database::rollback() noexcept {
    if (sqlite3_get_autocommit(db_))
        return;
    char *error = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &error) != SQLITE_OK) {
        log_error("SQLite rollback failed: ", error ? error : "unknown error");
        sqlite3_free(error);
    }
}

// Reentrant FIFO lock. Returns true when the calling thread already owns the
// exclusive lock.
bool Database::lock_exclusive() {
    std::unique_lock<std::mutex> lock(wait_mutex_);

    if (running_exclusive_) {
        if (running_exclusive_thread_ == std::this_thread::get_id()) {
            running_exclusive_++;
            return true;
        }
        wait(lock, false);
    } else if (running_shared_) {
        wait(lock, false);
    } else if (wait_root_.next != &wait_root_) {
        wait(lock, false);
    }

    running_exclusive_ = 1;
    running_exclusive_thread_ = std::this_thread::get_id();

    return false;
}

void Database::unlock_exclusive() {
    std::lock_guard<std::mutex> lock(wait_mutex_);

    running_exclusive_--;
    if (!running_exclusive_)
        running_exclusive_thread_ = std::thread::id();
    wake_up_waiters();
}

void Database::lock_shared() {
    std::unique_lock<std::mutex> lock(wait_mutex_);

    if (running_exclusive_) {
        if (running_exclusive_thread_ == std::this_thread::get_id()) {
            running_shared_++;
            return;
        }
        wait(lock, true);
    } else if (wait_root_.next != &wait_root_) {
        wait(lock, true);
    }

    running_shared_++;
}

void Database::unlock_shared() {
    std::lock_guard<std::mutex> lock(wait_mutex_);

    running_shared_--;
    wake_up_waiters();
}

void Database::wait(std::unique_lock<std::mutex>& lock, bool shared) {
    LockWaiter waiter;

    waiter.next = &wait_root_;
    waiter.prev = wait_root_.prev;
    wait_root_.prev->next = &waiter;
    wait_root_.prev = &waiter;

    waiter.shared = shared;

    do {
        wait_cv_.wait(lock);
    } while (!waiter.run);

    waiter.prev->next = waiter.next;
    waiter.next->prev = waiter.prev;
}

void Database::wake_up_waiters() {
    if (running_exclusive_ || running_shared_)
        return;

    LockWaiter *waiter = wait_root_.next;
    if (waiter == &wait_root_)
        return;

    waiter->run = true;

    if (waiter->shared) {
        waiter = waiter->next;
        while (waiter != &wait_root_ && waiter->shared) {
            waiter->run = true;
            waiter = waiter->next;
        }
    }

    wait_cv_.notify_all();
}

} // namespace store
} // namespace opd
