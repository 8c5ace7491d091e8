// habitrack kernel: SqliteSession / Statement implementation
#include "kernel/sqlite_session.hpp"

#include <sqlite3.h>

#include <iostream>

#include "ht_types.hpp"

namespace ht {

static std::string describe(sqlite3* db, const std::string& what) {
    std::string msg = what;
    if (db) {
        msg += ": ";
        msg += sqlite3_errmsg(db);
    }
    return msg;
}

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        std::string msg = describe(db_, std::string("Failed to prepare statement '") + sql + "'");
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw HabitError(HabitErrc::Storage, msg);
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::bind(int index, std::int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        throw HabitError(HabitErrc::Storage, describe(db_, "Failed to bind parameter"));
    }
}

void Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw HabitError(HabitErrc::Storage, describe(db_, "Failed to bind parameter"));
    }
}

Statement::Step Statement::step() {
    int rc = sqlite3_step(stmt_);
    switch (rc) {
        case SQLITE_ROW: return Step::Row;
        case SQLITE_DONE: return Step::Done;
        case SQLITE_CONSTRAINT: return Step::Constraint;
        default: break;
    }
    throw HabitError(HabitErrc::Storage, describe(db_, "Statement failed"));
}

void Statement::run() {
    if (step() != Step::Done) {
        throw HabitError(HabitErrc::Storage, describe(db_, "Statement did not complete"));
    }
}

std::int64_t Statement::column_int64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return std::string();
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

SqliteSession::SqliteSession(const std::string& path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = describe(db_, "Can't open database '" + path + "'");
        sqlite3_close(db_);
        db_ = nullptr;
        throw HabitError(HabitErrc::Storage, msg);
    }
    sqlite3_busy_timeout(db_, 2000);
    try {
        exec("PRAGMA foreign_keys = ON;");
        exec("BEGIN IMMEDIATE;");
        in_transaction_ = true;
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteSession::~SqliteSession() {
    if (!db_) return;
    if (in_transaction_) {
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            std::cerr << "Warning: rollback failed: " << sqlite3_errmsg(db_) << std::endl;
        }
    }
    sqlite3_close(db_);
}

void SqliteSession::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = std::string("SQL error in '") + sql + "': " + (err ? err : "unknown");
        sqlite3_free(err);
        throw HabitError(HabitErrc::Storage, msg);
    }
}

void SqliteSession::commit() {
    exec("COMMIT;");
    in_transaction_ = false;
}

std::int64_t SqliteSession::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

} // namespace ht
