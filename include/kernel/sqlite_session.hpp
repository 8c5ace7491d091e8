// habitrack kernel: scoped SQLite connection + transaction
#pragma once

#include <cstdint>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace ht {

// One prepared statement, finalized on destruction.
class Statement {
public:
    enum class Step { Row, Done, Constraint };

    Statement(sqlite3* db, const char* sql);
    ~Statement();
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, std::int64_t value);
    void bind(int index, const std::string& value);

    // Row / Done / Constraint; any other result code throws HabitError.
    Step step();
    // Steps a statement that returns no rows; anything but Done throws.
    void run();

    std::int64_t column_int64(int col) const;
    std::string column_text(int col) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// Opens the database, enables foreign keys and begins an immediate
// transaction. The destructor rolls back unless commit() succeeded, then
// closes the connection.
class SqliteSession {
public:
    explicit SqliteSession(const std::string& path);
    ~SqliteSession();
    SqliteSession(const SqliteSession&) = delete;
    SqliteSession& operator=(const SqliteSession&) = delete;

    void exec(const char* sql);
    void commit();

    std::int64_t last_insert_rowid() const;
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    bool in_transaction_ = false;
};

} // namespace ht
