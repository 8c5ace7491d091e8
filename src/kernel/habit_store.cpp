// habitrack kernel: HabitStore implementation
#include "kernel/habit_store.hpp"

#include <optional>
#include <utility>

#include "calendar_date.hpp"
#include "kernel/sqlite_session.hpp"

namespace ht {

namespace {

const char* kCreateHabits = R"(
    CREATE TABLE IF NOT EXISTS habits (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        name TEXT NOT NULL UNIQUE
    );
)";

const char* kCreateRecords = R"(
    CREATE TABLE IF NOT EXISTS records (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        habit_id INTEGER NOT NULL,
        date DATE NOT NULL,
        FOREIGN KEY (habit_id)
            REFERENCES habits (id)
            ON DELETE CASCADE,
        UNIQUE (habit_id, date)
    );
)";

std::optional<Habit> select_habit(SqliteSession& s, std::int64_t id) {
    Statement st(s.handle(), "SELECT id, name FROM habits WHERE id = ?;");
    st.bind(1, id);
    if (st.step() != Statement::Step::Row) return std::nullopt;
    return Habit{st.column_int64(0), st.column_text(1)};
}

std::optional<Record> select_record(SqliteSession& s, std::int64_t id) {
    Statement st(s.handle(), "SELECT id, habit_id, date FROM records WHERE id = ?;");
    st.bind(1, id);
    if (st.step() != Statement::Step::Row) return std::nullopt;
    return Record{st.column_int64(0), st.column_int64(1), st.column_text(2)};
}

// Trimmed, non-empty name or an InvalidInput message.
std::optional<std::string> normalize_name(const std::string& raw, std::string& error) {
    std::string name = trim_copy(raw);
    if (name.empty()) {
        error = "Habit cannot be empty";
        return std::nullopt;
    }
    return name;
}

std::optional<std::string> normalize_date(const std::string& raw, std::string& error) {
    std::string date = trim_copy(raw);
    if (date.empty()) {
        error = "Date cannot be empty";
        return std::nullopt;
    }
    if (!parse_iso_date(date)) {
        error = "Invalid date '" + date + "', expected YYYY-MM-DD";
        return std::nullopt;
    }
    return date;
}

std::string habit_not_found(std::int64_t id) {
    return "Habit not found (id " + std::to_string(id) + ")";
}

std::string record_not_found(std::int64_t id) {
    return "Record not found (id " + std::to_string(id) + ")";
}

} // namespace

HabitStore::HabitStore(std::string db_path) : db_path_(std::move(db_path)) {
    init_schema();
}

void HabitStore::init_schema() {
    SqliteSession s(db_path_);
    s.exec(kCreateHabits);
    s.exec(kCreateRecords);
    s.commit();
}

Result<Habit> HabitStore::create_habit(const std::string& name) {
    std::string error;
    auto clean = normalize_name(name, error);
    if (!clean) return Result<Habit>::Fail(HabitErrc::InvalidInput, error);

    SqliteSession s(db_path_);
    Statement st(s.handle(), "INSERT INTO habits (name) VALUES (?);");
    st.bind(1, *clean);
    if (st.step() == Statement::Step::Constraint) {
        return Result<Habit>::Fail(HabitErrc::AlreadyExists, "Habit already exists: " + *clean);
    }
    Habit habit{s.last_insert_rowid(), *clean};
    s.commit();
    return Result<Habit>::Ok(habit);
}

Result<Habit> HabitStore::find_habit_by_name(const std::string& name) const {
    std::string clean = trim_copy(name);
    SqliteSession s(db_path_);
    Statement st(s.handle(), "SELECT id, name FROM habits WHERE name = ?;");
    st.bind(1, clean);
    if (st.step() != Statement::Step::Row) {
        return Result<Habit>::Fail(HabitErrc::NotFound, "Habit not found: " + clean);
    }
    return Result<Habit>::Ok(Habit{st.column_int64(0), st.column_text(1)});
}

Result<Habit> HabitStore::find_habit_by_id(std::int64_t id) const {
    SqliteSession s(db_path_);
    auto habit = select_habit(s, id);
    if (!habit) return Result<Habit>::Fail(HabitErrc::NotFound, habit_not_found(id));
    return Result<Habit>::Ok(*habit);
}

std::vector<Habit> HabitStore::list_habits() const {
    SqliteSession s(db_path_);
    Statement st(s.handle(), "SELECT id, name FROM habits ORDER BY name;");
    std::vector<Habit> out;
    while (st.step() == Statement::Step::Row) {
        out.push_back(Habit{st.column_int64(0), st.column_text(1)});
    }
    return out;
}

Result<Habit> HabitStore::rename_habit(std::int64_t id, const std::string& new_name) {
    std::string error;
    auto clean = normalize_name(new_name, error);
    if (!clean) return Result<Habit>::Fail(HabitErrc::InvalidInput, error);

    SqliteSession s(db_path_);
    if (!select_habit(s, id)) return Result<Habit>::Fail(HabitErrc::NotFound, habit_not_found(id));

    Statement st(s.handle(), "UPDATE habits SET name = ? WHERE id = ?;");
    st.bind(1, *clean);
    st.bind(2, id);
    if (st.step() == Statement::Step::Constraint) {
        return Result<Habit>::Fail(HabitErrc::AlreadyExists, "Habit already exists: " + *clean);
    }
    s.commit();
    return Result<Habit>::Ok(Habit{id, *clean});
}

Result<Habit> HabitStore::delete_habit(std::int64_t id) {
    SqliteSession s(db_path_);
    auto habit = select_habit(s, id);
    if (!habit) return Result<Habit>::Fail(HabitErrc::NotFound, habit_not_found(id));

    // Files written by older builds may lack ON DELETE CASCADE.
    Statement records(s.handle(), "DELETE FROM records WHERE habit_id = ?;");
    records.bind(1, id);
    records.run();
    Statement st(s.handle(), "DELETE FROM habits WHERE id = ?;");
    st.bind(1, id);
    st.run();
    s.commit();
    return Result<Habit>::Ok(*habit);
}

Result<Record> HabitStore::create_record(std::int64_t habit_id, const std::string& date) {
    std::string error;
    auto clean = normalize_date(date, error);
    if (!clean) return Result<Record>::Fail(HabitErrc::InvalidInput, error);

    SqliteSession s(db_path_);
    if (!select_habit(s, habit_id)) {
        return Result<Record>::Fail(HabitErrc::NotFound, habit_not_found(habit_id));
    }
    Statement st(s.handle(), "INSERT INTO records (habit_id, date) VALUES (?, ?);");
    st.bind(1, habit_id);
    st.bind(2, *clean);
    if (st.step() == Statement::Step::Constraint) {
        return Result<Record>::Fail(HabitErrc::AlreadyExists, "Record already exists: " + *clean);
    }
    Record record{s.last_insert_rowid(), habit_id, *clean};
    s.commit();
    return Result<Record>::Ok(record);
}

Result<std::vector<Record>> HabitStore::list_records(std::int64_t habit_id) const {
    SqliteSession s(db_path_);
    if (!select_habit(s, habit_id)) {
        return Result<std::vector<Record>>::Fail(HabitErrc::NotFound, habit_not_found(habit_id));
    }
    Statement st(s.handle(),
                 "SELECT id, habit_id, date FROM records WHERE habit_id = ? ORDER BY date DESC;");
    st.bind(1, habit_id);
    std::vector<Record> out;
    while (st.step() == Statement::Step::Row) {
        out.push_back(Record{st.column_int64(0), st.column_int64(1), st.column_text(2)});
    }
    return Result<std::vector<Record>>::Ok(std::move(out));
}

Result<Record> HabitStore::find_record_by_date(std::int64_t habit_id, const std::string& date) const {
    std::string error;
    auto clean = normalize_date(date, error);
    if (!clean) return Result<Record>::Fail(HabitErrc::InvalidInput, error);

    SqliteSession s(db_path_);
    Statement st(s.handle(),
                 "SELECT id, habit_id, date FROM records WHERE habit_id = ? AND date = ?;");
    st.bind(1, habit_id);
    st.bind(2, *clean);
    if (st.step() != Statement::Step::Row) {
        return Result<Record>::Fail(HabitErrc::NotFound, "Record not found: " + *clean);
    }
    return Result<Record>::Ok(Record{st.column_int64(0), st.column_int64(1), st.column_text(2)});
}

Result<Record> HabitStore::find_record_by_id(std::int64_t id) const {
    SqliteSession s(db_path_);
    auto record = select_record(s, id);
    if (!record) return Result<Record>::Fail(HabitErrc::NotFound, record_not_found(id));
    return Result<Record>::Ok(*record);
}

Result<Record> HabitStore::update_record(std::int64_t id, const std::string& new_date) {
    std::string error;
    auto clean = normalize_date(new_date, error);
    if (!clean) return Result<Record>::Fail(HabitErrc::InvalidInput, error);

    SqliteSession s(db_path_);
    auto record = select_record(s, id);
    if (!record) return Result<Record>::Fail(HabitErrc::NotFound, record_not_found(id));

    Statement st(s.handle(), "UPDATE records SET date = ? WHERE id = ?;");
    st.bind(1, *clean);
    st.bind(2, id);
    if (st.step() == Statement::Step::Constraint) {
        return Result<Record>::Fail(HabitErrc::AlreadyExists, "Record already exists: " + *clean);
    }
    s.commit();
    record->date = *clean;
    return Result<Record>::Ok(*record);
}

Result<Record> HabitStore::delete_record(std::int64_t id) {
    SqliteSession s(db_path_);
    auto record = select_record(s, id);
    if (!record) return Result<Record>::Fail(HabitErrc::NotFound, record_not_found(id));

    Statement st(s.handle(), "DELETE FROM records WHERE id = ?;");
    st.bind(1, id);
    st.run();
    s.commit();
    return Result<Record>::Ok(*record);
}

Result<std::vector<std::string>> HabitStore::record_dates(std::int64_t habit_id) const {
    auto records = list_records(habit_id);
    if (!records) {
        return Result<std::vector<std::string>>::Fail(records.code(), records.message());
    }
    std::vector<std::string> dates;
    dates.reserve(records->size());
    for (const auto& r : *records) dates.push_back(r.date);
    return Result<std::vector<std::string>>::Ok(std::move(dates));
}

} // namespace ht
