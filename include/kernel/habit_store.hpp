// habitrack kernel: persistent habit / record store
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ht_types.hpp"

namespace ht {

// CRUD over the habits and records tables of one SQLite file.
//
// The schema is created once by the constructor. Every operation then opens
// its own SqliteSession, so nothing is held between calls and each mutation
// either commits entirely or rolls back. Expected outcomes (bad input, name
// or date conflicts, stale ids) come back as Result codes; anything else
// throws HabitError(HabitErrc::Storage).
class HabitStore {
public:
    explicit HabitStore(std::string db_path);

    // Habits
    Result<Habit> create_habit(const std::string& name);
    Result<Habit> find_habit_by_name(const std::string& name) const;
    Result<Habit> find_habit_by_id(std::int64_t id) const;
    std::vector<Habit> list_habits() const;
    Result<Habit> rename_habit(std::int64_t id, const std::string& new_name);
    // Removes the habit together with all of its records.
    Result<Habit> delete_habit(std::int64_t id);

    // Records (one per habit and date)
    Result<Record> create_record(std::int64_t habit_id, const std::string& date);
    Result<std::vector<Record>> list_records(std::int64_t habit_id) const;
    Result<Record> find_record_by_date(std::int64_t habit_id, const std::string& date) const;
    Result<Record> find_record_by_id(std::int64_t id) const;
    Result<Record> update_record(std::int64_t id, const std::string& new_date);
    Result<Record> delete_record(std::int64_t id);

    Result<std::vector<std::string>> record_dates(std::int64_t habit_id) const;

private:
    void init_schema();

    std::string db_path_;
};

} // namespace ht
