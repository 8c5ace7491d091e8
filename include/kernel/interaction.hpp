// habitrack kernel: Interaction API between CLI and store
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "kernel/habit_store.hpp"
#include "streak.hpp"

namespace ht {

// Minimal interaction facade to decouple frontends from the store.
class InteractionService {
public:
    explicit InteractionService(HabitStore& store) : store_(store) {}

    // Habits
    Result<Habit> cmd_create_habit(const std::string& name) { return store_.create_habit(name); }
    Result<Habit> cmd_find_habit(const std::string& name) const { return store_.find_habit_by_name(name); }
    Result<Habit> cmd_habit(std::int64_t id) const { return store_.find_habit_by_id(id); }
    std::vector<Habit> cmd_list_habits() const { return store_.list_habits(); }
    Result<Habit> cmd_rename_habit(std::int64_t id, const std::string& name) { return store_.rename_habit(id, name); }
    Result<Habit> cmd_delete_habit(std::int64_t id) { return store_.delete_habit(id); }

    // Records
    Result<Record> cmd_create_record(std::int64_t habit_id, const std::string& date) {
        return store_.create_record(habit_id, date);
    }
    Result<std::vector<Record>> cmd_list_records(std::int64_t habit_id) const { return store_.list_records(habit_id); }
    Result<Record> cmd_find_record(std::int64_t habit_id, const std::string& date) const {
        return store_.find_record_by_date(habit_id, date);
    }
    Result<Record> cmd_record(std::int64_t id) const { return store_.find_record_by_id(id); }
    Result<Record> cmd_update_record(std::int64_t id, const std::string& date) { return store_.update_record(id, date); }
    Result<Record> cmd_delete_record(std::int64_t id) { return store_.delete_record(id); }

    // Longest streak of the habit's logged days.
    Result<int> cmd_longest_streak(std::int64_t habit_id) const {
        auto dates = store_.record_dates(habit_id);
        if (!dates) return Result<int>::Fail(dates.code(), dates.message());
        return longest_streak(*dates);
    }

private:
    HabitStore& store_;
};

} // namespace ht
