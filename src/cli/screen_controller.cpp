#include "cli/screen_controller.hpp"

#include <numeric>
#include <utility>

#include "calendar_date.hpp"
#include "cli/ask.hpp"
#include "cli/live_filter.hpp"
#include "cli/pager.hpp"

namespace ht {

namespace {

const char* kListHint = "ESC = Back | ENTER = Select";
const char* kMenuHint = "ESC = Back | ENTER = Confirm";

ScreenState Go(ScreenId id, std::optional<Habit> habit = std::nullopt,
               std::optional<Record> record = std::nullopt, std::string status = "") {
    ScreenState s;
    s.id = id;
    s.habit = std::move(habit);
    s.record = std::move(record);
    s.status = std::move(status);
    return s;
}

std::string Join(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    return a + " | " + b;
}

std::string PageLabel(std::size_t page, std::size_t count) {
    return "Page " + std::to_string(page + 1) + " of " + std::to_string(count);
}

} // namespace

ScreenController::ScreenController(InteractionService& svc, const CliConfig& config,
                                   KeySource& keys, std::istream& in, std::ostream& out)
    : svc_(svc), config_(config), keys_(keys), in_(in), out_(out) {}

int ScreenController::Run(ScreenState start) {
    ScreenState state = std::move(start);
    while (state.id != ScreenId::Exit) {
        state = Step(state);
    }
    return 0;
}

ScreenState ScreenController::Step(const ScreenState& state) {
    bool needs_record = state.id == ScreenId::RecordMenu || state.id == ScreenId::UpdateRecord ||
                        state.id == ScreenId::DeleteRecord;
    bool needs_habit = needs_record || state.id == ScreenId::HabitMenu ||
                       state.id == ScreenId::RenameHabit || state.id == ScreenId::DeleteHabit ||
                       state.id == ScreenId::AddRecord || state.id == ScreenId::SelectRecord;
    if ((needs_habit && !state.habit) || (needs_record && !state.record)) {
        return Go(ScreenId::MainMenu);
    }
    try {
        switch (state.id) {
            case ScreenId::MainMenu: return MainMenu(state);
            case ScreenId::AddHabit: return AddHabit(state);
            case ScreenId::SearchHabits: return SearchHabits(state);
            case ScreenId::SelectHabit: return SelectHabit(state);
            case ScreenId::HabitMenu: return HabitMenu(state);
            case ScreenId::RenameHabit: return RenameHabit(state);
            case ScreenId::DeleteHabit: return DeleteHabit(state);
            case ScreenId::AddRecord: return AddRecord(state);
            case ScreenId::SelectRecord: return SelectRecord(state);
            case ScreenId::RecordMenu: return RecordMenu(state);
            case ScreenId::UpdateRecord: return UpdateRecord(state);
            case ScreenId::DeleteRecord: return DeleteRecord(state);
            case ScreenId::Exit: return state;
        }
    } catch (const HabitError& e) {
        return Go(ScreenId::MainMenu, std::nullopt, std::nullopt, std::string("Error: ") + e.what());
    }
    return Go(ScreenId::MainMenu);
}

void ScreenController::Draw(const Frame& frame) {
    DrawFrame(out_, frame, config_.screen_width);
}

int ScreenController::ChooseOption(Frame frame, const std::vector<std::string>& options) {
    std::vector<std::size_t> indices(options.size());
    std::iota(indices.begin(), indices.end(), 0);
    Pager<std::size_t> pager(std::move(indices), options.size());
    frame.lines = options;
    frame.key_hint = kMenuHint;
    auto choice = RunPager(pager, keys_, [&](const Pager<std::size_t>& p) {
        frame.selected = static_cast<int>(p.selected_index());
        Draw(frame);
    });
    switch (choice.outcome) {
        case SelectOutcome::Selected: return static_cast<int>(*choice.item);
        case SelectOutcome::Interrupted: return -2;
        default: return -1;
    }
}

// -----------------------------------------------------------------------------
// Habits
// -----------------------------------------------------------------------------
ScreenState ScreenController::MainMenu(const ScreenState& state) {
    Frame frame;
    frame.title = "Habit Tracker";
    frame.status = state.status;
    switch (ChooseOption(frame, {"Add a new habit", "View habits", "Search habits", "Exit"})) {
        case 0: return Go(ScreenId::AddHabit);
        case 1: return Go(ScreenId::SelectHabit);
        case 2: return Go(ScreenId::SearchHabits);
        default: return Go(ScreenId::Exit);
    }
}

ScreenState ScreenController::AddHabit(const ScreenState& state) {
    Frame frame;
    frame.title = "Add a new habit";
    frame.status = state.status;
    Draw(frame);
    auto name = ask(in_, out_, "Enter a new habit", "");
    if (!name) return Go(ScreenId::Exit);

    auto created = svc_.cmd_create_habit(*name);
    if (created) return Go(ScreenId::HabitMenu, *created, std::nullopt, "Habit added successfully");
    if (created.code() == HabitErrc::AlreadyExists) {
        auto existing = svc_.cmd_find_habit(*name);
        if (existing) return Go(ScreenId::HabitMenu, *existing, std::nullopt, "Habit already exists!");
        return Go(ScreenId::MainMenu, std::nullopt, std::nullopt, "Error: " + existing.message());
    }
    return Go(ScreenId::MainMenu, std::nullopt, std::nullopt, "Error: " + created.message());
}

ScreenState ScreenController::SelectHabit(const ScreenState& state) {
    Pager<Habit> pager(svc_.cmd_list_habits(), static_cast<std::size_t>(config_.page_size));
    Frame frame;
    frame.title = "My Habits";
    frame.key_hint = kListHint;
    frame.status = state.status;
    auto choice = RunPager(pager, keys_, [&](const Pager<Habit>& p) {
        frame.page_label = PageLabel(p.current_page(), p.page_count());
        frame.lines.clear();
        for (const auto& h : p.page_items()) frame.lines.push_back(h.name);
        frame.selected = static_cast<int>(p.selected_index());
        Draw(frame);
    });
    switch (choice.outcome) {
        case SelectOutcome::Selected: return Go(ScreenId::HabitMenu, *choice.item);
        case SelectOutcome::NoItems:
            return Go(ScreenId::MainMenu, std::nullopt, std::nullopt, Join(state.status, "No habits found!"));
        case SelectOutcome::Interrupted: return Go(ScreenId::Exit);
        case SelectOutcome::Cancelled: break;
    }
    return Go(ScreenId::MainMenu);
}

ScreenState ScreenController::SearchHabits(const ScreenState& state) {
    auto habits = svc_.cmd_list_habits();
    if (habits.empty()) return Go(ScreenId::MainMenu, std::nullopt, std::nullopt, "No habits found!");

    LiveFilter<Habit> filter(std::move(habits), [](const Habit& h) { return h.name; },
                             static_cast<std::size_t>(config_.filter_limit));
    Frame frame;
    frame.title = "Search habits";
    frame.key_hint = kListHint;
    frame.empty_text = "No matching habits";
    frame.status = state.status;
    auto choice = RunLiveFilter(filter, keys_, [&](const LiveFilter<Habit>& f) {
        frame.input_line = "Habit: " + f.query();
        frame.lines = f.match_labels();
        frame.selected = static_cast<int>(f.selected_index());
        Draw(frame);
    });
    switch (choice.outcome) {
        case SelectOutcome::Selected: return Go(ScreenId::HabitMenu, *choice.item);
        case SelectOutcome::Interrupted: return Go(ScreenId::Exit);
        default: break;
    }
    return Go(ScreenId::MainMenu);
}

ScreenState ScreenController::HabitMenu(const ScreenState& state) {
    auto habit = svc_.cmd_habit(state.habit->id);
    if (!habit) return Go(ScreenId::SelectHabit, std::nullopt, std::nullopt, "Error: " + habit.message());

    auto streak = svc_.cmd_longest_streak(habit->id);
    Frame frame;
    frame.title = "Habit: " + habit->name;
    frame.subtitle.push_back(streak ? "Longest streak: " + std::to_string(*streak) + " days"
                                    : "Longest streak: unavailable (" + streak.message() + ")");
    frame.status = state.status;
    switch (ChooseOption(frame, {"Add a new record", "View records", "Rename habit", "Delete habit", "Back"})) {
        case 0: return Go(ScreenId::AddRecord, *habit);
        case 1: return Go(ScreenId::SelectRecord, *habit);
        case 2: return Go(ScreenId::RenameHabit, *habit);
        case 3: return Go(ScreenId::DeleteHabit, *habit);
        case -2: return Go(ScreenId::Exit);
        default: return Go(ScreenId::SelectHabit);
    }
}

ScreenState ScreenController::RenameHabit(const ScreenState& state) {
    const Habit& habit = *state.habit;
    Frame frame;
    frame.title = "Rename Habit: " + habit.name;
    Draw(frame);
    auto name = ask(in_, out_, "Enter the new name of the habit", "");
    if (!name) return Go(ScreenId::Exit);

    auto renamed = svc_.cmd_rename_habit(habit.id, *name);
    if (renamed) return Go(ScreenId::HabitMenu, *renamed, std::nullopt, "Habit renamed successfully");
    switch (renamed.code()) {
        case HabitErrc::AlreadyExists: return Go(ScreenId::HabitMenu, habit, std::nullopt, "Habit already exists!");
        case HabitErrc::NotFound: return Go(ScreenId::SelectHabit, std::nullopt, std::nullopt, "Error: " + renamed.message());
        default: break;
    }
    return Go(ScreenId::HabitMenu, habit, std::nullopt, "Error: " + renamed.message());
}

ScreenState ScreenController::DeleteHabit(const ScreenState& state) {
    const Habit& habit = *state.habit;
    Frame frame;
    frame.title = "Delete Habit: " + habit.name;
    Draw(frame);
    auto confirmed = ask_yesno(in_, out_, "Delete '" + habit.name + "' and all of its records?", false);
    if (!confirmed) return Go(ScreenId::Exit);
    if (!*confirmed) return Go(ScreenId::HabitMenu, habit, std::nullopt, "Habit kept");

    auto deleted = svc_.cmd_delete_habit(habit.id);
    if (deleted) return Go(ScreenId::SelectHabit, std::nullopt, std::nullopt, "Habit deleted successfully");
    return Go(ScreenId::SelectHabit, std::nullopt, std::nullopt, "Error: " + deleted.message());
}

// -----------------------------------------------------------------------------
// Records
// -----------------------------------------------------------------------------
ScreenState ScreenController::AddRecord(const ScreenState& state) {
    const Habit& habit = *state.habit;
    std::string def = config_.default_record_date == "today" ? today_local().to_iso() : std::string();
    std::string status = state.status;
    while (true) {
        Frame frame;
        frame.title = "Add a new record";
        frame.subtitle.push_back("Habit: " + habit.name);
        frame.status = status;
        Draw(frame);
        auto date = ask(in_, out_, "Enter the date of the record (YYYY-MM-DD)", def);
        if (!date) return Go(ScreenId::Exit);

        auto created = svc_.cmd_create_record(habit.id, *date);
        if (created) return Go(ScreenId::RecordMenu, habit, *created, "Record added successfully");
        switch (created.code()) {
            case HabitErrc::InvalidInput:
                status = "Invalid date format! Please use the format YYYY-MM-DD";
                continue;
            case HabitErrc::AlreadyExists: {
                auto existing = svc_.cmd_find_record(habit.id, *date);
                if (existing) return Go(ScreenId::RecordMenu, habit, *existing, "Record already exists!");
                return Go(ScreenId::HabitMenu, habit, std::nullopt, "Error: " + existing.message());
            }
            default: break;
        }
        return Go(ScreenId::SelectHabit, std::nullopt, std::nullopt, "Error: " + created.message());
    }
}

ScreenState ScreenController::SelectRecord(const ScreenState& state) {
    const Habit& habit = *state.habit;
    auto records = svc_.cmd_list_records(habit.id);
    if (!records) return Go(ScreenId::SelectHabit, std::nullopt, std::nullopt, "Error: " + records.message());

    Pager<Record> pager(std::move(*records), static_cast<std::size_t>(config_.page_size));
    Frame frame;
    frame.title = "Records: " + habit.name;
    frame.key_hint = kListHint;
    frame.status = state.status;
    auto choice = RunPager(pager, keys_, [&](const Pager<Record>& p) {
        frame.page_label = PageLabel(p.current_page(), p.page_count());
        frame.lines.clear();
        for (const auto& r : p.page_items()) frame.lines.push_back(r.date);
        frame.selected = static_cast<int>(p.selected_index());
        Draw(frame);
    });
    switch (choice.outcome) {
        case SelectOutcome::Selected: return Go(ScreenId::RecordMenu, habit, *choice.item);
        case SelectOutcome::NoItems:
            return Go(ScreenId::HabitMenu, habit, std::nullopt, Join(state.status, "No records found!"));
        case SelectOutcome::Interrupted: return Go(ScreenId::Exit);
        case SelectOutcome::Cancelled: break;
    }
    return Go(ScreenId::HabitMenu, habit);
}

ScreenState ScreenController::RecordMenu(const ScreenState& state) {
    const Habit& habit = *state.habit;
    auto record = svc_.cmd_record(state.record->id);
    if (!record) return Go(ScreenId::SelectRecord, habit, std::nullopt, "Error: " + record.message());

    Frame frame;
    frame.title = "Record: " + habit.name + " - " + record->date;
    frame.status = state.status;
    switch (ChooseOption(frame, {"Update record", "Delete record", "Back"})) {
        case 0: return Go(ScreenId::UpdateRecord, habit, *record);
        case 1: return Go(ScreenId::DeleteRecord, habit, *record);
        case -2: return Go(ScreenId::Exit);
        default: return Go(ScreenId::SelectRecord, habit);
    }
}

ScreenState ScreenController::UpdateRecord(const ScreenState& state) {
    const Habit& habit = *state.habit;
    const Record& record = *state.record;
    std::string status = state.status;
    while (true) {
        Frame frame;
        frame.title = "Update Record: " + habit.name + " - " + record.date;
        frame.status = status;
        Draw(frame);
        auto date = ask(in_, out_, "Enter the new date of the record (YYYY-MM-DD)", record.date);
        if (!date) return Go(ScreenId::Exit);

        auto updated = svc_.cmd_update_record(record.id, *date);
        if (updated) return Go(ScreenId::RecordMenu, habit, *updated, "Record updated successfully");
        switch (updated.code()) {
            case HabitErrc::InvalidInput:
                status = "Invalid date format! Please use the format YYYY-MM-DD";
                continue;
            case HabitErrc::AlreadyExists:
                return Go(ScreenId::RecordMenu, habit, record, "Record already exists!");
            default: break;
        }
        return Go(ScreenId::SelectRecord, habit, std::nullopt, "Error: " + updated.message());
    }
}

ScreenState ScreenController::DeleteRecord(const ScreenState& state) {
    const Habit& habit = *state.habit;
    auto deleted = svc_.cmd_delete_record(state.record->id);
    if (deleted) return Go(ScreenId::SelectRecord, habit, std::nullopt, "Record deleted successfully");
    return Go(ScreenId::SelectRecord, habit, std::nullopt, "Error: " + deleted.message());
}

} // namespace ht
