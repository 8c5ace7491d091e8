#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <string>

#include "calendar_date.hpp"
#include "cli/screen_controller.hpp"
#include "test_support.hpp"

using ht::Habit;
using ht::KeyKind;
using ht::Record;
using ht::ScreenId;
using ht::ScreenState;
using ht_test::ScriptedKeys;
using ht_test::TempDb;

namespace {

class ScreenControllerTest : public ::testing::Test {
 protected:
  ScreenControllerTest() : db_("screens"), store_(db_.path()), svc_(store_) {
    config_.default_record_date = "none";
  }

  // Runs one screen with the given typed lines on stdin.
  ScreenState StepWith(const ScreenState& state, const std::string& lines = "") {
    std::istringstream in(lines);
    ht::ScreenController controller(svc_, config_, keys_, in, out_);
    return controller.Step(state);
  }

  static ScreenState At(ScreenId id, std::optional<Habit> habit = std::nullopt,
                        std::optional<Record> record = std::nullopt) {
    ScreenState s;
    s.id = id;
    s.habit = habit;
    s.record = record;
    return s;
  }

  Habit AddHabit(const std::string& name) { return store_.create_habit(name).value(); }

  Record AddRecord(const Habit& h, const std::string& date) {
    return store_.create_record(h.id, date).value();
  }

  TempDb db_;
  ht::HabitStore store_;
  ht::InteractionService svc_;
  CliConfig config_;
  ScriptedKeys keys_;
  std::ostringstream out_;
};

}  // namespace

TEST_F(ScreenControllerTest, AddHabitOpensIt) {
  auto next = StepWith(At(ScreenId::AddHabit), "Running\n");
  EXPECT_EQ(next.id, ScreenId::HabitMenu);
  ASSERT_TRUE(next.habit.has_value());
  EXPECT_EQ(next.habit->name, "Running");
  EXPECT_EQ(next.status, "Habit added successfully");
  EXPECT_EQ(store_.list_habits().size(), 1u);
}

TEST_F(ScreenControllerTest, AddExistingHabitOpensExisting) {
  Habit existing = AddHabit("Running");
  auto next = StepWith(At(ScreenId::AddHabit), "Running\n");
  EXPECT_EQ(next.id, ScreenId::HabitMenu);
  ASSERT_TRUE(next.habit.has_value());
  EXPECT_EQ(*next.habit, existing);
  EXPECT_EQ(next.status, "Habit already exists!");
  EXPECT_EQ(store_.list_habits().size(), 1u);
}

TEST_F(ScreenControllerTest, EmptyHabitNameReportsError) {
  auto next = StepWith(At(ScreenId::AddHabit), "\n");
  EXPECT_EQ(next.id, ScreenId::MainMenu);
  EXPECT_EQ(next.status, "Error: Habit cannot be empty");
}

TEST_F(ScreenControllerTest, EndOfInputExits) {
  EXPECT_EQ(StepWith(At(ScreenId::AddHabit)).id, ScreenId::Exit);
}

TEST_F(ScreenControllerTest, AddRecordRetriesInvalidDate) {
  Habit h = AddHabit("Running");
  auto next = StepWith(At(ScreenId::AddRecord, h), "2024-13-01\n2024-01-05\n");
  EXPECT_EQ(next.id, ScreenId::RecordMenu);
  ASSERT_TRUE(next.record.has_value());
  EXPECT_EQ(next.record->date, "2024-01-05");
  EXPECT_EQ(next.status, "Record added successfully");
  EXPECT_NE(out_.str().find("Invalid date format!"), std::string::npos);
}

TEST_F(ScreenControllerTest, AddRecordDefaultsToToday) {
  config_.default_record_date = "today";
  Habit h = AddHabit("Running");
  auto next = StepWith(At(ScreenId::AddRecord, h), "\n");
  EXPECT_EQ(next.id, ScreenId::RecordMenu);
  ASSERT_TRUE(next.record.has_value());
  EXPECT_EQ(next.record->date, ht::today_local().to_iso());
}

TEST_F(ScreenControllerTest, AddDuplicateRecordOpensExisting) {
  Habit h = AddHabit("Running");
  Record r = AddRecord(h, "2024-01-05");
  auto next = StepWith(At(ScreenId::AddRecord, h), "2024-01-05\n");
  EXPECT_EQ(next.id, ScreenId::RecordMenu);
  ASSERT_TRUE(next.record.has_value());
  EXPECT_EQ(*next.record, r);
  EXPECT_EQ(next.status, "Record already exists!");
}

TEST_F(ScreenControllerTest, BrowseShowsLongestStreak) {
  Habit h = AddHabit("Running");
  for (const char* d : {"2024-01-01", "2024-01-02", "2024-01-03", "2024-01-05"}) AddRecord(h, d);

  keys_.Press(KeyKind::ArrowDown);  // View habits
  keys_.Press(KeyKind::Enter);
  keys_.Press(KeyKind::Enter);      // Running
  keys_.Press(KeyKind::Escape);     // habit menu -> list
  keys_.Press(KeyKind::Escape);     // list -> main menu
  keys_.Press(KeyKind::Escape);     // main menu -> exit

  std::istringstream in;
  ht::ScreenController controller(svc_, config_, keys_, in, out_);
  EXPECT_EQ(controller.Run(), 0);
  EXPECT_EQ(keys_.remaining(), 0u);
  const std::string screen = out_.str();
  EXPECT_NE(screen.find("Longest streak: 3 days"), std::string::npos);
  EXPECT_NE(screen.find("Page 1 of 1"), std::string::npos);
  EXPECT_NE(screen.find("Habit Tracker"), std::string::npos);
}

TEST_F(ScreenControllerTest, InterruptLeavesTheLoop) {
  std::istringstream in;
  ht::ScreenController controller(svc_, config_, keys_, in, out_);
  EXPECT_EQ(controller.Run(), 0);
  EXPECT_EQ(keys_.consumed(), 1);
}

TEST_F(ScreenControllerTest, EmptyHabitListReturnsToMainMenu) {
  auto next = StepWith(At(ScreenId::SelectHabit));
  EXPECT_EQ(next.id, ScreenId::MainMenu);
  EXPECT_EQ(next.status, "No habits found!");
  EXPECT_EQ(keys_.consumed(), 0);
}

TEST_F(ScreenControllerTest, SearchSelectsMatch) {
  AddHabit("Running");
  AddHabit("Reading");
  AddHabit("Run at Night");
  keys_.Type("run");
  keys_.Press(KeyKind::ArrowDown);
  keys_.Press(KeyKind::Enter);
  auto next = StepWith(At(ScreenId::SearchHabits));
  EXPECT_EQ(next.id, ScreenId::HabitMenu);
  ASSERT_TRUE(next.habit.has_value());
  EXPECT_EQ(next.habit->name, "Running");
  EXPECT_NE(out_.str().find("Habit: run"), std::string::npos);
}

TEST_F(ScreenControllerTest, SearchWithoutHabits) {
  auto next = StepWith(At(ScreenId::SearchHabits));
  EXPECT_EQ(next.id, ScreenId::MainMenu);
  EXPECT_EQ(next.status, "No habits found!");
}

TEST_F(ScreenControllerTest, RenameHabit) {
  Habit h = AddHabit("Running");
  auto next = StepWith(At(ScreenId::RenameHabit, h), "Jogging\n");
  EXPECT_EQ(next.id, ScreenId::HabitMenu);
  EXPECT_EQ(next.habit->name, "Jogging");
  EXPECT_EQ(next.status, "Habit renamed successfully");

  AddHabit("Reading");
  auto clash = StepWith(At(ScreenId::RenameHabit, *next.habit), "Reading\n");
  EXPECT_EQ(clash.status, "Habit already exists!");
  EXPECT_EQ(store_.find_habit_by_id(h.id)->name, "Jogging");
}

TEST_F(ScreenControllerTest, DeleteHabitAsksFirst) {
  Habit h = AddHabit("Running");
  AddRecord(h, "2024-01-01");

  auto kept = StepWith(At(ScreenId::DeleteHabit, h), "\n");
  EXPECT_EQ(kept.id, ScreenId::HabitMenu);
  EXPECT_EQ(kept.status, "Habit kept");
  EXPECT_EQ(store_.list_habits().size(), 1u);

  auto gone = StepWith(At(ScreenId::DeleteHabit, h), "maybe\ny\n");
  EXPECT_EQ(gone.id, ScreenId::SelectHabit);
  EXPECT_EQ(gone.status, "Habit deleted successfully");
  EXPECT_TRUE(store_.list_habits().empty());
  EXPECT_NE(out_.str().find("Please answer Y or n."), std::string::npos);
}

TEST_F(ScreenControllerTest, StaleHabitGoesBackToList) {
  auto next = StepWith(At(ScreenId::HabitMenu, Habit{999, "Ghost"}));
  EXPECT_EQ(next.id, ScreenId::SelectHabit);
  EXPECT_EQ(next.status, "Error: Habit not found (id 999)");
  EXPECT_EQ(keys_.consumed(), 0);
}

TEST_F(ScreenControllerTest, MissingSnapshotFallsBackToMainMenu) {
  EXPECT_EQ(StepWith(At(ScreenId::HabitMenu)).id, ScreenId::MainMenu);
  Habit h = AddHabit("Running");
  EXPECT_EQ(StepWith(At(ScreenId::RecordMenu, h)).id, ScreenId::MainMenu);
  EXPECT_EQ(keys_.consumed(), 0);
}

TEST_F(ScreenControllerTest, NoRecordsReturnsToHabitMenu) {
  Habit h = AddHabit("Running");
  auto next = StepWith(At(ScreenId::SelectRecord, h));
  EXPECT_EQ(next.id, ScreenId::HabitMenu);
  EXPECT_EQ(next.status, "No records found!");
  EXPECT_EQ(keys_.consumed(), 0);
}

TEST_F(ScreenControllerTest, RecordLifecycle) {
  Habit h = AddHabit("Running");
  AddRecord(h, "2024-01-01");
  AddRecord(h, "2024-01-02");

  keys_.Press(KeyKind::ArrowDown);
  keys_.Press(KeyKind::Enter);
  auto picked = StepWith(At(ScreenId::SelectRecord, h));
  ASSERT_EQ(picked.id, ScreenId::RecordMenu);
  EXPECT_EQ(picked.record->date, "2024-01-01");

  keys_.Press(KeyKind::Enter);  // Update record
  auto update = StepWith(picked);
  ASSERT_EQ(update.id, ScreenId::UpdateRecord);

  auto clash = StepWith(update, "2024-01-02\n");
  EXPECT_EQ(clash.id, ScreenId::RecordMenu);
  EXPECT_EQ(clash.status, "Record already exists!");

  auto updated = StepWith(update, "bad\n2024-01-09\n");
  ASSERT_EQ(updated.id, ScreenId::RecordMenu);
  EXPECT_EQ(updated.record->date, "2024-01-09");
  EXPECT_EQ(updated.status, "Record updated successfully");

  keys_.Press(KeyKind::ArrowDown);
  keys_.Press(KeyKind::Enter);  // Delete record
  auto del = StepWith(updated);
  ASSERT_EQ(del.id, ScreenId::DeleteRecord);
  auto after = StepWith(del);
  EXPECT_EQ(after.id, ScreenId::SelectRecord);
  EXPECT_EQ(after.status, "Record deleted successfully");
  EXPECT_EQ(store_.list_records(h.id)->size(), 1u);
}
