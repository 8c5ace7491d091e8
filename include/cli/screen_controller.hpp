#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "cli/frame.hpp"
#include "cli/terminal_input.hpp"
#include "cli_config.hpp"
#include "kernel/interaction.hpp"

namespace ht {

enum class ScreenId {
    MainMenu,
    AddHabit,
    SearchHabits,
    SelectHabit,
    HabitMenu,
    RenameHabit,
    DeleteHabit,
    AddRecord,
    SelectRecord,
    RecordMenu,
    UpdateRecord,
    DeleteRecord,
    Exit,
};

// Where the user is, plus value snapshots of the habit / record the screen
// acts on and the message to show on the next frame.
struct ScreenState {
    ScreenId id = ScreenId::MainMenu;
    std::optional<Habit> habit;
    std::optional<Record> record;
    std::string status;
};

// Drives every menu screen from one loop. Each handler draws its screen,
// reads keys (menus, lists) or lines (names, dates) and returns the state
// of the screen that follows.
class ScreenController {
public:
    ScreenController(InteractionService& svc, const CliConfig& config, KeySource& keys,
                     std::istream& in, std::ostream& out);

    // Runs until the user exits; returns the process exit code.
    int Run(ScreenState start = {});

    // Handles one screen. Storage failures are reported and lead back to the
    // main menu.
    ScreenState Step(const ScreenState& state);

private:
    ScreenState MainMenu(const ScreenState& state);
    ScreenState AddHabit(const ScreenState& state);
    ScreenState SearchHabits(const ScreenState& state);
    ScreenState SelectHabit(const ScreenState& state);
    ScreenState HabitMenu(const ScreenState& state);
    ScreenState RenameHabit(const ScreenState& state);
    ScreenState DeleteHabit(const ScreenState& state);
    ScreenState AddRecord(const ScreenState& state);
    ScreenState SelectRecord(const ScreenState& state);
    ScreenState RecordMenu(const ScreenState& state);
    ScreenState UpdateRecord(const ScreenState& state);
    ScreenState DeleteRecord(const ScreenState& state);

    // Fixed option menu. Returns the chosen index, -1 on Escape, -2 on
    // interrupt.
    int ChooseOption(Frame frame, const std::vector<std::string>& options);

    void Draw(const Frame& frame);

    InteractionService& svc_;
    const CliConfig& config_;
    KeySource& keys_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace ht
