#include "cli/frame.hpp"

#include <algorithm>
#include <utility>

#include "ftxui/dom/elements.hpp"
#include "ftxui/screen/screen.hpp"

using namespace ftxui;

namespace ht {

std::string RenderFrame(const Frame& frame, int width) {
    Elements rows;
    rows.push_back(text(frame.title) | bold | hcenter);
    for (const auto& line : frame.subtitle) rows.push_back(text(line) | hcenter);
    rows.push_back(separator());
    if (!frame.page_label.empty() || !frame.key_hint.empty()) {
        rows.push_back(hbox({text(frame.page_label), filler(), text(frame.key_hint) | dim}));
    }
    if (!frame.input_line.empty()) {
        rows.push_back(text(frame.input_line));
    }
    rows.push_back(text(""));

    if (frame.lines.empty() && !frame.empty_text.empty()) {
        rows.push_back(text("  " + frame.empty_text) | dim);
    }
    for (size_t i = 0; i < frame.lines.size(); ++i) {
        if (static_cast<int>(i) == frame.selected) {
            rows.push_back(text(" > " + frame.lines[i]) | bold);
        } else {
            rows.push_back(text("   " + frame.lines[i]));
        }
    }
    if (!frame.status.empty()) {
        rows.push_back(text(""));
        rows.push_back(text(frame.status) | inverted);
    }

    auto document = vbox(std::move(rows));
    auto screen = Screen::Create(Dimension::Fixed(std::max(width, 20)), Dimension::Fit(document));
    Render(screen, document);
    return screen.ToString();
}

void DrawFrame(std::ostream& out, const Frame& frame, int width) {
    out << "\033[2J\033[1;1H" << RenderFrame(frame, width) << "\n" << std::flush;
}

} // namespace ht
