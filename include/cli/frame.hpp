#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace ht {

// Content of one full-screen menu frame.
struct Frame {
    std::string title;
    std::vector<std::string> subtitle;
    // Left/right parts of the line under the separator, e.g. "Page 1 of 3"
    // and the key hints. Both empty means no such line.
    std::string page_label;
    std::string key_hint;
    // Text input line shown above the list (live search query).
    std::string input_line;
    std::vector<std::string> lines;
    int selected = -1;
    std::string empty_text;
    std::string status;
};

// Lays the frame out with FTXUI and returns the rendered text.
std::string RenderFrame(const Frame& frame, int width);

// Clears the terminal and writes the rendered frame.
void DrawFrame(std::ostream& out, const Frame& frame, int width);

} // namespace ht
