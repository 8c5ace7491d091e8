#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>

// Prompt on `out` and read one line from `in`. An empty answer yields `def`;
// nullopt once `in` is exhausted.
std::optional<std::string> ask(std::istream& in, std::ostream& out,
                               const std::string& q, const std::string& def);

// Y/n question; re-asks until the answer is recognised. nullopt once `in`
// is exhausted.
std::optional<bool> ask_yesno(std::istream& in, std::ostream& out,
                              const std::string& q, bool def);
