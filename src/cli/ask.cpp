// FILE: src/cli/ask.cpp
#include "cli/ask.hpp"

#include <string>

std::optional<std::string> ask(std::istream& in, std::ostream& out,
                               const std::string& q, const std::string& def) {
  out << q;
  if (!def.empty())
    out << " [" << def << "]";
  out << ": " << std::flush;
  std::string s;
  if (!std::getline(in, s))
    return std::nullopt;
  if (!s.empty() && s.back() == '\r')
    s.pop_back();
  if (s.empty())
    return def;
  return s;
}

std::optional<bool> ask_yesno(std::istream& in, std::ostream& out,
                              const std::string& q, bool def) {
  while (true) {
    auto s = ask(in, out, q + (def ? " [Y/n]" : " [y/N]"), "");
    if (!s)
      return std::nullopt;
    if (s->empty())
      return def;
    if (*s == "Y" || *s == "y")
      return true;
    if (*s == "N" || *s == "n")
      return false;
    out << "Please answer Y or n.\n";
  }
}
