#include "console.hpp"

#include <iostream>
#include <termcolor/termcolor.hpp>

namespace console {

static bool quiet_mode = false;
static size_t warnings = 0;

void set_quiet(bool quiet) { quiet_mode = quiet; }

void banner(const std::string &title) {
  if (quiet_mode)
    return;
  std::cout << "\n"
            << termcolor::bright_cyan << "== " << title << " =="
            << termcolor::reset << "\n";
}

void section(const std::string &title) {
  if (quiet_mode)
    return;
  std::cout << "\n"
            << termcolor::bright_cyan << title << termcolor::reset << "\n";
}

void step(const std::string &action, const std::string &detail) {
  if (quiet_mode)
    return;
  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << termcolor::white << action << termcolor::reset << " "
            << termcolor::bright_blue << detail << termcolor::reset << "\n";
}

void warn(const std::string &message) {
  ++warnings;
  std::cerr << termcolor::yellow << "⚠ Warning: " << termcolor::reset
            << message << "\n";
}

void error(const std::string &message) {
  std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset
            << message << "\n";
}

size_t warning_count() { return warnings; }

void reset_warnings() { warnings = 0; }

} // namespace console
