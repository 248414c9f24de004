#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include <cstddef>
#include <string>

// Terminal output shared by the builders. Progress goes to stdout, warnings
// and errors to stderr; colours only when the stream is a terminal.
namespace console {

void set_quiet(bool quiet);

void banner(const std::string &title);
void section(const std::string &title);

// "  ✓ <action> <detail>", suppressed in quiet mode.
void step(const std::string &action, const std::string &detail);

void warn(const std::string &message);
void error(const std::string &message);

size_t warning_count();
void reset_warnings();

} // namespace console

#endif
