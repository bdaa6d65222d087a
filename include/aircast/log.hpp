// log.hpp
// Tagged console logging: every line is "[Tag] message".
#pragma once

#include <string>
#include <string_view>

namespace aircast::log {

void set_verbose(bool on);

// Always printed to stdout.
void info(std::string_view tag, const std::string &message);
// Printed to stderr.
void error(std::string_view tag, const std::string &message);
// Printed to stdout only when verbose.
void debug(std::string_view tag, const std::string &message);

} // namespace aircast::log
