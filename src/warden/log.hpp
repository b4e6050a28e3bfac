#pragma once

#include <string>

// stderr logging shared by the library and the CLI.
// debug() lines only appear when debug mode is on.
namespace logging {

void set_debug(bool enabled);
bool debug_enabled();

void debug(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace logging
