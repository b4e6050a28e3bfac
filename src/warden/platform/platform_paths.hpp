#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/agent-warden, or empty if no home is known.
std::string config_dir();

// $XDG_DATA_HOME/agent-warden, or empty if no home is known.
std::string data_dir();

// Directory for tee'd task logs, under the OS temp directory.
std::string log_dir();

} // namespace platform
