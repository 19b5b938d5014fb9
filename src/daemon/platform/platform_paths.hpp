#pragma once

#include <string>

namespace platform {

// Directory holding config.json. Empty when no home directory is known.
std::string config_dir();

// Where a backgrounded daemon writes its diagnostics.
std::string log_path();

// Address clients connect to.
std::string ipc_endpoint();

} // namespace platform
