#pragma once

#include <string>

namespace platform {

// Detaches from the controlling terminal. stdin and stdout go to /dev/null,
// stderr is appended to `log_file` (or /dev/null when it cannot be opened).
// Only the grandchild returns.
void daemonize(const std::string& log_file);

} // namespace platform
