#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <unistd.h>

namespace platform {

void daemonize(const std::string& log_file) {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    setsid();

    // Second fork so the daemon can never reacquire a terminal.
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    if (!std::freopen("/dev/null", "r", stdin) || !std::freopen("/dev/null", "w", stdout)) {
        _exit(1);
    }
    if (log_file.empty() || !std::freopen(log_file.c_str(), "a", stderr)) {
        if (!std::freopen("/dev/null", "w", stderr)) _exit(1);
    }
    std::setvbuf(stderr, nullptr, _IOLBF, 0);
}

} // namespace platform
