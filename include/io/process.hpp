#pragma once

#include "util/result.hpp"

#include <string>
#include <sys/types.h>
#include <vector>

namespace adbpipe {

// Descriptors the child receives; -1 means /dev/null.
struct SpawnIo {
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    bool new_process_group = false;
};

// fork/execvp with an exec-status pipe, so a program that cannot be started
// is reported here (kErrLaunch) instead of as exit status 127.
Result SpawnProcess(const std::vector<std::string>& argv, const SpawnIo& io, pid_t& out_pid);

// Blocks until the child exits. Returns the exit code, or 128 + signal
// number for a child killed by a signal, or -1 if waitpid fails.
int WaitForExit(pid_t pid);

bool IsExecutableOnPath(const std::string& tool);

} // namespace adbpipe
