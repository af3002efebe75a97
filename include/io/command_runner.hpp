#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace adbpipe {

struct CommandOutput {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Runs argv without a shell and collects both output streams. A non-zero
// exit is not an error here; only a command that cannot start is.
Result RunCommand(const std::vector<std::string>& argv, CommandOutput& out);

} // namespace adbpipe
