#pragma once

#include <cstddef>
#include <string>

namespace adbpipe {

enum class FailureKind {
    None,
    Validation,
    Connectivity,
    Launch,
    Execution,
    Cancelled,
};

const char* ToString(FailureKind kind);

struct TransferOutcome {
    bool success = false;
    std::string diagnostic_text;
    int exit_code = -1;
    FailureKind failure = FailureKind::None;

    // Short one-line message for display; the full text stays in
    // diagnostic_text.
    std::string Summary(std::size_t max_chars = 40) const;

    static TransferOutcome Succeeded();
    static TransferOutcome Failed(FailureKind kind, std::string text, int exit_code = -1);
};

} // namespace adbpipe
