#include "transfer/transfer_outcome.hpp"

#include <utility>

namespace adbpipe {

const char* ToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::None:         return "none";
        case FailureKind::Validation:   return "validation";
        case FailureKind::Connectivity: return "connectivity";
        case FailureKind::Launch:       return "launch";
        case FailureKind::Execution:    return "execution";
        case FailureKind::Cancelled:    return "cancelled";
    }
    return "unknown";
}

std::string TransferOutcome::Summary(std::size_t max_chars) const {
    if (success)
        return "Transfer Complete!";

    std::string text = diagnostic_text;
    const auto nl = text.find('\n');
    const bool multi_line = nl != std::string::npos;
    if (multi_line)
        text.resize(nl);
    if (text.empty())
        return "Check log for details.";
    if (text.size() > max_chars) {
        text.resize(max_chars);
        text += "...";
    } else if (multi_line) {
        text += "...";
    }
    return text;
}

TransferOutcome TransferOutcome::Succeeded() {
    return {.success = true, .diagnostic_text = {}, .exit_code = 0, .failure = FailureKind::None};
}

TransferOutcome TransferOutcome::Failed(FailureKind kind, std::string text, int exit_code) {
    return {.success = false,
            .diagnostic_text = std::move(text),
            .exit_code = exit_code,
            .failure = kind};
}

} // namespace adbpipe
