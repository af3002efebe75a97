#include "transfer/pipeline_builder.hpp"

#include "util/path_utils.hpp"

#include <utility>

namespace adbpipe {

namespace {

// The device side always runs its own tar.
constexpr const char* kRemoteArchiver = "tar";

std::string Compose(const std::vector<PipelineStage>& stages) {
    std::string out;
    for (const auto& stage : stages) {
        if (!out.empty())
            out += " | ";
        out += stage.command;
    }
    return out;
}

} // namespace

const char* ToString(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::Pull: return "pull";
        case TransferDirection::Push: return "push";
    }
    return "unknown";
}

bool ParseDirection(std::string_view text, TransferDirection& out) {
    if (text == "pull") {
        out = TransferDirection::Pull;
        return true;
    }
    if (text == "push") {
        out = TransferDirection::Push;
        return true;
    }
    return false;
}

PipelineBuilder::PipelineBuilder(TransferConfig config) : config_(std::move(config)) {}

PipelineStage PipelineBuilder::MeteringStage(std::uint64_t total_bytes) const {
    // -n: bare percentages on stderr, -s: size hint for computing them.
    return {.name = "meter",
            .command = ShellWord(config_.metering_tool) + " -n -s " + std::to_string(total_bytes),
            .remote = false};
}

PipelineSpec PipelineBuilder::Build(TransferDirection direction,
                                    const std::string& local_path,
                                    std::uint64_t total_bytes) const {
    PipelineSpec spec;
    spec.direction = direction;
    spec.local_path = local_path;
    spec.total_bytes = total_bytes;
    spec.required_tools = {config_.bridge_tool, config_.metering_tool, config_.archiver_tool};

    const std::string bridge = ShellWord(config_.bridge_tool);
    const std::string archiver = ShellWord(config_.archiver_tool);

    if (direction == TransferDirection::Pull) {
        // cd first: device tar implementations differ in -C support.
        const std::string remote_archive = std::string("cd ") + ShellWord(config_.remote_base_dir) +
                                           " && " + kRemoteArchiver + " -c -f - " +
                                           ShellWord(config_.remote_target_dir);
        spec.stages.push_back({.name = "archive",
                               .command = bridge + " exec-out " + ShellQuote(remote_archive),
                               .remote = true});
        spec.stages.push_back(MeteringStage(total_bytes));
        spec.stages.push_back({.name = "extract",
                               .command = archiver + " -xf - -C " + ShellQuote(local_path),
                               .remote = false});
    } else {
        const std::string remote_extract = std::string(kRemoteArchiver) + " -xf - -C " +
                                           ShellWord(config_.device_staging_dir);
        spec.stages.push_back({.name = "archive",
                               .command = archiver + " -cf - -C " + ShellQuote(local_path) + " .",
                               .remote = false});
        spec.stages.push_back(MeteringStage(total_bytes));
        spec.stages.push_back({.name = "extract",
                               .command = bridge + " shell " + ShellQuote(remote_extract),
                               .remote = true});
    }

    spec.command = Compose(spec.stages);
    return spec;
}

} // namespace adbpipe
