#pragma once

#include "util/transfer_config.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace adbpipe {

enum class TransferDirection {
    Pull, // device -> host
    Push, // host -> device
};

const char* ToString(TransferDirection direction);
bool ParseDirection(std::string_view text, TransferDirection& out);

struct PipelineStage {
    std::string name;
    std::string command;
    bool remote = false;
};

// One fully materialized archive | meter | extract chain.
struct PipelineSpec {
    TransferDirection direction = TransferDirection::Pull;
    std::string local_path;
    std::uint64_t total_bytes = 0;
    std::vector<PipelineStage> stages;
    // Local executables that must resolve before launch.
    std::vector<std::string> required_tools;
    std::string command;
};

class PipelineBuilder {
  public:
    explicit PipelineBuilder(TransferConfig config);

    PipelineSpec Build(TransferDirection direction,
                       const std::string& local_path,
                       std::uint64_t total_bytes) const;

  private:
    PipelineStage MeteringStage(std::uint64_t total_bytes) const;

    TransferConfig config_;
};

} // namespace adbpipe
