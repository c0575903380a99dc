#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/run_request.hpp"
#include "protocol/tool_contract.hpp"

namespace autoloop::session {

// Appends one JSON line per event to <workspace>/<artifact_subdir>/<run_id>.jsonl.
class ArtifactWriter {
public:
    explicit ArtifactWriter(std::filesystem::path workspace_root,
                            std::filesystem::path artifact_subdir = ".autoloop_runs");

    // Also records the tools offered to the decision provider, with their
    // parameter schemas.
    core::errors::Result<std::filesystem::path> write_request(
        const std::string& run_id, const protocol::RunRequest& request,
        std::uint32_t limit, const std::vector<protocol::ToolSpec>& tools) const;

    core::errors::Result<std::filesystem::path> write_iteration(
        const std::string& run_id, const protocol::IterationRecord& record) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& run_id, const protocol::RunResult& result) const;

    core::errors::Result<std::filesystem::path> run_log_path(
        const std::string& run_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& run_id, const std::string& event_json) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path artifact_subdir_;
};

}  // namespace autoloop::session
