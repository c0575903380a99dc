#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/config/loop_config.hpp"
#include "core/errors/loop_errors.hpp"

namespace autoloop::tools {

struct CommandRequest {
    std::string command;
    std::uint32_t timeout_ms = core::config::kDefaultCommandTimeoutSeconds * 1000;
};

struct CommandCapture {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Primitive filesystem and process operations. Every path goes through
// PathSandbox before the filesystem is touched; the command string itself is
// not sandboxed and runs with the working directory as cwd.
class ToolHost {
public:
    // Regular files under path, relative to it and sorted. A path that does not
    // exist yields an empty list.
    core::errors::Result<std::vector<std::string>> list_files(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& path) const;

    core::errors::Result<std::string> read_file(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& path) const;

    core::errors::Result<std::filesystem::path> write_file(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& path,
        const std::string& content) const;

    // Fails with "command_timeout" once timeout_ms elapses; the whole process
    // group is killed first.
    core::errors::Result<CommandCapture> run_command(
        const std::filesystem::path& workspace_root,
        const CommandRequest& request) const;
};

}  // namespace autoloop::tools
