#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"

namespace autoloop::core::config {

inline constexpr std::uint32_t kDefaultCommandTimeoutSeconds = 60;
inline constexpr std::uint32_t kMaxLimit = 1000;
// One day; keeps the millisecond value well inside 32 bits.
inline constexpr std::uint32_t kMaxCommandTimeoutSeconds = 86400;

// Settings read from the optional JSON configuration file.
struct LoopConfig {
    std::uint32_t limit = 1;
    std::uint32_t command_timeout_seconds = kDefaultCommandTimeoutSeconds;
    // Empty means every tool is available.
    std::vector<std::string> allowed_tools;
    std::string branch_name = "main";
    std::filesystem::path base_prompt_file = "prompts/agent/prompt.md";
    std::filesystem::path artifact_dir = ".autoloop_runs";
};

errors::Result<LoopConfig> parse_loop_config(const std::string& json_text);

errors::Result<LoopConfig> load_loop_config(const std::filesystem::path& config_file);

}  // namespace autoloop::core::config
