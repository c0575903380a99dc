#pragma once
#include <string>
#include <filesystem>
#include <cstdint>
#include <optional>

namespace autoloop::protocol {

    enum class CommandKind {
        Loop,
        Version
    };

    // Validated operator input required to start a loop
    struct RunRequest {
        CommandKind command = CommandKind::Loop;
        std::filesystem::path instruction_file;
        std::filesystem::path decisions_file;
        std::optional<std::filesystem::path> config_file;
        std::filesystem::path working_directory = std::filesystem::current_path();
        // Unset means the config file (or its default) decides.
        std::optional<uint32_t> limit;
        bool verbose = false;
    };

} // namespace autoloop::protocol
