#pragma once

#include <filesystem>
#include <string>
#include "core/errors/loop_errors.hpp"

namespace autoloop::session {

inline constexpr const char* kInstructionsSubdir = "prompts/instructions";

// Working copy of the run's instruction. Read at the top of every iteration so an
// update_instruction call is visible to the next step.
class InstructionStore {
public:
    InstructionStore(std::filesystem::path instruction_path,
                     std::string fallback_text);

    // Copies source_file into <workspace_root>/prompts/instructions/ and returns a
    // store over the copy, seeded with the copied text as fallback.
    static core::errors::Result<InstructionStore> install(
        const std::filesystem::path& source_file,
        const std::filesystem::path& workspace_root);

    // Current text; the fallback when the file is missing or unreadable.
    std::string load() const;

    core::errors::Result<std::filesystem::path> save(const std::string& text) const;

    const std::filesystem::path& path() const { return instruction_path_; }
    const std::string& fallback_text() const { return fallback_text_; }

private:
    std::filesystem::path instruction_path_;
    std::string fallback_text_;
};

}  // namespace autoloop::session
