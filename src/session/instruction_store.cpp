#include "session/instruction_store.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace autoloop::session {

using core::errors::ErrorCategory;
using core::errors::LoopError;

namespace {

bool read_text(const std::filesystem::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return false;
    }
    out = buffer.str();
    return true;
}

}  // namespace

InstructionStore::InstructionStore(std::filesystem::path instruction_path,
                                   std::string fallback_text)
    : instruction_path_(std::move(instruction_path)),
      fallback_text_(std::move(fallback_text)) {}

core::errors::Result<InstructionStore> InstructionStore::install(
    const std::filesystem::path& source_file,
    const std::filesystem::path& workspace_root) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source_file, ec) || ec) {
        return LoopError{ErrorCategory::Input,
                         "Instruction file '" + source_file.string() + "' not found.",
                         "missing_instruction_file"};
    }

    std::string text;
    if (!read_text(source_file, text)) {
        return LoopError{ErrorCategory::Input,
                         "Error reading instruction file: " + source_file.string(),
                         "instruction_unreadable"};
    }

    const auto target_dir = workspace_root / kInstructionsSubdir;
    std::filesystem::create_directories(target_dir, ec);
    if (ec) {
        return LoopError{ErrorCategory::Config,
                         "Unable to create instructions directory: " +
                             target_dir.string(),
                         "instruction_install_failed"};
    }

    const auto target = target_dir / source_file.filename();
    const auto source_canonical = std::filesystem::weakly_canonical(source_file, ec);
    const auto target_canonical = std::filesystem::weakly_canonical(target, ec);
    if (source_canonical != target_canonical) {
        std::filesystem::copy_file(source_file, target,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            return LoopError{ErrorCategory::Config,
                             "Error copying instruction file to " + target.string() +
                                 ": " + ec.message(),
                             "instruction_install_failed"};
        }
    }
    AUTOLOOP_LOG_INFO("Instruction copied to " + target.string());

    return InstructionStore(target, std::move(text));
}

std::string InstructionStore::load() const {
    std::string text;
    if (instruction_path_.empty() || !read_text(instruction_path_, text)) {
        AUTOLOOP_LOG_DEBUG("Instruction file unavailable, using the initial instruction.");
        return fallback_text_;
    }
    return text;
}

core::errors::Result<std::filesystem::path> InstructionStore::save(
    const std::string& text) const {
    if (instruction_path_.empty()) {
        return LoopError{ErrorCategory::Config,
                         "No instruction file path found in configuration.",
                         "missing_instruction_path"};
    }

    std::error_code ec;
    std::filesystem::create_directories(instruction_path_.parent_path(), ec);
    std::ofstream out(instruction_path_, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return LoopError{ErrorCategory::Execution,
                         "Unable to open instruction file: " + instruction_path_.string(),
                         "instruction_write_failed"};
    }
    out << text;
    out.flush();
    if (!out.good()) {
        return LoopError{ErrorCategory::Execution,
                         "Unable to write instruction file: " + instruction_path_.string(),
                         "instruction_write_failed"};
    }
    return instruction_path_;
}

}  // namespace autoloop::session
