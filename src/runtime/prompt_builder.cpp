#include "runtime/prompt_builder.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace autoloop::runtime {

PromptBuilder::PromptBuilder(std::string base_prompt,
                             std::filesystem::path working_directory)
    : base_prompt_(std::move(base_prompt)),
      working_directory_(std::move(working_directory)) {}

const std::string& PromptBuilder::default_base_prompt() {
    static const std::string prompt =
        "You are an autonomous coding agent working inside a single directory.";
    return prompt;
}

std::string PromptBuilder::load_base_prompt(const std::filesystem::path& base_prompt_file) {
    std::error_code ec;
    if (base_prompt_file.empty() || !std::filesystem::is_regular_file(base_prompt_file, ec)) {
        return default_base_prompt();
    }

    std::ifstream in(base_prompt_file);
    if (!in.is_open()) {
        AUTOLOOP_LOG_WARN("Could not read prompt file at " + base_prompt_file.string() +
                          "; using the built-in prompt.");
        return default_base_prompt();
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string PromptBuilder::build(const std::string& instruction) const {
    std::ostringstream prompt;
    prompt << base_prompt_ << "\n\n"
           << "You are working in the directory: " << working_directory_.string() << "\n"
           << "Your goal is to follow these instructions:\n"
           << instruction << "\n\n"
           << "You have tools to list, read, and write files, and run commands.\n"
           << "If you need to explore the codebase, use list_files and read_file.\n"
           << "Do not hallucinate file contents. Always read them first.\n"
           << "When you are satisfied that you have completed the task, call the done tool.\n"
           << "If you cannot complete the task in one step, make progress and stop. "
              "You will be called again with the conversation so far, and the files "
              "will persist.\n";
    return prompt.str();
}

}  // namespace autoloop::runtime
