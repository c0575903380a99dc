#pragma once

#include <filesystem>
#include <string>

namespace autoloop::runtime {

// Composes the system prompt for one step.
class PromptBuilder {
public:
    PromptBuilder(std::string base_prompt, std::filesystem::path working_directory);

    std::string build(const std::string& instruction) const;

    // Contents of base_prompt_file when it can be read, otherwise the built-in prompt.
    static std::string load_base_prompt(const std::filesystem::path& base_prompt_file);

    static const std::string& default_base_prompt();

private:
    std::string base_prompt_;
    std::filesystem::path working_directory_;
};

}  // namespace autoloop::runtime
