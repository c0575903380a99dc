#include "core/config/loop_config.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace autoloop::core::config {

using errors::ErrorCategory;
using errors::LoopError;
using nlohmann::json;

namespace {

LoopError invalid_config(const std::string& message) {
    return LoopError{ErrorCategory::Config, message, "invalid_config"};
}

// Integer in [1, max]. Non-negative JSON integers parse as unsigned.
bool integer_in_range(const json& value, const std::uint32_t max) {
    if (value.is_number_unsigned()) {
        const auto number = value.get<std::uint64_t>();
        return number >= 1 && number <= max;
    }
    return value.is_number_integer() && value.get<std::int64_t>() >= 1 &&
           value.get<std::int64_t>() <= static_cast<std::int64_t>(max);
}

}  // namespace

errors::Result<LoopConfig> parse_loop_config(const std::string& json_text) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return invalid_config("Configuration is not valid JSON.");
    }
    if (!doc.is_object()) {
        return invalid_config("Configuration must be a JSON object.");
    }

    LoopConfig config;
    try {
        if (doc.contains("limit")) {
            const auto& value = doc.at("limit");
            if (!integer_in_range(value, kMaxLimit)) {
                return invalid_config("'limit' must be an integer between 1 and " +
                                      std::to_string(kMaxLimit) + ".");
            }
            config.limit = value.get<std::uint32_t>();
        }
        if (doc.contains("command_timeout_seconds")) {
            const auto& value = doc.at("command_timeout_seconds");
            if (!integer_in_range(value, kMaxCommandTimeoutSeconds)) {
                return invalid_config(
                    "'command_timeout_seconds' must be an integer between 1 and " +
                    std::to_string(kMaxCommandTimeoutSeconds) + ".");
            }
            config.command_timeout_seconds = value.get<std::uint32_t>();
        }
        if (doc.contains("allowed_tools")) {
            config.allowed_tools =
                doc.at("allowed_tools").get<std::vector<std::string>>();
        }
        if (doc.contains("branch_name")) {
            config.branch_name = doc.at("branch_name").get<std::string>();
        }
        if (doc.contains("base_prompt_file")) {
            config.base_prompt_file = doc.at("base_prompt_file").get<std::string>();
        }
        if (doc.contains("artifact_dir")) {
            config.artifact_dir = doc.at("artifact_dir").get<std::string>();
        }
    } catch (const json::exception& ex) {
        return invalid_config(std::string("Configuration has a wrong value type: ") +
                              ex.what());
    }

    if (config.branch_name.empty()) {
        return invalid_config("'branch_name' cannot be empty.");
    }
    return config;
}

errors::Result<LoopConfig> load_loop_config(const std::filesystem::path& config_file) {
    std::ifstream in(config_file);
    if (!in.is_open()) {
        return LoopError{ErrorCategory::Config,
                         "Unable to open configuration file: " + config_file.string(),
                         "config_unreadable"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_loop_config(buffer.str());
}

}  // namespace autoloop::core::config
