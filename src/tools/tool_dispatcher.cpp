#include "tools/tool_dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <sstream>
#include <utility>
#include "core/errors/loop_errors.hpp"
#include "core/logging/logger.hpp"
#include "ledger/requirements_ledger.hpp"
#include "session/instruction_store.hpp"

namespace autoloop::tools {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using core::errors::Result;
using nlohmann::json;
using protocol::ParameterType;
using protocol::ToolParameter;
using protocol::ToolSpec;

namespace {

Result<std::string> string_argument(const json& arguments, const std::string& name) {
    if (!arguments.contains(name) || arguments.at(name).is_null()) {
        return LoopError{ErrorCategory::Execution,
                         "Missing required argument '" + name + "'",
                         "missing_argument"};
    }
    const auto& value = arguments.at(name);
    if (!value.is_string()) {
        return LoopError{ErrorCategory::Execution,
                         "Argument '" + name + "' must be a string",
                         "invalid_argument"};
    }
    return value.get<std::string>();
}

Result<std::optional<std::string>> optional_string_argument(const json& arguments,
                                                            const std::string& name) {
    if (!arguments.contains(name) || arguments.at(name).is_null()) {
        return std::optional<std::string>{};
    }
    const auto& value = arguments.at(name);
    if (!value.is_string()) {
        return LoopError{ErrorCategory::Execution,
                         "Argument '" + name + "' must be a string",
                         "invalid_argument"};
    }
    return std::optional<std::string>(value.get<std::string>());
}

std::string error_text(const std::string& prefix, const LoopError& error) {
    return prefix + error.message;
}

// File names are not guaranteed to be UTF-8.
std::string to_text(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string summarize(const std::string& text) {
    constexpr std::size_t kMaxPreview = 120;
    if (text.size() <= kMaxPreview) {
        return text;
    }
    return text.substr(0, kMaxPreview) + "...";
}

std::string list_files(const ToolHost& host, const json& arguments,
                       const ToolContext& context) {
    auto path = optional_string_argument(arguments, "path");
    if (core::errors::is_error(path)) {
        return to_text(json::array({"Error: " + core::errors::get_error(path).message}));
    }
    const std::string raw_path = core::errors::get_value(path).value_or(".");

    auto files = host.list_files(context.workspace_root, raw_path);
    if (core::errors::is_error(files)) {
        return to_text(json::array({"Error: " + core::errors::get_error(files).message}));
    }
    return to_text(json(core::errors::get_value(files)));
}

std::string read_file(const ToolHost& host, const json& arguments,
                      const ToolContext& context) {
    auto path = string_argument(arguments, "path");
    if (core::errors::is_error(path)) {
        return error_text("Error reading file: ", core::errors::get_error(path));
    }
    const auto& raw_path = core::errors::get_value(path);

    auto content = host.read_file(context.workspace_root, raw_path);
    if (core::errors::is_error(content)) {
        return error_text("Error reading file " + raw_path + ": ",
                          core::errors::get_error(content));
    }
    return core::errors::get_value(content);
}

std::string write_file(const ToolHost& host, const json& arguments,
                       const ToolContext& context) {
    auto path = string_argument(arguments, "path");
    if (core::errors::is_error(path)) {
        return error_text("Error writing to file: ", core::errors::get_error(path));
    }
    auto content = string_argument(arguments, "content");
    if (core::errors::is_error(content)) {
        return error_text("Error writing to file: ", core::errors::get_error(content));
    }
    const auto& raw_path = core::errors::get_value(path);

    auto written = host.write_file(context.workspace_root, raw_path,
                                   core::errors::get_value(content));
    if (core::errors::is_error(written)) {
        return error_text("Error writing to file " + raw_path + ": ",
                          core::errors::get_error(written));
    }
    return "Successfully wrote to " + raw_path;
}

std::string run_command(const ToolHost& host, const json& arguments,
                        const ToolContext& context) {
    auto command = string_argument(arguments, "command");
    if (core::errors::is_error(command)) {
        return error_text("Error running command: ", core::errors::get_error(command));
    }

    CommandRequest request;
    request.command = core::errors::get_value(command);
    request.timeout_ms = context.command_timeout_ms;

    auto capture = host.run_command(context.workspace_root, request);
    if (core::errors::is_error(capture)) {
        return error_text("Error running command: ", core::errors::get_error(capture));
    }
    const auto& result = core::errors::get_value(capture);
    AUTOLOOP_LOG_DEBUG("[tool] run_command exit=" + std::to_string(result.exit_code) +
                       " duration_ms=" + std::to_string(result.duration_ms));

    std::ostringstream out;
    out << "stdout:\n" << result.stdout_text << "\nstderr:\n" << result.stderr_text;
    if (result.exit_code != 0) {
        out << "\nexit_code: " << result.exit_code;
    }
    return out.str();
}

std::string update_ledger(const json& arguments, const ToolContext& context) {
    auto title = string_argument(arguments, "story_title");
    if (core::errors::is_error(title)) {
        return error_text("Error updating ledger: ", core::errors::get_error(title));
    }
    auto story_id = optional_string_argument(arguments, "story_id");
    if (core::errors::is_error(story_id)) {
        return error_text("Error updating ledger: ", core::errors::get_error(story_id));
    }
    auto notes = optional_string_argument(arguments, "notes");
    if (core::errors::is_error(notes)) {
        return error_text("Error updating ledger: ", core::errors::get_error(notes));
    }

    ledger::NewStory story;
    story.title = core::errors::get_value(title);
    story.id = core::errors::get_value(story_id);
    story.notes = core::errors::get_value(notes);

    const ledger::RequirementsLedger ledger(context.workspace_root, context.ledger_branch);
    auto added = ledger.append(story);
    if (core::errors::is_error(added)) {
        return error_text("Error updating ledger: ", core::errors::get_error(added));
    }
    const auto& stored = core::errors::get_value(added);
    return "Successfully added story '" + stored.title + "' (id " + stored.id + ") to " +
           ledger::kLedgerFileName;
}

std::string ask_user(const json& arguments, const ToolContext& context) {
    auto question = string_argument(arguments, "question");
    if (core::errors::is_error(question)) {
        return error_text("Error asking user: ", core::errors::get_error(question));
    }
    if (context.operator_input == nullptr || context.operator_output == nullptr) {
        return "Error asking user: no operator channel is configured.";
    }

    std::ostream& out = *context.operator_output;
    out << "\n[AGENT ASKS]: " << core::errors::get_value(question) << "\nYour answer: "
        << std::flush;

    std::string answer;
    if (!std::getline(*context.operator_input, answer)) {
        return "Error asking user: operator input is closed.";
    }
    if (!answer.empty() && answer.back() == '\r') {
        answer.pop_back();
    }
    return answer;
}

std::string update_instruction(const json& arguments, const ToolContext& context) {
    auto text = string_argument(arguments, "new_instruction");
    if (core::errors::is_error(text)) {
        return error_text("Error updating instruction: ", core::errors::get_error(text));
    }
    if (context.instruction_path.empty()) {
        return "Error: No instruction file path found in configuration.";
    }

    const session::InstructionStore store(context.instruction_path, "");
    auto saved = store.save(core::errors::get_value(text));
    if (core::errors::is_error(saved)) {
        return error_text("Error updating instruction: ", core::errors::get_error(saved));
    }
    return "Successfully updated instruction file.";
}

std::string done(const ToolContext& context) {
    if (context.workspace_root.empty()) {
        return "Error: Working directory not configured.";
    }
    return protocol::kCompletionSentinel;
}

}  // namespace

void ToolDispatcher::register_tool(ToolSpec spec, ToolHandler handler) {
    auto name = spec.name;
    tools_.insert_or_assign(std::move(name), Entry{std::move(spec), std::move(handler)});
}

void ToolDispatcher::restrict_to(const std::vector<std::string>& allowed) {
    if (allowed.empty()) {
        return;
    }
    for (auto it = tools_.begin(); it != tools_.end();) {
        const bool keep = it->first == "done" ||
                          std::find(allowed.begin(), allowed.end(), it->first) !=
                              allowed.end();
        if (keep) {
            ++it;
        } else {
            AUTOLOOP_LOG_DEBUG("Tool disabled by configuration: " + it->first);
            it = tools_.erase(it);
        }
    }
}

bool ToolDispatcher::has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::vector<ToolSpec> ToolDispatcher::specs() const {
    std::vector<ToolSpec> specs;
    specs.reserve(tools_.size());
    for (const auto& [name, entry] : tools_) {
        specs.push_back(entry.spec);
    }
    return specs;
}

std::string ToolDispatcher::execute(const protocol::ToolCall& call,
                                    const ToolContext& context) const {
    auto it = tools_.find(call.name);
    if (it == tools_.end()) {
        AUTOLOOP_LOG_WARN("Unknown tool requested: " + call.name);
        return "Error: Tool '" + call.name + "' not found";
    }

    json arguments = json::object();
    if (!call.arguments.empty()) {
        arguments = json::parse(call.arguments, nullptr, false);
        if (arguments.is_discarded() || !arguments.is_object()) {
            return "Error: Invalid arguments for tool '" + call.name +
                   "': expected a JSON object";
        }
    }

    const bool debug =
        core::logging::Logger::get().enabled(core::logging::LogLevel::DEBUG);
    if (debug) {
        AUTOLOOP_LOG_DEBUG("[tool] start name=" + call.name + " args=" +
                           summarize(call.arguments));
    }
    std::string result;
    try {
        result = it->second.handler(arguments, context);
    } catch (const std::exception& ex) {
        result = "Error: Tool '" + call.name + "' failed: " + ex.what();
    }
    if (debug) {
        AUTOLOOP_LOG_DEBUG("[tool] end name=" + call.name +
                           " size=" + std::to_string(result.size()));
    }
    return result;
}

ToolDispatcher make_default_dispatcher(ToolHost host) {
    ToolDispatcher dispatcher;

    dispatcher.register_tool(
        ToolSpec{"list_files",
                 "List all files in the given directory, recursively, relative to it.",
                 {ToolParameter{"path", ParameterType::OptionalString,
                                "Directory to list. Defaults to the working directory."}}},
        [host](const json& arguments, const ToolContext& context) {
            return list_files(host, arguments, context);
        });

    dispatcher.register_tool(
        ToolSpec{"read_file",
                 "Read the content of a file.",
                 {ToolParameter{"path", ParameterType::String, "The file to read."}}},
        [host](const json& arguments, const ToolContext& context) {
            return read_file(host, arguments, context);
        });

    dispatcher.register_tool(
        ToolSpec{"write_file",
                 "Write content to a file, creating parent directories as needed.",
                 {ToolParameter{"path", ParameterType::String, "The file to write."},
                  ToolParameter{"content", ParameterType::String, "The full new content."}}},
        [host](const json& arguments, const ToolContext& context) {
            return write_file(host, arguments, context);
        });

    dispatcher.register_tool(
        ToolSpec{"run_command",
                 "Run a shell command in the working directory and return its stdout "
                 "and stderr. Commands are killed after the configured timeout.",
                 {ToolParameter{"command", ParameterType::String,
                                "The shell command to run."}}},
        [host](const json& arguments, const ToolContext& context) {
            return run_command(host, arguments, context);
        });

    dispatcher.register_tool(
        ToolSpec{"update_ledger",
                 "Add a new user story to the requirements ledger (prd.json). Use it to "
                 "track requirements and progress.",
                 {ToolParameter{"story_title", ParameterType::String,
                                "The title of the user story."},
                  ToolParameter{"story_id", ParameterType::OptionalString,
                                "The story ID. A random one is generated when omitted."},
                  ToolParameter{"notes", ParameterType::OptionalString,
                                "Additional notes for the story."}}},
        [](const json& arguments, const ToolContext& context) {
            return update_ledger(arguments, context);
        });

    dispatcher.register_tool(
        ToolSpec{"ask_user",
                 "Ask the operator a question. Execution pauses until they answer.",
                 {ToolParameter{"question", ParameterType::String,
                                "The question to ask."}}},
        [](const json& arguments, const ToolContext& context) {
            return ask_user(arguments, context);
        });

    dispatcher.register_tool(
        ToolSpec{"update_instruction",
                 "Overwrite the current instruction with new details or clarifications. "
                 "The next step sees the new text.",
                 {ToolParameter{"new_instruction", ParameterType::String,
                                "The complete new instruction text."}}},
        [](const json& arguments, const ToolContext& context) {
            return update_instruction(arguments, context);
        });

    dispatcher.register_tool(
        ToolSpec{"done",
                 "Signal that the objective is met and the loop should terminate.",
                 {}},
        [](const json&, const ToolContext& context) { return done(context); });

    return dispatcher;
}

}  // namespace autoloop::tools
