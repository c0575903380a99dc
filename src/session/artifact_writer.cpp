#include "session/artifact_writer.hpp"

#include <chrono>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace autoloop::session {

using core::errors::LoopError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

// Tool output is arbitrary bytes; invalid UTF-8 is written as U+FFFD.
std::string serialize(const json& event) {
    return event.dump(-1, ' ', false, json::error_handler_t::replace);
}

json request_to_json(const protocol::RunRequest& request, const std::uint32_t limit,
                     const std::vector<protocol::ToolSpec>& tools) {
    json payload;
    payload["working_directory"] = request.working_directory.string();
    payload["instruction_file"] = request.instruction_file.string();
    payload["decisions_file"] = request.decisions_file.string();
    payload["config_file"] =
        request.config_file.has_value() ? request.config_file.value().string() : "";
    payload["limit"] = limit;
    payload["verbose"] = request.verbose;

    json offered = json::array();
    for (const auto& tool : tools) {
        offered.push_back({{"name", tool.name},
                           {"description", tool.description},
                           {"parameters", json::parse(tool.parameters_json())}});
    }
    payload["tools"] = offered;
    return payload;
}

json message_to_json(const protocol::Message& message) {
    json payload;
    payload["role"] = protocol::to_string(message.role);
    payload["content"] = message.content;
    if (!message.tool_calls.empty()) {
        json calls = json::array();
        for (const auto& call : message.tool_calls) {
            calls.push_back({{"id", call.id}, {"name", call.name},
                             {"arguments", call.arguments}});
        }
        payload["tool_calls"] = calls;
    }
    if (message.tool_call_id.has_value()) {
        payload["tool_call_id"] = message.tool_call_id.value();
    }
    if (message.tool_name.has_value()) {
        payload["tool_name"] = message.tool_name.value();
    }
    return payload;
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path workspace_root,
                               std::filesystem::path artifact_subdir)
    : workspace_root_(std::move(workspace_root)),
      artifact_subdir_(std::move(artifact_subdir)) {}

core::errors::Result<std::filesystem::path> ArtifactWriter::run_log_path(
    const std::string& run_id) const {
    if (run_id.empty()) {
        return LoopError{ErrorCategory::Input, "Run ID cannot be empty.",
                         "invalid_run_id"};
    }

    std::error_code ec;
    if (!std::filesystem::exists(workspace_root_, ec) || ec) {
        return LoopError{ErrorCategory::Config,
                         "Workspace root does not exist: " +
                             workspace_root_.string(),
                         "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return LoopError{ErrorCategory::Config,
                         "Workspace root is not a directory: " +
                             workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    const auto canonical_root =
        std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return LoopError{ErrorCategory::Config,
                         "Unable to resolve workspace root: " +
                             workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    auto artifacts_dir = canonical_root / artifact_subdir_;
    std::filesystem::create_directories(artifacts_dir, ec);
    if (ec) {
        return LoopError{ErrorCategory::Internal,
                         "Unable to create artifacts directory: " +
                             artifacts_dir.string(),
                         "artifact_dir_create_failed"};
    }

    const auto run_file = artifacts_dir / (run_id + ".jsonl");
    return run_file;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::append_event(
    const std::string& run_id, const std::string& event_json) const {
    auto run_path_result = run_log_path(run_id);
    if (core::errors::is_error(run_path_result)) {
        return core::errors::get_error(run_path_result);
    }
    const auto run_path = core::errors::get_value(run_path_result);

    std::ofstream out(run_path, std::ios::app);
    if (!out.is_open()) {
        return LoopError{ErrorCategory::Internal,
                         "Unable to open artifact file: " + run_path.string(),
                         "artifact_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return LoopError{ErrorCategory::Internal,
                         "Unable to write artifact event: " + run_path.string(),
                         "artifact_write_failed"};
    }

    return run_path;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_request(
    const std::string& run_id, const protocol::RunRequest& request,
    const std::uint32_t limit, const std::vector<protocol::ToolSpec>& tools) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "request";
    event["run_id"] = run_id;
    event["payload"] = request_to_json(request, limit, tools);
    return append_event(run_id, serialize(event));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_iteration(
    const std::string& run_id, const protocol::IterationRecord& record) const {
    json messages = json::array();
    for (const auto& message : record.new_messages) {
        messages.push_back(message_to_json(message));
    }

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "iteration";
    event["run_id"] = run_id;
    event["payload"] = {{"index", record.index}, {"messages", messages}};
    return append_event(run_id, serialize(event));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_final(
    const std::string& run_id, const protocol::RunResult& result) const {
    json payload;
    payload["status"] = protocol::to_string(result.status);
    payload["iterations"] = result.iterations;
    payload["message_count"] = result.history.size();
    payload["error_code"] = result.error.has_value() ? result.error->code : "";
    payload["error_message"] = result.error.has_value() ? result.error->message : "";

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "final";
    event["run_id"] = run_id;
    event["payload"] = payload;
    return append_event(run_id, serialize(event));
}

}  // namespace autoloop::session
