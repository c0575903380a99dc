#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include "app/cli_parser.hpp"
#include "core/config/id_generator.hpp"
#include "core/config/loop_config.hpp"
#include "core/errors/loop_errors.hpp"
#include "core/logging/logger.hpp"
#include "ledger/requirements_ledger.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/loop_controller.hpp"
#include "runtime/loop_observer.hpp"
#include "runtime/prompt_builder.hpp"
#include "runtime/scripted_decision_provider.hpp"
#include "session/artifact_writer.hpp"
#include "session/instruction_store.hpp"
#include "tools/tool_dispatcher.hpp"

#ifndef AUTOLOOP_VERSION
#define AUTOLOOP_VERSION "0.0.0"
#endif

namespace {

// Echoes progress like LoggingObserver and mirrors it into the run transcript.
class TranscriptObserver : public autoloop::runtime::LoggingObserver {
public:
    TranscriptObserver(const autoloop::session::ArtifactWriter& writer, std::string run_id)
        : writer_(writer), run_id_(std::move(run_id)) {}

    void on_iteration_end(const autoloop::protocol::IterationRecord& record) override {
        LoggingObserver::on_iteration_end(record);
        report(writer_.write_iteration(run_id_, record));
    }

    void on_finished(const autoloop::protocol::RunResult& result) override {
        LoggingObserver::on_finished(result);
        report(writer_.write_final(run_id_, result));
    }

    bool ok() const { return ok_; }

private:
    void report(const autoloop::core::errors::Result<std::filesystem::path>& written) {
        if (!autoloop::core::errors::is_error(written)) {
            return;
        }
        const auto& err = autoloop::core::errors::get_error(written);
        AUTOLOOP_LOG_ERROR("Failed to write transcript event [" + err.code + "]: " +
                           err.message);
        ok_ = false;
    }

    const autoloop::session::ArtifactWriter& writer_;
    std::string run_id_;
    bool ok_ = true;
};

void log_error(const std::string& what, const autoloop::core::errors::LoopError& err) {
    AUTOLOOP_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        AUTOLOOP_LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using autoloop::core::errors::get_error;
    using autoloop::core::errors::get_value;
    using autoloop::core::errors::is_error;

    // 1. Tag every log line with this run's ID
    const std::string run_id = autoloop::core::config::generate_run_id();
    autoloop::core::logging::Logger::get().set_run_id(run_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = autoloop::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        log_error("Input error", get_error(parsed));
        return 2;
    }
    const auto& req = get_value(parsed);

    if (req.command == autoloop::protocol::CommandKind::Version) {
        std::cout << AUTOLOOP_VERSION << std::endl;
        return 0;
    }
    if (req.verbose) {
        autoloop::core::logging::Logger::get().set_min_level(
            autoloop::core::logging::LogLevel::DEBUG);
    }

    // 3. Configuration: file values first, then CLI overrides
    autoloop::core::config::LoopConfig config;
    if (req.config_file.has_value()) {
        auto loaded = autoloop::core::config::load_loop_config(req.config_file.value());
        if (is_error(loaded)) {
            log_error("Configuration error", get_error(loaded));
            return 3;
        }
        config = get_value(loaded);
    }
    const std::uint32_t limit = req.limit.value_or(config.limit);

    // 4. Working copy of the instruction inside the working directory
    auto installed =
        autoloop::session::InstructionStore::install(req.instruction_file, req.working_directory);
    if (is_error(installed)) {
        const auto& err = get_error(installed);
        log_error("Instruction setup failed", err);
        return err.category == autoloop::core::errors::ErrorCategory::Input ? 2 : 3;
    }
    const auto& instructions = get_value(installed);

    auto script = autoloop::runtime::ScriptedDecisionProvider::from_file(req.decisions_file);
    if (is_error(script)) {
        const auto& err = get_error(script);
        log_error("Unable to load decisions", err);
        return err.category == autoloop::core::errors::ErrorCategory::Input ? 2 : 3;
    }
    auto provider = get_value(script);

    auto tools = autoloop::tools::make_default_dispatcher();
    tools.restrict_to(config.allowed_tools);

    autoloop::runtime::LoopSettings settings;
    settings.working_directory = req.working_directory;
    settings.limit = limit;
    settings.instruction_path = instructions.path();
    settings.initial_instruction = instructions.fallback_text();
    settings.base_prompt = autoloop::runtime::PromptBuilder::load_base_prompt(
        req.working_directory / config.base_prompt_file);
    settings.ledger_branch = config.branch_name;
    settings.command_timeout_ms = config.command_timeout_seconds * 1000;

    // 5. Run transcript
    autoloop::session::ArtifactWriter artifact_writer(req.working_directory,
                                                      config.artifact_dir);
    auto request_artifact =
        artifact_writer.write_request(run_id, req, limit, tools.specs());
    if (is_error(request_artifact)) {
        log_error("Failed to write request artifact", get_error(request_artifact));
        return 6;
    }
    TranscriptObserver observer(artifact_writer, run_id);

    // 6. Drive the loop
    AUTOLOOP_LOG_INFO("Running up to " + std::to_string(limit) + " iteration(s) in " +
                      req.working_directory.string());
    autoloop::runtime::LoopController controller(settings, provider, tools, &observer);
    auto outcome = controller.run();
    if (is_error(outcome)) {
        log_error("Run configuration error", get_error(outcome));
        return 3;
    }

    const auto& result = get_value(outcome);
    AUTOLOOP_LOG_INFO("Final run state: " + autoloop::protocol::to_string(result.status));
    AUTOLOOP_LOG_INFO("Artifacts: " + get_value(request_artifact).string());

    const autoloop::ledger::RequirementsLedger ledger(req.working_directory,
                                                      config.branch_name);
    auto stories = ledger.stories();
    if (is_error(stories)) {
        log_error("Unable to read the requirements ledger", get_error(stories));
    } else if (!get_value(stories).empty()) {
        std::size_t passing = 0;
        for (const auto& story : get_value(stories)) {
            if (story.passes) {
                ++passing;
            }
        }
        AUTOLOOP_LOG_INFO("Requirements ledger: " +
                          std::to_string(get_value(stories).size()) + " story(ies), " +
                          std::to_string(passing) + " passing.");
    }
    if (!observer.ok()) {
        return 6;
    }
    return result.status == autoloop::protocol::RunStatus::Failed ? 1 : 0;
}
