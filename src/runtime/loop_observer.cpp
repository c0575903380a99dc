#include "runtime/loop_observer.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include "core/logging/logger.hpp"

namespace autoloop::runtime {

namespace {

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                   });
    return value;
}

}  // namespace

void LoggingObserver::on_iteration_start(const std::uint32_t index,
                                         const std::uint32_t limit) {
    AUTOLOOP_LOG_INFO("Starting iteration " + std::to_string(index) + "/" +
                      std::to_string(limit) + "...");
}

void LoggingObserver::on_iteration_end(const protocol::IterationRecord& record) {
    for (const auto& message : record.new_messages) {
        std::string line = "[" + upper(protocol::to_string(message.role)) + "]: " +
                           message.content;
        for (const auto& call : message.tool_calls) {
            line += "\n  -> " + call.name + " " + call.arguments;
        }
        AUTOLOOP_LOG_INFO(line);
    }
}

void LoggingObserver::on_error(const std::uint32_t index,
                               const core::errors::LoopError& error) {
    AUTOLOOP_LOG_ERROR("Error in iteration " + std::to_string(index) + ": " +
                       error.message);
}

void LoggingObserver::on_finished(const protocol::RunResult& result) {
    switch (result.status) {
        case protocol::RunStatus::Completed:
            AUTOLOOP_LOG_INFO("Objective met (agent signaled done).");
            break;
        case protocol::RunStatus::Exhausted:
            AUTOLOOP_LOG_INFO("Iteration limit reached after " +
                              std::to_string(result.iterations) + " iteration(s).");
            break;
        case protocol::RunStatus::Failed:
            AUTOLOOP_LOG_INFO("Run stopped after a failure.");
            break;
    }
}

}  // namespace autoloop::runtime
