#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"
#include "protocol/message_contract.hpp"

namespace autoloop::protocol {

enum class RunStatus {
    Completed,  // the done tool returned the completion sentinel
    Exhausted,  // the iteration limit was reached without completion
    Failed      // a step-level fault stopped the loop
};

struct IterationRecord {
    std::uint32_t index = 0;
    std::vector<Message> new_messages;
};

struct RunResult {
    RunStatus status = RunStatus::Exhausted;
    std::uint32_t iterations = 0;
    std::vector<Message> history;
    std::optional<core::errors::LoopError> error;
};

inline std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Completed:
            return "completed";
        case RunStatus::Exhausted:
            return "exhausted";
        case RunStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

}  // namespace autoloop::protocol
