#pragma once

#include <cstdint>
#include "core/errors/loop_errors.hpp"
#include "protocol/run_execution_contract.hpp"

namespace autoloop::runtime {

// Receives per-iteration progress from the LoopController.
class LoopObserver {
public:
    virtual ~LoopObserver() = default;

    virtual void on_iteration_start(std::uint32_t index, std::uint32_t limit) = 0;
    virtual void on_iteration_end(const protocol::IterationRecord& record) = 0;
    virtual void on_error(std::uint32_t index, const core::errors::LoopError& error) = 0;
    virtual void on_finished(const protocol::RunResult& result) = 0;
};

// Echoes progress through the logger: "[ROLE]: content" per new message.
class LoggingObserver : public LoopObserver {
public:
    void on_iteration_start(std::uint32_t index, std::uint32_t limit) override;
    void on_iteration_end(const protocol::IterationRecord& record) override;
    void on_error(std::uint32_t index, const core::errors::LoopError& error) override;
    void on_finished(const protocol::RunResult& result) override;
};

}  // namespace autoloop::runtime
