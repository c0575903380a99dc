#pragma once
#include "protocol/run_request.hpp"
#include "core/errors/loop_errors.hpp"

namespace autoloop::app::cli {
    autoloop::core::errors::Result<autoloop::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);
}
