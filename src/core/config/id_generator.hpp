#pragma once
#include <string>
#include <random>
#include <sstream>

namespace autoloop::core::config {

    // Random lowercase hex string of the given length
    inline std::string random_hex(int length) {
        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Generates a simple 8-character hex ID prefixed with "run-"
    inline std::string generate_run_id() {
        return "run-" + random_hex(8);
    }

    // Ledger stories get a bare 8-character hex ID when the caller supplies none
    inline std::string generate_story_id() {
        return random_hex(8);
    }

} // namespace autoloop::core::config
