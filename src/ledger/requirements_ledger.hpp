#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"

namespace autoloop::ledger {

inline constexpr const char* kLedgerFileName = "prd.json";

struct Story {
    std::string id;
    std::string title;
    bool passes = false;
    std::optional<std::string> notes;
};

struct NewStory {
    std::string title;
    std::optional<std::string> id;
    std::optional<std::string> notes;
};

// prd.json inside the working directory. Appends load the whole document,
// add one story and write it back; there is no locking and ids are not
// checked for uniqueness.
class RequirementsLedger {
public:
    explicit RequirementsLedger(std::filesystem::path workspace_root,
                                std::string default_branch = "main");

    // A missing or malformed file reads as an empty ledger on the default branch.
    core::errors::Result<std::vector<Story>> stories() const;

    core::errors::Result<Story> append(const NewStory& story) const;

    core::errors::Result<std::filesystem::path> ledger_path() const;

private:
    std::filesystem::path workspace_root_;
    std::string default_branch_;
};

}  // namespace autoloop::ledger
