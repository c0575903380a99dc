#include "ledger/requirements_ledger.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "policy/path_sandbox.hpp"

namespace autoloop::ledger {

using core::errors::ErrorCategory;
using core::errors::LoopError;
// Keeps the key order of an existing prd.json on rewrite.
using json = nlohmann::ordered_json;

namespace {

json empty_document(const std::string& branch) {
    json doc;
    doc["branchName"] = branch;
    doc["userStories"] = json::array();
    return doc;
}

json load_document(const std::filesystem::path& path, const std::string& branch) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return empty_document(branch);
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return empty_document(branch);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    json doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        AUTOLOOP_LOG_WARN("Ledger " + path.string() +
                          " is not a JSON object; starting from an empty ledger.");
        return empty_document(branch);
    }
    if (!doc.contains("userStories") || !doc["userStories"].is_array()) {
        doc["userStories"] = json::array();
    }
    return doc;
}

Story story_from_json(const json& entry) {
    Story story;
    if (!entry.is_object()) {
        return story;
    }
    if (entry.contains("storyId") && entry["storyId"].is_string()) {
        story.id = entry["storyId"].get<std::string>();
    }
    if (entry.contains("storyTitle") && entry["storyTitle"].is_string()) {
        story.title = entry["storyTitle"].get<std::string>();
    }
    if (entry.contains("passes") && entry["passes"].is_boolean()) {
        story.passes = entry["passes"].get<bool>();
    }
    if (entry.contains("notes") && entry["notes"].is_string()) {
        story.notes = entry["notes"].get<std::string>();
    }
    return story;
}

}  // namespace

RequirementsLedger::RequirementsLedger(std::filesystem::path workspace_root,
                                       std::string default_branch)
    : workspace_root_(std::move(workspace_root)),
      default_branch_(std::move(default_branch)) {}

core::errors::Result<std::filesystem::path> RequirementsLedger::ledger_path() const {
    return policy::PathSandbox::resolve(kLedgerFileName, workspace_root_);
}

core::errors::Result<std::vector<Story>> RequirementsLedger::stories() const {
    auto path_result = ledger_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }

    const json doc = load_document(core::errors::get_value(path_result), default_branch_);
    std::vector<Story> stories;
    for (const auto& entry : doc.at("userStories")) {
        stories.push_back(story_from_json(entry));
    }
    return stories;
}

core::errors::Result<Story> RequirementsLedger::append(const NewStory& story) const {
    if (story.title.empty()) {
        return LoopError{ErrorCategory::Execution, "Story title cannot be empty.",
                         "empty_story_title"};
    }

    auto path_result = ledger_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    json doc = load_document(path, default_branch_);

    Story added;
    added.id = story.id.has_value() && !story.id->empty()
                   ? story.id.value()
                   : core::config::generate_story_id();
    added.title = story.title;
    added.passes = false;
    if (story.notes.has_value() && !story.notes->empty()) {
        added.notes = story.notes;
    }

    json entry;
    entry["storyId"] = added.id;
    entry["storyTitle"] = added.title;
    entry["passes"] = added.passes;
    if (added.notes.has_value()) {
        entry["notes"] = added.notes.value();
    }
    doc["userStories"].push_back(entry);

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return LoopError{ErrorCategory::Execution,
                         "Unable to open ledger for writing: " + path.string(),
                         "ledger_write_failed"};
    }
    out << doc.dump(2) << "\n";
    if (!out.good()) {
        return LoopError{ErrorCategory::Execution,
                         "Unable to write ledger: " + path.string(),
                         "ledger_write_failed"};
    }
    return added;
}

}  // namespace autoloop::ledger
