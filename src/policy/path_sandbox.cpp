#include "policy/path_sandbox.hpp"

#include <deque>
#include <system_error>

namespace autoloop::policy {

using core::errors::ErrorCategory;
using core::errors::LoopError;

namespace {

constexpr int kMaxSymlinkHops = 40;

// Resolves "." and ".." and expands every symlink along an absolute path,
// including links whose target does not exist yet. Components that do not
// exist are kept as-is.
core::errors::Result<std::filesystem::path> follow_symlinks(
    const std::filesystem::path& absolute) {
    std::filesystem::path resolved = absolute.root_path();
    const auto relative = absolute.relative_path();
    std::deque<std::filesystem::path> pending(relative.begin(), relative.end());
    int hops = 0;

    while (!pending.empty()) {
        const std::filesystem::path part = pending.front();
        pending.pop_front();
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            resolved = resolved.parent_path();
            continue;
        }

        const std::filesystem::path next = resolved / part;
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(next, ec);
        if (ec || !std::filesystem::is_symlink(status)) {
            resolved = next;
            continue;
        }

        if (++hops > kMaxSymlinkHops) {
            return LoopError{ErrorCategory::Policy, "too many levels of symbolic links",
                             "invalid_path"};
        }
        const std::filesystem::path target = std::filesystem::read_symlink(next, ec);
        if (ec) {
            return LoopError{ErrorCategory::Policy,
                             "unable to read link " + next.string() + ": " + ec.message(),
                             "invalid_path"};
        }
        if (target.is_absolute()) {
            resolved = target.root_path();
        }
        const auto target_relative = target.relative_path();
        pending.insert(pending.begin(), target_relative.begin(), target_relative.end());
    }
    return resolved;
}

}  // namespace

bool PathSandbox::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

core::errors::Result<std::filesystem::path> PathSandbox::canonical_root(
    const std::filesystem::path& workspace_root) {
    if (workspace_root.empty()) {
        return LoopError{ErrorCategory::Config, "Working directory is not configured.",
                         "invalid_workspace_root"};
    }

    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return LoopError{ErrorCategory::Config,
                         "Working directory does not exist: " + workspace_root.string(),
                         "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return LoopError{ErrorCategory::Config,
                         "Working directory is not a directory: " +
                             workspace_root.string(),
                         "invalid_workspace_root"};
    }

    std::filesystem::path canonical = std::filesystem::canonical(workspace_root, ec);
    if (ec) {
        return LoopError{ErrorCategory::Config,
                         "Unable to resolve working directory: " + workspace_root.string(),
                         "invalid_workspace_root"};
    }
    return canonical;
}

core::errors::Result<std::filesystem::path> PathSandbox::resolve(
    const std::filesystem::path& raw_path,
    const std::filesystem::path& workspace_root) {
    auto root_result = canonical_root(workspace_root);
    if (core::errors::is_error(root_result)) {
        return core::errors::get_error(root_result);
    }
    const std::filesystem::path& root = core::errors::get_value(root_result);

    std::filesystem::path candidate = raw_path;
    if (candidate.empty()) {
        candidate = ".";
    }
    if (candidate.is_relative()) {
        candidate = root / candidate;
    }

    auto followed = follow_symlinks(candidate);
    if (core::errors::is_error(followed)) {
        const auto& error = core::errors::get_error(followed);
        return LoopError{ErrorCategory::Policy,
                         "Unable to resolve path '" + raw_path.string() + "' against " +
                             root.string() + ": " + error.message,
                         "invalid_path"};
    }
    const std::filesystem::path& canonical_candidate = core::errors::get_value(followed);

    if (!is_within_root(root, canonical_candidate)) {
        return LoopError{ErrorCategory::Policy,
                         "Path escapes working directory: '" + raw_path.string() +
                             "' is outside " + root.string(),
                         "path_escape"};
    }

    return canonical_candidate;
}

}  // namespace autoloop::policy
