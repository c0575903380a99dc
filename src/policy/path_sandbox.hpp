#pragma once

#include <filesystem>
#include "core/errors/loop_errors.hpp"

namespace autoloop::policy {

// Confines tool paths to a working-directory root.
class PathSandbox {
public:
    // Relative paths are joined to the root, absolute paths are taken as-is.
    // Every symlink on the path is expanded, dangling ones included, and ".." is
    // applied before the containment check. Fails with code "path_escape" when
    // the result lies outside the root.
    static core::errors::Result<std::filesystem::path> resolve(
        const std::filesystem::path& raw_path,
        const std::filesystem::path& workspace_root);

    // Canonical form of an existing directory root.
    static core::errors::Result<std::filesystem::path> canonical_root(
        const std::filesystem::path& workspace_root);

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
};

}  // namespace autoloop::policy
