#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>
#include "core/config/loop_config.hpp"

namespace autoloop::app::cli {

    using namespace autoloop::core::errors;
    using autoloop::protocol::CommandKind;
    using autoloop::protocol::RunRequest;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> instruction_file;
        std::optional<std::string> decisions;
        std::optional<std::string> config;
        std::optional<std::string> directory;
        std::optional<std::string> limit;
        bool verbose = false;
    };

    const char* kUsage =
        "Usage: autoloop loop <instruction_file> --decisions <file> "
        "[--directory DIR] [--limit N] [--config FILE] [--verbose]";

    Result<std::filesystem::path> canonical_directory(const std::string& raw) {
        std::filesystem::path p(raw);
        std::error_code path_ec;
        const bool is_dir = std::filesystem::is_directory(p, path_ec);
        if (path_ec || !is_dir) {
            return LoopError{ErrorCategory::Input, "Working directory does not exist or is not a directory: " + raw, "invalid_path"};
        }

        std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
        if (path_ec) {
            return LoopError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
        }
        return canonical_path;
    }

    } // namespace

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return LoopError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        RunRequest req;
        if (command == "version" || command == "--version") {
            req.command = CommandKind::Version;
            return req;
        }
        if (command != "loop") {
            return LoopError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: loop, version."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'loop' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--decisions") {
                if (i + 1 < args.size()) raw.decisions = args[++i];
                else return LoopError{ErrorCategory::Input, "Missing value for --decisions", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return LoopError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--directory" || args[i] == "-d") {
                if (i + 1 < args.size()) raw.directory = args[++i];
                else return LoopError{ErrorCategory::Input, "Missing value for --directory", "missing_value"};
            } else if (args[i] == "--limit" || args[i] == "-l") {
                if (i + 1 < args.size()) raw.limit = args[++i];
                else return LoopError{ErrorCategory::Input, "Missing value for --limit", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i].rfind("-", 0) != 0 && !raw.instruction_file.has_value()) {
                raw.instruction_file = args[i];
            } else {
                return LoopError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.command = CommandKind::Loop;
        req.verbose = raw.verbose;

        if (!raw.instruction_file.has_value()) {
            return LoopError{ErrorCategory::Input, "Missing instruction file argument", "missing_instruction_file", kUsage};
        }
        if (!raw.decisions.has_value()) {
            return LoopError{ErrorCategory::Input, "Must provide --decisions", "missing_required_flag", kUsage};
        }
        req.instruction_file = std::filesystem::path(raw.instruction_file.value());
        req.decisions_file = std::filesystem::path(raw.decisions.value());
        if (raw.config) req.config_file = std::filesystem::path(raw.config.value());

        // Exception-free integer parsing
        if (raw.limit) {
            uint32_t limit = 0;
            const char* begin = raw.limit->data();
            const char* end = raw.limit->data() + raw.limit->size();
            auto [ptr, ec] = std::from_chars(begin, end, limit);
            if (ec != std::errc() || ptr != end) {
                return LoopError{ErrorCategory::Input, "Invalid number for --limit", "invalid_integer", "Provide a positive integer."};
            }
            if (limit == 0 || limit > autoloop::core::config::kMaxLimit) {
                return LoopError{ErrorCategory::Input, "--limit out of bounds", "bounds_error", "Must be between 1 and 1000."};
            }
            req.limit = limit;
        }

        // Path validation
        const std::string directory = raw.directory.value_or(".");
        auto canonical = canonical_directory(directory);
        if (is_error(canonical)) {
            return get_error(canonical);
        }
        req.working_directory = get_value(canonical);

        return req;
    }

} // namespace autoloop::app::cli
