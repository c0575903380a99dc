#include "tools/tool_host.hpp"

#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include "policy/path_sandbox.hpp"

namespace autoloop::tools {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using policy::PathSandbox;

namespace {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

// Well-formed UTF-8: no overlongs, surrogates or code points past U+10FFFF.
// Returns the offset of the first bad byte, or npos.
std::size_t find_invalid_utf8(const std::string& text) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t size = text.size();
    std::size_t i = 0;
    while (i < size) {
        const unsigned char lead = bytes[i];
        std::size_t length = 0;
        unsigned char min_next = 0x80;
        unsigned char max_next = 0xBF;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) {
                min_next = 0xA0;
            } else if (lead == 0xED) {
                max_next = 0x9F;
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) {
                min_next = 0x90;
            } else if (lead == 0xF4) {
                max_next = 0x8F;
            }
        } else {
            return i;
        }

        if (i + length > size) {
            return i;
        }
        if (bytes[i + 1] < min_next || bytes[i + 1] > max_next) {
            return i;
        }
        for (std::size_t k = 2; k < length; ++k) {
            if (bytes[i + k] < 0x80 || bytes[i + k] > 0xBF) {
                return i;
            }
        }
        i += length;
    }
    return std::string::npos;
}

core::errors::Result<ProcessCapture> run_shell_command(
    const std::string& command, const std::filesystem::path& cwd,
    const std::uint32_t timeout_ms) {
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return LoopError{ErrorCategory::Internal,
                         "Failed to create process pipes: " + reason,
                         "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return LoopError{ErrorCategory::Execution, "Failed to fork process: " + reason,
                         "fork_failed"};
    }

    if (pid == 0) {
        // Own process group, so a timeout can kill everything the shell started.
        static_cast<void>(setpgid(0, 0));
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        const int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            static_cast<void>(dup2(null_fd, STDIN_FILENO));
            static_cast<void>(close(null_fd));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!capture.timed_out && timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(timeout_ms)) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A process that left the group may still hold the pipes open.
        if (capture.timed_out && child_exited) {
            break;
        }
    }

    if (stdout_open) {
        static_cast<void>(close(stdout_pipe[0]));
    }
    if (stderr_open) {
        static_cast<void>(close(stderr_pipe[0]));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace

core::errors::Result<std::vector<std::string>> ToolHost::list_files(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& path) const {
    auto resolved = PathSandbox::resolve(path, workspace_root);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path scope = core::errors::get_value(resolved);

    std::vector<std::string> files;
    std::error_code ec;
    if (!std::filesystem::exists(scope, ec) || ec) {
        return files;
    }
    if (!std::filesystem::is_directory(scope, ec) || ec) {
        return files;
    }

    const auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(scope, options, ec);
    if (ec) {
        return LoopError{ErrorCategory::Execution,
                         "Unable to list " + scope.string() + ": " + ec.message(),
                         "list_failed"};
    }
    const auto end = std::filesystem::recursive_directory_iterator{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return LoopError{ErrorCategory::Execution,
                             "Unable to list " + scope.string() + ": " + ec.message(),
                             "list_failed"};
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) {
            continue;
        }
        files.push_back(it->path().lexically_relative(scope).generic_string());
    }
    if (ec) {
        return LoopError{ErrorCategory::Execution,
                         "Unable to list " + scope.string() + ": " + ec.message(),
                         "list_failed"};
    }

    std::sort(files.begin(), files.end());
    return files;
}

core::errors::Result<std::string> ToolHost::read_file(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& path) const {
    auto resolved = PathSandbox::resolve(path, workspace_root);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return LoopError{ErrorCategory::Execution,
                         "File does not exist: " + file_path.string(), "read_failed"};
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return LoopError{ErrorCategory::Execution,
                         "Path is not a regular file: " + file_path.string(),
                         "read_failed"};
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return LoopError{ErrorCategory::Execution,
                         "Failed to open file: " + file_path.string(), "read_failed"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return LoopError{ErrorCategory::Execution,
                         "I/O error while reading file: " + file_path.string(),
                         "read_failed"};
    }

    std::string content = buffer.str();
    const std::size_t bad = find_invalid_utf8(content);
    if (bad != std::string::npos) {
        return LoopError{ErrorCategory::Execution,
                         "File is not valid UTF-8 text (invalid byte at offset " +
                             std::to_string(bad) + ")",
                         "invalid_utf8"};
    }
    return content;
}

core::errors::Result<std::filesystem::path> ToolHost::write_file(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& path,
    const std::string& content) const {
    auto resolved = PathSandbox::resolve(path, workspace_root);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return LoopError{ErrorCategory::Execution,
                         "Path is a directory: " + file_path.string(), "write_failed"};
    }
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return LoopError{ErrorCategory::Execution,
                         "Unable to create parent directories for " +
                             file_path.string() + ": " + ec.message(),
                         "write_failed"};
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return LoopError{ErrorCategory::Execution,
                         "Failed to open file for writing: " + file_path.string(),
                         "write_failed"};
    }
    out << content;
    out.flush();
    if (!out.good()) {
        return LoopError{ErrorCategory::Execution,
                         "I/O error while writing file: " + file_path.string(),
                         "write_failed"};
    }
    return file_path;
}

core::errors::Result<CommandCapture> ToolHost::run_command(
    const std::filesystem::path& workspace_root,
    const CommandRequest& request) const {
    if (request.command.empty()) {
        return LoopError{ErrorCategory::Execution, "Command cannot be empty.",
                         "empty_command"};
    }

    auto root = PathSandbox::canonical_root(workspace_root);
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }

    auto capture_result = run_shell_command(request.command,
                                            core::errors::get_value(root),
                                            request.timeout_ms);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.timed_out) {
        std::ostringstream message;
        message << "Command timed out after " << request.timeout_ms / 1000.0
                << " seconds: " << request.command;
        return LoopError{ErrorCategory::Execution, message.str(), "command_timeout"};
    }

    CommandCapture result;
    result.exit_code = capture.exit_code;
    result.stdout_text = capture.stdout_text;
    result.stderr_text = capture.stderr_text;
    result.duration_ms = capture.duration_ms;
    return result;
}

}  // namespace autoloop::tools
