#pragma once

#include <string>
#include <vector>

namespace memrun {

inline constexpr const char* kDefaultPlaceholder = "{{memfd}}";

enum class LaunchMode {
    // execvp into the target: same pid, same descriptors, no return on success.
    Replace,
    // fork + execvp, forward signals, wait and hand back the child's exit code.
    Spawn,
};

struct LaunchSpec {
    std::string program;
    std::vector<std::string> args;
    std::string placeholder{kDefaultPlaceholder};
};

// Replaces every occurrence of token inside each argument with path.
[[nodiscard]] std::vector<std::string> substitutePlaceholder(const std::vector<std::string>& args,
                                                             const std::string& token,
                                                             const std::string& path);

class Launcher {
public:
    explicit Launcher(LaunchMode mode = LaunchMode::Replace) : mode_(mode) {}

    // Throws ExecFailure if program cannot be resolved to an executable file.
    static void preflight(const std::string& program);

    // Runs the target with the placeholder substituted and MEMFD_PATH exported.
    // Replace mode only returns by throwing ExecFailure; Spawn mode returns the
    // child's exit code (128 + signal number if it was killed).
    int launch(const LaunchSpec& spec, const std::string& memory_file_path);

    [[nodiscard]] LaunchMode mode() const noexcept { return mode_; }

private:
    [[noreturn]] void replace(const std::string& program, const std::vector<std::string>& args);
    int spawnAndWait(const std::string& program, const std::vector<std::string>& args);

    LaunchMode mode_;
};

} // namespace memrun
