#include "memrun/launcher.hpp"
#include "memrun/errors.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <fmt/format.h>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace memrun {

namespace {

constexpr std::array<int, 6> kForwardedSignals = {SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGUSR1, SIGUSR2};

volatile sig_atomic_t g_child_pid = 0;

void forwardSignal(int sig) {
    const pid_t pid = g_child_pid;
    if (pid > 0) {
        ::kill(pid, sig);
    }
}

std::vector<char*> makeArgv(const std::string& program, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

bool isExecutableFile(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

// Blocks the forwarded signals in the calling thread for the lifetime of the guard.
class SignalBlock {
public:
    SignalBlock() {
        sigset_t set;
        sigemptyset(&set);
        for (const int sig : kForwardedSignals) {
            sigaddset(&set, sig);
        }
        pthread_sigmask(SIG_BLOCK, &set, &previous_);
    }
    ~SignalBlock() { restore(); }

    SignalBlock(const SignalBlock&) = delete;
    SignalBlock& operator=(const SignalBlock&) = delete;

    void restore() noexcept {
        if (!restored_) {
            pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
            restored_ = true;
        }
    }

private:
    sigset_t previous_{};
    bool restored_{false};
};

} // namespace

std::vector<std::string> substitutePlaceholder(const std::vector<std::string>& args,
                                               const std::string& token,
                                               const std::string& path) {
    std::vector<std::string> result;
    result.reserve(args.size());
    for (const auto& arg : args) {
        if (token.empty()) {
            result.push_back(arg);
            continue;
        }
        std::string out;
        std::size_t pos = 0;
        for (std::size_t hit = arg.find(token); hit != std::string::npos; hit = arg.find(token, pos)) {
            out.append(arg, pos, hit - pos);
            out += path;
            pos = hit + token.size();
        }
        out.append(arg, pos, std::string::npos);
        result.push_back(std::move(out));
    }
    return result;
}

void Launcher::preflight(const std::string& program) {
    if (program.empty()) {
        throw ExecFailure("No program given");
    }
    if (program.find('/') != std::string::npos) {
        if (!isExecutableFile(program)) {
            throw ExecFailure(fmt::format("Program '{}' does not exist or is not executable", program));
        }
        return;
    }

    const char* env_path = std::getenv("PATH");
    std::istringstream dirs{env_path ? env_path : "/usr/local/bin:/usr/bin:/bin"};
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (isExecutableFile((dir.empty() ? std::string{"."} : dir) + "/" + program)) {
            return;
        }
    }
    throw ExecFailure(fmt::format("Program '{}' not found in PATH", program));
}

int Launcher::launch(const LaunchSpec& spec, const std::string& memory_file_path) {
    const auto args = substitutePlaceholder(spec.args, spec.placeholder, memory_file_path);

    if (::setenv("MEMFD_PATH", memory_file_path.c_str(), 1) != 0) {
        throw ExecFailure(fmt::format("Cannot set MEMFD_PATH: {}", std::strerror(errno)));
    }
    spdlog::debug("Set MEMFD_PATH={}", memory_file_path);

    if (mode_ == LaunchMode::Replace) {
        replace(spec.program, args);
    }
    return spawnAndWait(spec.program, args);
}

void Launcher::replace(const std::string& program, const std::vector<std::string>& args) {
    spdlog::info("Executing program: {}", program);
    spdlog::default_logger()->flush();

    auto argv = makeArgv(program, args);
    ::execvp(program.c_str(), argv.data());
    throw ExecFailure(fmt::format("execvp '{}' failed: {}", program, std::strerror(errno)));
}

int Launcher::spawnAndWait(const std::string& program, const std::vector<std::string>& args) {
    spdlog::info("Spawning program: {}", program);
    spdlog::default_logger()->flush();

    auto argv = makeArgv(program, args);

    // The child reports an execvp failure through this pipe; a successful exec closes it.
    int report[2] = {-1, -1};
    if (::pipe2(report, O_CLOEXEC) != 0) {
        throw ExecFailure(fmt::format("pipe failed: {}", std::strerror(errno)));
    }

    SignalBlock blocked;
    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(report[0]);
        ::close(report[1]);
        throw ExecFailure(fmt::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        ::close(report[0]);
        blocked.restore();
        ::execvp(program.c_str(), argv.data());
        const int err = errno;
        [[maybe_unused]] const ssize_t n = ::write(report[1], &err, sizeof(err));
        ::_exit(127);
    }

    ::close(report[1]);
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(report[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(report[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        throw ExecFailure(fmt::format("execvp '{}' failed: {}", program, std::strerror(child_errno)));
    }

    g_child_pid = pid;
    std::array<struct sigaction, kForwardedSignals.size()> previous{};
    struct sigaction forward {};
    forward.sa_handler = forwardSignal;
    sigemptyset(&forward.sa_mask);
    for (std::size_t i = 0; i < kForwardedSignals.size(); ++i) {
        sigaction(kForwardedSignals[i], &forward, &previous[i]);
    }
    blocked.restore();

    int status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    const int wait_errno = errno;

    for (std::size_t i = 0; i < kForwardedSignals.size(); ++i) {
        sigaction(kForwardedSignals[i], &previous[i], nullptr);
    }
    g_child_pid = 0;

    if (waited < 0) {
        throw ExecFailure(fmt::format("waitpid failed: {}", std::strerror(wait_errno)));
    }
    if (WIFSIGNALED(status)) {
        spdlog::warn("{} terminated by signal {}", program, WTERMSIG(status));
        return 128 + WTERMSIG(status);
    }
    const int code = WEXITSTATUS(status);
    spdlog::info("{} exited with code {}", program, code);
    return code;
}

} // namespace memrun
