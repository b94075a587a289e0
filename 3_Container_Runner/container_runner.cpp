#include "container_runner.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Dangerzone {

// ============================================================================
// Helpers
// ============================================================================

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

static void close_pipe(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

static bool command_available(const std::string& name) {
    std::string cmd = name + " --version > /dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

const char* runtimeCommand(ContainerRuntime runtime) {
    switch (runtime) {
        case ContainerRuntime::Podman: return "podman";
        case ContainerRuntime::Docker: return "docker";
    }
    return "podman";
}

std::string ContainerError::message() const {
    switch (kind) {
        case ContainerErrorKind::None:            return "No error";
        case ContainerErrorKind::Io:              return "IO error: " + detail;
        case ContainerErrorKind::ExecutionFailed: return "Container execution failed: " + detail;
        case ContainerErrorKind::InvalidName:     return "Invalid container name: " + detail;
    }
    return "Unknown container error";
}

static ContainerError make_error(ContainerErrorKind kind, const std::string& detail) {
    ContainerError e;
    e.kind = kind;
    e.detail = detail;
    return e;
}

// ============================================================================
// ChildProcess Implementation
// ============================================================================

ChildProcess::ChildProcess(pid_t pid, int stdinFd, int stdoutFd, int stderrFd)
    : pid_(pid), stdinFd_(stdinFd), stdoutFd_(stdoutFd), stderrFd_(stderrFd),
      reaped_(false), output_(stdoutFd) {
    // Drain stderr concurrently; a child blocked on a full stderr pipe
    // would otherwise never finish writing stdout.
    errorReader_ = std::thread([this]() {
        char buf[4096];
        for (;;) {
            ssize_t n = ::read(stderrFd_, buf, sizeof(buf));
            if (n > 0) {
                errorOutput_.append(buf, static_cast<size_t>(n));
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
    });
}

ChildProcess::~ChildProcess() {
    closeInput();
    if (!reaped_) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        reaped_ = true;
    }
    joinErrorReader();
    close_fd(stdoutFd_);
    close_fd(stderrFd_);
}

bool ChildProcess::writeInput(const std::vector<uint8_t>& data, ContainerError& error) {
    if (stdinFd_ < 0) {
        error = make_error(ContainerErrorKind::Io, "stdin already closed");
        return false;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdinFd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = make_error(ContainerErrorKind::Io,
                               std::string("write to process stdin failed: ") + std::strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void ChildProcess::closeInput() {
    close_fd(stdinFd_);
}

void ChildProcess::closeOutput() {
    close_fd(stdoutFd_);
}

bool ChildProcess::wait(int& exitCode, ContainerError& error) {
    closeInput();
    if (reaped_) {
        error = make_error(ContainerErrorKind::ExecutionFailed, "process already waited on");
        return false;
    }

    int status = 0;
    for (;;) {
        pid_t r = ::waitpid(pid_, &status, 0);
        if (r == pid_) {
            break;
        }
        if (r < 0 && errno == EINTR) {
            continue;
        }
        error = make_error(ContainerErrorKind::Io,
                           std::string("waitpid failed: ") + std::strerror(errno));
        return false;
    }
    reaped_ = true;
    joinErrorReader();

    if (WIFEXITED(status)) {
        exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitCode = 128 + WTERMSIG(status);
    } else {
        exitCode = -1;
    }
    return true;
}

void ChildProcess::joinErrorReader() {
    if (errorReader_.joinable()) {
        errorReader_.join();
    }
}

std::unique_ptr<ChildProcess> spawnProcess(const std::vector<std::string>& argv,
                                           ContainerError& error) {
    if (argv.empty() || argv[0].empty()) {
        error = make_error(ContainerErrorKind::ExecutionFailed, "empty command line");
        return nullptr;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    // exec_pipe reports an execvp() failure back to the parent; it is
    // close-on-exec, so a successful exec just closes it.
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (::pipe2(stdin_pipe, O_CLOEXEC) < 0 || ::pipe2(stdout_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(stderr_pipe, O_CLOEXEC) < 0 || ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        error = make_error(ContainerErrorKind::Io, std::string("pipe failed: ") + std::strerror(errno));
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        return nullptr;
    }

    pid_t child = ::fork();
    if (child < 0) {
        error = make_error(ContainerErrorKind::Io, std::string("fork failed: ") + std::strerror(errno));
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        return nullptr;
    }

    if (child == 0) {
        // === CHILD ===
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);

        ::execvp(cargv[0], cargv.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // === PARENT ===
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n > 0) {
        int status = 0;
        while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        error = make_error(ContainerErrorKind::Io,
                           "failed to execute " + argv[0] + ": " + std::strerror(exec_errno));
        return nullptr;
    }

    return std::unique_ptr<ChildProcess>(
        new ChildProcess(child, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]));
}

// ============================================================================
// ContainerRunner Implementation
// ============================================================================

ContainerRunner::ContainerRunner(std::string containerName, ContainerRuntime runtime)
    : containerName_(std::move(containerName)), runtime_(runtime) {
}

bool ContainerRunner::detectRuntime(ContainerRuntime& runtime, ContainerError& error) {
    if (command_available("podman")) {
        runtime = ContainerRuntime::Podman;
        return true;
    }
    if (command_available("docker")) {
        runtime = ContainerRuntime::Docker;
        return true;
    }
    error = make_error(ContainerErrorKind::ExecutionFailed,
                       "No container runtime (podman or docker) found");
    return false;
}

std::vector<std::string> ContainerRunner::buildCommand(const std::string& image,
                                                       const std::vector<std::string>& command,
                                                       const std::vector<std::string>& extraArgs) const {
    std::vector<std::string> args = {
        runtimeCommand(runtime_),
        "run",
        "-i",               // Keep stdin open
        "--rm",             // Remove container after exit
        "--name", containerName_,
        "--network", "none",
        "-u", "dangerzone",
        "--cap-drop", "all",
    };

    if (runtime_ == ContainerRuntime::Podman) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
        args.push_back("--userns");
        args.push_back("keep-id");
    } else {
        args.push_back("--security-opt=no-new-privileges:true");
    }

    args.insert(args.end(), extraArgs.begin(), extraArgs.end());
    args.push_back(image);
    args.insert(args.end(), command.begin(), command.end());
    return args;
}

std::unique_ptr<ChildProcess> ContainerRunner::run(const std::string& image,
                                                   const std::vector<std::string>& command,
                                                   const std::vector<std::string>& extraArgs,
                                                   ContainerError& error) const {
    if (containerName_.empty()) {
        error = make_error(ContainerErrorKind::InvalidName, "Container name cannot be empty");
        return nullptr;
    }
    return spawnProcess(buildCommand(image, command, extraArgs), error);
}

// ============================================================================
// Renderer exit codes
// ============================================================================

std::string describeRendererExitCode(int exitCode) {
    switch (exitCode) {
        case 0:  return "Success";
        case 10: return "The document format is not supported";
        case 16: return "HWP / HWPX formats are not supported in Qubes";
        case 20: return "Conversion to PDF with LibreOffice failed";
        case 30: return "Invalid conversion (Graphics Magic)";
        case 40: return "Error while processing document pages";
        case 41: return "Number of pages could not be extracted from PDF";
        case 50: return "Error converting PDF to Pixels (pdftoppm)";
        case 51: return "Error converting PDF to Pixels (Invalid PPM header)";
        case 52: return "Error converting PDF to Pixels (Invalid PPM depth)";
        default: break;
    }
    return "Container exited with status " + std::to_string(exitCode);
}

} // namespace Dangerzone
