#ifndef CONTAINER_RUNNER_H
#define CONTAINER_RUNNER_H

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "pixel_stream.h"

namespace Dangerzone {

enum class ContainerRuntime {
    Podman,
    Docker
};

// Executable name for a runtime ("podman" / "docker")
const char* runtimeCommand(ContainerRuntime runtime);

enum class ContainerErrorKind {
    None,
    Io,                 // pipe/fork/exec/write/wait failure
    ExecutionFailed,    // No runtime available, or the process misbehaved
    InvalidName         // Empty container name
};

struct ContainerError {
    ContainerErrorKind kind = ContainerErrorKind::None;
    std::string detail;

    bool ok() const { return kind == ContainerErrorKind::None; }

    std::string message() const;
};

// A spawned process with piped stdin/stdout/stderr.
// Owns the descriptors; a process that was never waited on is killed and
// reaped on destruction.
class ChildProcess {
public:
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t getPid() const { return pid_; }

    // Process stdout as a byte source for PixelStreamReader
    ByteSource& getOutput() { return output_; }

    // Write all of `data` to the process stdin
    bool writeInput(const std::vector<uint8_t>& data, ContainerError& error);

    // Close stdin so the process sees end of input
    void closeInput();

    // Stop reading stdout. A process still writing gets EPIPE/SIGPIPE
    // instead of blocking on a full pipe. getOutput() must not be read
    // afterwards.
    void closeOutput();

    // Wait for exit. exitCode is the exit status, or 128+signal when the
    // process was killed by a signal.
    bool wait(int& exitCode, ContainerError& error);

    // Everything the process wrote to stderr (complete after wait())
    const std::string& getErrorOutput() const { return errorOutput_; }

private:
    friend std::unique_ptr<ChildProcess> spawnProcess(const std::vector<std::string>& argv,
                                                      ContainerError& error);

    ChildProcess(pid_t pid, int stdinFd, int stdoutFd, int stderrFd);

    void joinErrorReader();

    pid_t pid_;
    int stdinFd_;
    int stdoutFd_;
    int stderrFd_;
    bool reaped_;
    FdByteSource output_;
    std::string errorOutput_;
    std::thread errorReader_;
};

// Spawn argv[0] (looked up in PATH) with all three standard streams piped
std::unique_ptr<ChildProcess> spawnProcess(const std::vector<std::string>& argv,
                                           ContainerError& error);

// Runs the isolated renderer container and hands back its process.
class ContainerRunner {
public:
    explicit ContainerRunner(std::string containerName,
                             ContainerRuntime runtime = ContainerRuntime::Podman);

    // Podman first, then Docker
    static bool detectRuntime(ContainerRuntime& runtime, ContainerError& error);

    // Full argv: runtime, run flags, extraArgs, image, command
    std::vector<std::string> buildCommand(const std::string& image,
                                          const std::vector<std::string>& command,
                                          const std::vector<std::string>& extraArgs) const;

    std::unique_ptr<ChildProcess> run(const std::string& image,
                                      const std::vector<std::string>& command,
                                      const std::vector<std::string>& extraArgs,
                                      ContainerError& error) const;

    const std::string& getContainerName() const { return containerName_; }

private:
    std::string containerName_;
    ContainerRuntime runtime_;
};

// Message for the renderer's documented failure exit codes
std::string describeRendererExitCode(int exitCode);

} // namespace Dangerzone

#endif // CONTAINER_RUNNER_H
