#pragma once

#include "mount_security.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kestrel {

struct ProcLimits {
    size_t rlimit_as_mb{0};         // virtual memory MB, 0 = inherit
    size_t rlimit_fsize_mb{1024};   // max file size MB
    int rlimit_nofile{1024};        // max open fds
    int rlimit_nproc{0};            // max processes, 0 = inherit

    bool no_new_privs{true};
};

struct SpawnSpec {
    std::vector<std::string> argv;      // agent runtime command
    std::vector<std::string> wrapper;   // optional container wrapper, prepended
    std::string cwd;
    std::vector<std::pair<std::string, std::string>> env;  // added to the inherited env
    std::vector<ValidatedMount> mounts;
    std::string stdin_data;             // written, then stdin is closed
    ProcLimits limits;
};

enum class ReadStatus { DATA, NONE, END };

// A running session process. Output is stdout+stderr merged.
// terminate()/kill() may be called from any thread.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual int pid() const = 0;

    // Waits up to wait_ms for output and appends what is available to out.
    // END once the output stream is closed.
    virtual ReadStatus read_some(std::string& out, int wait_ms) = 0;

    // Exit code (128+signal for signalled exits), or nullopt while running.
    virtual std::optional<int> poll_exit() = 0;

    // Blocks until exit.
    virtual int wait() = 0;

    virtual void terminate() = 0;   // SIGTERM to the process group
    virtual void kill() = 0;        // SIGKILL to the process group
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    // nullptr + *err if the process could not be started.
    virtual std::unique_ptr<ProcessHandle> spawn(const SpawnSpec& spec, std::string* err) = 0;
};

// fork/exec launcher: own process group, rlimits, PDEATHSIG, scrubbed loader env.
class PosixProcessLauncher : public ProcessLauncher {
public:
    std::unique_ptr<ProcessHandle> spawn(const SpawnSpec& spec, std::string* err) override;
};

// Final argv: wrapper tokens first, with a "{mounts}" token expanded to
// "-v host:container[:ro]" pairs, then the runtime argv.
std::vector<std::string> build_session_argv(const SpawnSpec& spec);

// "ro|rw <host> <container>" per line, exported as KESTREL_MOUNTS.
std::string encode_mounts_env(const std::vector<ValidatedMount>& mounts);

} // namespace kestrel
