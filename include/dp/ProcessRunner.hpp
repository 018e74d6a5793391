/**
 * ProcessRunner.hpp - Run drush, ddev, lando and composer as child processes
 */

#pragma once

#include <string>
#include <vector>

namespace dp {

struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
    bool timed_out = false;
    bool not_found = false;     // executable not on PATH
    bool cancelled = false;     // SIGINT/SIGTERM arrived while waiting

    bool ok() const { return exit_code == 0 && !timed_out && !cancelled && !not_found; }

    // stderr if it says anything, else stdout; trimmed and capped for messages
    std::string diagnostic(size_t max_length = 500) const;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // argv[0] is looked up on PATH; cwd empty means the current directory
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              const std::string& cwd,
                              int timeout_seconds) = 0;

    virtual bool which(const std::string& executable) const = 0;
};

/**
 * fork/execvp with both streams captured through pipes. The child gets its
 * own process group so a timeout or cancellation also reaches anything it
 * spawned (ddev and lando start docker helpers).
 */
class SystemProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      int timeout_seconds) override;

    bool which(const std::string& executable) const override;
};

/**
 * Process-wide cancellation flag. SIGINT/SIGTERM set it only while
 * SystemProcessRunner waits on a child; elsewhere they keep their default
 * action and end the process, aborting any HTTP call in flight. Once set,
 * later runs return a cancelled result without starting anything.
 */
bool cancellationRequested();
void requestCancellation();
void resetCancellation();

} // namespace dp
