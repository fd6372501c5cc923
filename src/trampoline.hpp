#pragma once
#include "config.hpp"
#include <csignal>
#include <signal.h>
#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>

namespace cronrepo {

// Problems found before a job could be started; the job never runs
class TrampolineSetupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Name of the per-directory trampoline config file
constexpr const char* kRunConfigName = ".cronrepo.conf";

// Parse LOG=, NOTIFY= and ROTATE= lines over `defaults`.
RunConfig parse_run_config(const std::string& content, const std::string& path,
                           RunConfig defaults);

// Read .cronrepo.conf next to `job_file` if there is one. Throws
// TrampolineSetupError if it is unreadable or no LOG template is known.
RunConfig load_run_config(const std::string& job_file, const RunConfig& defaults);

// Job file basename without its last extension, plus %jobID
std::string log_name(const std::string& job_file, const std::string& job_id);

struct LogLocation {
    std::string dir;
    std::string date;  // %Y-%m-%d of the day the template was evaluated for
};

// Evaluate the LOG template for the day containing `now` (at 00:00:00),
// expand $VARS and ~, and create the directory.
LogLocation resolve_log_dir(const std::string& tmpl, std::time_t now);

// Shift <log>.1 .. <log>.N-1 up by one and move <log> to <log>.1,
// discarding anything beyond `keep` backups.
void rotate_log(const std::string& log_path, int keep);

// How a job process ended
struct JobOutcome {
    bool exited = true;
    int code = 0;    // exit status when exited
    int signal = 0;  // terminating signal otherwise

    bool ok() const { return exited && code == 0; }
    // Content of the .failed file: exit code or negated signal number
    std::string status_text() const;
    // Exit code the trampoline itself returns
    int exit_code() const;
};

JobOutcome outcome_from_wait_status(int status);

// Lets the trampoline ignore interactive signals for its own bookkeeping
// while a job started afterwards still receives them.
class SignalShield {
public:
    virtual ~SignalShield() = default;
    virtual void shield() = 0;
    virtual void release() = 0;
};

// SIGINT, SIGQUIT, SIGTERM and SIGPIPE set to SIG_IGN while shielded
class PosixSignalShield : public SignalShield {
public:
    void shield() override;
    void release() override;

    static const std::vector<int>& signals();

private:
    std::vector<struct sigaction> saved_;
};

enum class RunState { Starting, Running, Completed, Failed };

struct TrampolineRequest {
    std::string job_file;
    std::vector<std::string> args;
    std::string job_id;   // from CRONREPO_JID
    bool notify = true;   // false in interactive/debug runs
};

class Trampoline {
public:
    Trampoline(RunConfig config, SignalShield& signals);

    // Run the job to completion and return the exit code to report.
    // Throws TrampolineSetupError before the job is started.
    int run(const TrampolineRequest& request, std::time_t now = std::time(nullptr));

    RunState state() const { return state_; }
    const LogLocation& location() const { return location_; }
    std::string state_path(const std::string& suffix) const;

private:
    void prepare(const TrampolineRequest& request, std::time_t now);
    void start(const TrampolineRequest& request);
    JobOutcome launch(const TrampolineRequest& request);
    void finish(const JobOutcome& outcome);
    void notify_failure(const JobOutcome& outcome);

    RunConfig config_;
    SignalShield& signals_;
    RunState state_ = RunState::Starting;
    LogLocation location_;
    std::string name_;
};

} // namespace cronrepo
