#pragma once
#include <map>
#include <string>
#include <vector>

namespace cronrepo {

// CRONREPO_* variables belong to a single job run and are never captured
bool env_excluded(const std::string& name, const std::vector<std::string>& skipped);

// One `export NAME=value` line per variable not excluded, sorted by name
std::string render_exports(const std::map<std::string, std::string>& env,
                           const std::vector<std::string>& skipped);

struct RunnerScript {
    std::string target;
    std::string workdir;     // cd'ed into before the job starts
    std::string trampoline;  // shell command text; empty runs the job directly
};

std::string render_runner_script(const RunnerScript& script,
                                 const std::map<std::string, std::string>& env,
                                 const std::vector<std::string>& skipped);

// `<dir>/.cronrepo-<host>-<target>.sh`
std::string runner_path(const std::string& dir, const std::string& host,
                        const std::string& target);

// Writes atomically with mode 0700. Throws SyncError on failure.
void write_runner_script(const std::string& path, const std::string& content);

// Missing scripts are fine. Throws SyncError if removal fails otherwise.
void remove_runner_script(const std::string& path);

} // namespace cronrepo
