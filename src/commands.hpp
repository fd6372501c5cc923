#pragma once
#include <iosfwd>
#include <optional>
#include <string>

namespace cronrepo {

class CrontabStore;
struct Config;
struct SyncOptions;

struct CommandOptions {
    std::string action;  // generate, install, uninstall or list-inv
    std::string dir;
    std::string target;  // empty = all targets
    std::optional<std::string> trampoline;
    int min_level = 0;
    std::string start;   // list-inv range, YYYY-mm-ddTHH:MM
    std::string end;
    bool json = false;
};

// Path of cronrepo-run installed beside the running executable
std::string bundled_trampoline();

// Sync settings for a job directory from the config and command line
SyncOptions make_sync_options(const std::string& dir, const Config& config,
                              const std::optional<std::string>& trampoline);

// Run one cronrepo command. Results go to `out`, diagnostics to stderr.
// Returns the process exit code.
int run_command(const CommandOptions& options, const Config& config,
                CrontabStore& store, std::ostream& out);

} // namespace cronrepo
