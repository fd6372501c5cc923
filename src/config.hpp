#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cronrepo {

// Trampoline defaults; a job directory's .cronrepo.conf overrides them
struct RunConfig {
    std::string log;     // strftime directory template; required in the end
    std::string notify;  // shell command run when a job fails
    int rotate = 5;      // rotated log backups kept per job
};

struct Config {
    std::string trampoline;  // empty = cronrepo-run next to the cronrepo binary
    std::vector<std::string> skipped_env = {  // glob patterns kept out of runner scripts
        "COLORTERM", "SSH_AGENT_PID", "SSH_AUTH_SOCK",
        "SSH_CLIENT", "SSH_CONNECTION", "SSH_TTY", "_"};
    std::string time_format = "date=%Y-%m-%d time=%H:%M";
    RunConfig run;

    // Load from default_path()
    static Config load();

    // Load from an explicit path; a missing file yields the defaults
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    static Config from_json(const nlohmann::json& j);

    // $CRONREPO_CONFIG, else ~/.cronrepo/config.json
    static std::string default_path();
};

} // namespace cronrepo
