#include "runner_script.hpp"
#include "crontab.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fnmatch.h>
#include <sys/stat.h>

namespace cronrepo {

bool env_excluded(const std::string& name, const std::vector<std::string>& skipped) {
    if (name.compare(0, 9, "CRONREPO_") == 0) return true;
    for (const auto& pattern : skipped) {
        if (fnmatch(pattern.c_str(), name.c_str(), 0) == 0) return true;
    }
    return false;
}

static bool valid_env_name(const std::string& name) {
    if (name.empty() || (name[0] >= '0' && name[0] <= '9')) return false;
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}

std::string render_exports(const std::map<std::string, std::string>& env,
                           const std::vector<std::string>& skipped) {
    std::string out;
    for (const auto& [name, value] : env) {
        // bash cannot export names like "BASH_FUNC_x%%"
        if (!valid_env_name(name) || env_excluded(name, skipped)) continue;
        out += "export " + name + "=" + shell_quote(value) + "\n";
    }
    return out;
}

std::string render_runner_script(const RunnerScript& script,
                                 const std::map<std::string, std::string>& env,
                                 const std::vector<std::string>& skipped) {
    std::string out = "#!/bin/bash\n";
    out += render_exports(env, skipped);
    out += "cd " + shell_quote(script.workdir) + "\n";
    out += "export CRONREPO_TARGET=" + shell_quote(script.target) + "\n";
    std::string trampoline = script.trampoline.empty() ? "" : script.trampoline + " ";
    out += "exec " + trampoline + "\"$@\"\n";
    return out;
}

std::string runner_path(const std::string& dir, const std::string& host,
                        const std::string& target) {
    std::string base = dir;
    if (!base.empty() && base.back() != '/') base += '/';
    return base + ".cronrepo-" + host + "-" + target + ".sh";
}

void write_runner_script(const std::string& path, const std::string& content) {
    if (!atomic_write_file(path, content)) {
        throw SyncError("cannot write runner script " + path);
    }
    if (chmod(path.c_str(), 0700) != 0) {
        throw SyncError("cannot chmod runner script " + path + ": " +
                        std::strerror(errno));
    }
}

void remove_runner_script(const std::string& path) {
    if (std::remove(path.c_str()) != 0 && errno != ENOENT) {
        throw SyncError("cannot remove runner script " + path + ": " +
                        std::strerror(errno));
    }
}

} // namespace cronrepo
