#pragma once
#include "crontab.hpp"
#include "tagline.hpp"
#include <map>
#include <string>
#include <vector>

namespace cronrepo {

struct SyncOptions {
    std::string dir;         // absolute job directory; runner scripts live here
    std::string host;        // short host name, part of the runner script name
    std::string workdir;     // directory the runner script cds into
    std::string trampoline;  // empty runs jobs without a trampoline
    std::map<std::string, std::string> env;  // captured into the runner script
    std::vector<std::string> skipped_env;
};

// Keeps one marker-delimited crontab block per target in step with the
// taglines of a job directory.
class CrontabSynchronizer {
public:
    CrontabSynchronizer(CrontabStore& store, SyncOptions options);

    std::string runner_path(const std::string& target) const;

    // Shell command run by cron for `tag`, without cron's `%` escaping
    std::string command_for(const Tag& tag) const;

    // Scheduler-native entry line for `tag`
    std::string entry_for(const Tag& tag) const;

    // Full block for one target, markers included
    std::string render_block(const std::vector<Tag>& tags, const std::string& target) const;

    // Blocks for `target`, or for every target in `tags` when empty
    std::string generate(const std::vector<Tag>& tags, const std::string& target) const;

    // Write runner scripts and blocks. Without a target, blocks and runner
    // scripts of targets this directory no longer declares are removed too.
    // Returns false when the crontab already had the same content and was
    // not rewritten.
    bool install(const std::vector<Tag>& tags, const std::string& target);

    // Remove the blocks and runner scripts of `targets`. Targets without a
    // block are ignored. Returns false when nothing had to change.
    bool uninstall(const std::vector<std::string>& targets);

    // Targets with a block from this directory in the current crontab
    std::vector<std::string> installed_targets();

    const SyncOptions& options() const { return options_; }

private:
    CrontabStore& store_;
    SyncOptions options_;
};

// Distinct targets of `tags`, sorted
std::vector<std::string> targets_of(const std::vector<Tag>& tags);

} // namespace cronrepo
