#include "sync.hpp"
#include "runner_script.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <tuple>
#include <utility>

namespace cronrepo {

namespace {

struct Group {
    int order;
    const char* title;
};

// Entries are listed under a small set of headings so a crontab reader
// can see at a glance how often things run.
Group group_of(const Tag& tag) {
    if (!tag.minute.is_single() || !tag.hour.is_single()) {
        return {1, "More frequent than daily"};
    }
    std::string dow = tag.dow.render();
    if (dow.find_first_of("12345-*") == std::string::npos) {
        return {3, "Weekends"};
    }
    std::string day = tag.day.render();
    if (day.find_first_of("-*") == std::string::npos) {
        return {4, "Monthly"};
    }
    return {5, "Weekdays"};
}

std::string sort_dow(const Tag& tag) {
    std::string dow = tag.dow.render();
    return dow == "1-5" ? "*" : dow;
}

// cron turns an unescaped % in the command into a newline
std::string escape_percent(const std::string& command) {
    return replace_all(command, "%", "\\%");
}

} // namespace

CrontabSynchronizer::CrontabSynchronizer(CrontabStore& store, SyncOptions options)
    : store_(store), options_(std::move(options)) {}

std::string CrontabSynchronizer::runner_path(const std::string& target) const {
    return cronrepo::runner_path(options_.dir, options_.host, target);
}

std::string CrontabSynchronizer::command_for(const Tag& tag) const {
    std::string cmd;
    if (!tag.job_id.empty()) cmd += "CRONREPO_JID=" + tag.job_id + " ";
    cmd += shell_quote(runner_path(tag.target)) + " " + shell_quote(tag.source_file);
    for (const auto& arg : tag.args) cmd += " " + arg;
    return cmd;
}

std::string CrontabSynchronizer::entry_for(const Tag& tag) const {
    return tag.schedule() + " " + escape_percent(command_for(tag));
}

std::string CrontabSynchronizer::render_block(const std::vector<Tag>& tags,
                                              const std::string& target) const {
    std::vector<const Tag*> selected;
    for (const auto& t : tags) {
        if (t.target == target) selected.push_back(&t);
    }
    std::stable_sort(selected.begin(), selected.end(), [](const Tag* a, const Tag* b) {
        int ga = group_of(*a).order, gb = group_of(*b).order;
        if (ga != gb) return ga < gb;
        auto ka = std::make_tuple(sort_dow(*a), a->hour.render(), a->minute.render(), a->name());
        auto kb = std::make_tuple(sort_dow(*b), b->hour.render(), b->minute.render(), b->name());
        return ka < kb;
    });

    auto markers = markers_for(target);
    std::string out = markers.begin + "\n" + source_header(options_.dir) + "\n";
    int current = 0;
    for (const Tag* t : selected) {
        Group g = group_of(*t);
        if (g.order != current) {
            out += std::string("# ") + g.title + "\n";
            current = g.order;
        }
        out += entry_for(*t) + "\n";
    }
    out += markers.end + "\n";
    return out;
}

std::string CrontabSynchronizer::generate(const std::vector<Tag>& tags,
                                          const std::string& target) const {
    if (!target.empty()) return render_block(tags, target);
    std::string out;
    for (const auto& t : targets_of(tags)) out += render_block(tags, t);
    return out;
}

bool CrontabSynchronizer::install(const std::vector<Tag>& tags, const std::string& target) {
    std::vector<std::string> targets =
        target.empty() ? targets_of(tags) : std::vector<std::string>{target};

    for (const auto& t : targets) {
        RunnerScript script{t, options_.workdir, options_.trampoline};
        write_runner_script(runner_path(t),
                            render_runner_script(script, options_.env, options_.skipped_env));
    }

    std::string before = store_.read();

    // A full install also retires targets whose taglines are gone
    std::vector<std::string> stale;
    if (target.empty()) {
        for (const auto& t : targets_from_directory(before, options_.dir)) {
            if (!std::binary_search(targets.begin(), targets.end(), t)) stale.push_back(t);
        }
    }
    if (targets.empty() && stale.empty()) {
        std::cerr << "[install] No taglines found in " << options_.dir << "\n";
        return false;
    }

    std::string after = before;
    for (const auto& t : stale) {
        after = strip_block(after, t);
    }
    for (const auto& t : targets) {
        after = put_block(after, t, render_block(tags, t));
    }
    bool changed = after != before;
    if (changed) store_.write(after);

    for (const auto& t : stale) {
        remove_runner_script(runner_path(t));
        std::cerr << "[install] Removed stale target " << t << " from " << options_.dir << "\n";
    }
    if (!changed) {
        std::cerr << "[install] Crontab already up to date\n";
        return false;
    }
    for (const auto& t : targets) {
        std::cerr << "[install] Installed target " << t << " from " << options_.dir << "\n";
    }
    return true;
}

bool CrontabSynchronizer::uninstall(const std::vector<std::string>& targets) {
    std::string before = store_.read();
    std::string after = before;
    for (const auto& t : targets) {
        after = strip_block(after, t);
    }
    bool changed = after != before;
    if (changed) store_.write(after);

    // Only after cron no longer references them
    for (const auto& t : targets) {
        remove_runner_script(runner_path(t));
    }
    if (changed) {
        std::cerr << "[uninstall] Removed " << targets.size() << " target(s) from crontab\n";
    }
    return changed;
}

std::vector<std::string> CrontabSynchronizer::installed_targets() {
    return targets_from_directory(store_.read(), options_.dir);
}

std::vector<std::string> targets_of(const std::vector<Tag>& tags) {
    std::set<std::string> seen;
    for (const auto& t : tags) seen.insert(t.target);
    return {seen.begin(), seen.end()};
}

} // namespace cronrepo
