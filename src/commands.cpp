#include "commands.hpp"
#include "config.hpp"
#include "crontab.hpp"
#include "schedule.hpp"
#include "sync.hpp"
#include "tagline.hpp"
#include "util.hpp"

#include <filesystem>
#include <iostream>
#include <set>
#include <nlohmann/json.hpp>

namespace cronrepo {

namespace fs = std::filesystem;

std::string bundled_trampoline() {
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return "cronrepo-run";
    return (self.parent_path() / "cronrepo-run").string();
}

SyncOptions make_sync_options(const std::string& dir, const Config& config,
                              const std::optional<std::string>& trampoline) {
    SyncOptions opts;
    opts.dir = dir;
    opts.host = short_hostname();
    std::error_code ec;
    opts.workdir = fs::current_path(ec).string();
    opts.env = environment_snapshot();
    opts.skipped_env = config.skipped_env;
    if (trampoline) {
        opts.trampoline = *trampoline;
    } else if (!config.trampoline.empty()) {
        opts.trampoline = config.trampoline;
    } else {
        opts.trampoline = shell_quote(bundled_trampoline());
    }
    return opts;
}

static void report_errors(const ScanResult& scan) {
    for (const auto& e : scan.errors) {
        std::cerr << "[scan] " << e.to_string() << "\n";
    }
}

static int list_inv(const CommandOptions& options, const Config& config,
                    const std::vector<Tag>& tags, const CrontabSynchronizer& sync,
                    WallTime start, WallTime end, std::ostream& out) {
    auto selected = filter_tags(tags, options.target, options.min_level);
    auto invocations = list_invocations(selected, start, end);

    if (options.json) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& inv : invocations) {
            const Tag& tag = selected[inv.tag_index];
            arr.push_back({
                {"time", format_wall_time(inv.when, "%Y-%m-%dT%H:%M")},
                {"target", tag.target},
                {"jid", tag.job_id},
                {"level", tag.level},
                {"file", tag.source_file},
                {"line", tag.source_line},
                {"command", sync.command_for(tag)}
            });
        }
        out << arr.dump(2) << "\n";
        return 0;
    }

    for (const auto& inv : invocations) {
        const Tag& tag = selected[inv.tag_index];
        out << "# " << format_wall_time(inv.when, config.time_format)
            << " name=" << fs::path(tag.source_file).filename().string()
            << " jid=" << tag.job_id << " level=" << tag.level << "\n"
            << sync.command_for(tag) << "\n";
    }
    return 0;
}

int run_command(const CommandOptions& options, const Config& config,
                CrontabStore& store, std::ostream& out) {
    const std::string& action = options.action;
    if (action != "generate" && action != "install" && action != "uninstall" &&
        action != "list-inv") {
        std::cerr << "Unknown command: " << action << "\n";
        return 1;
    }

    // Range errors are reported before any scanning or enumeration
    WallTime start = 0, end = 0;
    if (action == "list-inv") {
        try {
            start = options.start.empty() ? current_wall_minute()
                                          : parse_wall_time(options.start);
            end = options.end.empty() ? start + 24 * 3600 : parse_wall_time(options.end);
        } catch (const EnumerationError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
        if (start > end) {
            std::cerr << "Error: --start is after --end\n";
            return 1;
        }
    }

    std::error_code ec;
    fs::path dir = fs::canonical(options.dir, ec);
    if (ec || !fs::is_directory(dir)) {
        std::cerr << "Error: not a directory: " << options.dir << "\n";
        return 1;
    }

    ScanResult scan = scan_directory(dir.string());
    report_errors(scan);

    CrontabSynchronizer sync(store, make_sync_options(dir.string(), config,
                                                      options.trampoline));
    try {
        if (action == "uninstall") {
            std::vector<std::string> targets;
            if (!options.target.empty()) {
                targets.push_back(options.target);
            } else {
                std::set<std::string> all;
                for (const auto& t : targets_of(scan.tags)) all.insert(t);
                for (const auto& t : sync.installed_targets()) all.insert(t);
                targets.assign(all.begin(), all.end());
            }
            sync.uninstall(targets);
            // Removal still happens, but malformed taglines are a failure
            return scan.errors.empty() ? 0 : 1;
        }

        // A partial tag set must never reach the crontab
        if (!scan.errors.empty()) {
            std::cerr << "Error: " << scan.errors.size()
                      << " malformed tagline(s); nothing done\n";
            return 1;
        }

        if (action == "generate") {
            out << sync.generate(scan.tags, options.target);
            return 0;
        }
        if (action == "install") {
            sync.install(scan.tags, options.target);
            return 0;
        }
        return list_inv(options, config, scan.tags, sync, start, end, out);
    } catch (const SyncError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace cronrepo
