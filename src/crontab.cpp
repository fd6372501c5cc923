#include "crontab.hpp"
#include "process.hpp"
#include "util.hpp"

#include <iostream>

namespace cronrepo {

static const std::string kBeginPrefix = "# BEGIN cronrepo generated: ";
static const std::string kEndPrefix = "# END cronrepo generated: ";
static const std::string kSourcePrefix = "# Source directory: ";

std::string SystemCrontab::read() {
    auto result = run_process({"crontab", "-l"});
    if (!result.started) {
        throw SyncError("cannot run crontab -l");
    }
    if (!result.succeeded()) {
        // A user without a crontab is an empty crontab, not an error
        if (result.err.find("no crontab") != std::string::npos) {
            std::cerr << "[crontab] No crontab for this user yet\n";
            return "";
        }
        throw SyncError("crontab -l failed: " + trim(result.err));
    }
    return result.out;
}

void SystemCrontab::write(const std::string& text) {
    auto result = run_process({"crontab", "-"}, text);
    if (!result.started) {
        throw SyncError("cannot run crontab -");
    }
    if (!result.succeeded()) {
        throw SyncError("crontab - rejected the new crontab: " + trim(result.err));
    }
}

BlockMarkers markers_for(const std::string& target) {
    return {kBeginPrefix + target, kEndPrefix + target};
}

std::string source_header(const std::string& dir) {
    return kSourcePrefix + dir;
}

static std::string join_lines(const std::vector<std::string>& lines,
                              size_t from, size_t to) {
    std::string out;
    for (size_t i = from; i < to; ++i) {
        out += lines[i];
        out += '\n';
    }
    return out;
}

// Index range [begin, end] of the target's block; false if absent
static bool find_block(const std::vector<std::string>& lines,
                       const std::string& target, size_t& begin, size_t& end) {
    auto markers = markers_for(target);
    for (begin = 0; begin < lines.size(); ++begin) {
        if (lines[begin] == markers.begin) break;
    }
    if (begin == lines.size()) return false;
    for (end = begin + 1; end < lines.size(); ++end) {
        if (lines[end] == markers.end) return true;
    }
    throw SyncError("crontab block for target '" + target +
                    "' has no end marker; fix the crontab by hand");
}

// Text before the block, `middle`, then text after the block. A crontab
// without a final newline keeps it missing on its last line.
static std::string splice(const std::string& crontab, const std::vector<std::string>& lines,
                          size_t begin, size_t end, const std::string& middle) {
    std::string tail = join_lines(lines, end + 1, lines.size());
    if (!tail.empty() && crontab.back() != '\n') tail.pop_back();
    return join_lines(lines, 0, begin) + middle + tail;
}

std::string strip_block(const std::string& crontab, const std::string& target) {
    auto lines = split(crontab, '\n');
    size_t begin = 0, end = 0;
    if (!find_block(lines, target, begin, end)) return crontab;
    return splice(crontab, lines, begin, end, "");
}

std::string put_block(const std::string& crontab, const std::string& target,
                      const std::string& block) {
    auto lines = split(crontab, '\n');
    size_t begin = 0, end = 0;
    if (find_block(lines, target, begin, end)) {
        return splice(crontab, lines, begin, end, block);
    }
    std::string out = crontab;
    if (!out.empty() && out.back() != '\n') out += '\n';
    return out + block;
}

std::vector<std::string> targets_from_directory(const std::string& crontab,
                                                const std::string& dir) {
    std::vector<std::string> targets;
    auto lines = split(crontab, '\n');
    std::string header = source_header(dir);
    for (size_t i = 0; i + 1 < lines.size(); ++i) {
        if (lines[i].compare(0, kBeginPrefix.size(), kBeginPrefix) != 0) continue;
        if (lines[i + 1] != header) continue;
        targets.push_back(lines[i].substr(kBeginPrefix.size()));
    }
    return targets;
}

} // namespace cronrepo
