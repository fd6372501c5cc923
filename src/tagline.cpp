#include "tagline.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace cronrepo {

namespace fs = std::filesystem;

std::string Tag::name() const {
    std::string base = fs::path(source_file).filename().string();
    return job_id.empty() ? base : base + "%" + job_id;
}

std::string Tag::schedule() const {
    return minute.render() + " " + hour.render() + " " + day.render() + " " +
           month.render() + " " + dow.render();
}

std::string ParseError::to_string() const {
    return file + ":" + std::to_string(line) + ": " + message;
}

void ScanResult::append(ScanResult&& other) {
    for (auto& t : other.tags) tags.push_back(std::move(t));
    for (auto& e : other.errors) errors.push_back(std::move(e));
}

bool TaglineParser::is_candidate(const std::string& line) {
    return line.find(kPrefix) != std::string::npos;
}

static bool valid_target(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '/') return false;
    }
    return true;
}

static bool valid_job_id(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

std::optional<Tag> TaglineParser::parse_line(const std::string& line,
                                             const std::string& path, int line_no) {
    auto pos = line.find(kPrefix);
    if (pos == std::string::npos) return std::nullopt;

    std::string rest = trim(line.substr(pos + std::string(kPrefix).size()));

    Tag tag;
    tag.source_file = path;
    tag.source_line = line_no;

    // CRON@<target>[%<jobID>]:[<level>]:<fields>
    auto head_end = rest.find(':');
    if (head_end == std::string::npos) {
        throw FieldError("expected ':' after target");
    }
    std::string head = rest.substr(0, head_end);
    auto pct = head.find('%');
    tag.target = head.substr(0, pct);
    if (!valid_target(tag.target)) {
        throw FieldError("invalid target '" + tag.target + "'");
    }
    if (pct != std::string::npos) {
        tag.job_id = head.substr(pct + 1);
        if (!valid_job_id(tag.job_id)) {
            throw FieldError("invalid job ID '" + tag.job_id + "'");
        }
    }

    auto level_end = rest.find(':', head_end + 1);
    if (level_end == std::string::npos) {
        throw FieldError("expected ':' after level");
    }
    std::string level_text = rest.substr(head_end + 1, level_end - head_end - 1);
    if (!level_text.empty() && !parse_uint(level_text, tag.level)) {
        throw FieldError("invalid level '" + level_text + "'");
    }

    std::string body = rest.substr(level_end + 1);
    std::string schedule_text = body;
    auto plus = body.find('+');
    if (plus != std::string::npos) {
        schedule_text = body.substr(0, plus);
        tag.args = split_whitespace(body.substr(plus + 1));
    }

    auto fields = split_whitespace(schedule_text);
    if (fields.size() < 5) {
        throw FieldError("expected 5 schedule fields, found " +
                         std::to_string(fields.size()));
    }
    if (fields.size() > 5) {
        throw FieldError("unexpected '" + fields[5] +
                         "' after schedule; arguments must follow '+'");
    }
    tag.minute = CronField::parse(fields[0], FieldKind::Minute);
    tag.hour = CronField::parse(fields[1], FieldKind::Hour);
    tag.day = CronField::parse(fields[2], FieldKind::DayOfMonth);
    tag.month = CronField::parse(fields[3], FieldKind::Month);
    tag.dow = CronField::parse(fields[4], FieldKind::DayOfWeek);
    return tag;
}

ScanResult TaglineParser::parse(const std::string& content, const std::string& path) {
    ScanResult result;
    int line_no = 0;
    for (const auto& line : split(content, '\n')) {
        ++line_no;
        if (!is_candidate(line)) continue;
        try {
            auto tag = parse_line(line, path, line_no);
            if (tag) result.tags.push_back(std::move(*tag));
        } catch (const FieldError& e) {
            result.errors.push_back(ParseError{path, line_no, e.what()});
        }
    }
    return result;
}

ScanResult TaglineParser::parse_file(const std::string& path) {
    std::string content;
    if (!read_file(path, content)) {
        ScanResult result;
        result.errors.push_back(ParseError{path, 0, "cannot read file"});
        return result;
    }
    return parse(content, path);
}

static bool skipped_name(const std::string& name) {
    if (name.empty() || name[0] == '.') return true;
    if (name.back() == '~') return true;
    return name.size() >= 4 && name.compare(name.size() - 4, 4, ".bak") == 0;
}

ScanResult scan_directory(const std::string& dir) {
    ScanResult result;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        result.errors.push_back(ParseError{dir, 0, "cannot list directory: " + ec.message()});
        return result;
    }

    std::vector<fs::path> files;
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (skipped_name(name)) continue;
        if (!entry.is_regular_file(ec)) continue;
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        auto parsed = TaglineParser::parse_file(file.string());
        if (!parsed.errors.empty()) {
            std::cerr << "[scan] " << parsed.errors.size() << " malformed tagline(s) in "
                      << file.string() << "\n";
        }
        result.append(std::move(parsed));
    }
    return result;
}

std::vector<Tag> filter_tags(const std::vector<Tag>& tags,
                             const std::string& target, int min_level) {
    std::vector<Tag> out;
    for (const auto& t : tags) {
        if (!target.empty() && t.target != target) continue;
        if (t.level < min_level) continue;
        out.push_back(t);
    }
    return out;
}

} // namespace cronrepo
