#pragma once
#include "cron_field.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cronrepo {

// One schedule declaration found in a job file.
struct Tag {
    std::string target;
    std::string job_id;  // empty when the tagline has no %jobID
    int level = 0;
    CronField minute = CronField::wildcard(FieldKind::Minute);
    CronField hour = CronField::wildcard(FieldKind::Hour);
    CronField day = CronField::wildcard(FieldKind::DayOfMonth);
    CronField month = CronField::wildcard(FieldKind::Month);
    CronField dow = CronField::wildcard(FieldKind::DayOfWeek);
    std::vector<std::string> args;
    std::string source_file;
    int source_line = 0;

    // File basename, suffixed with %jobID when present
    std::string name() const;

    // The five fields in canonical scheduler syntax
    std::string schedule() const;
};

struct ParseError {
    std::string file;
    int line = 0;
    std::string message;

    std::string to_string() const;
};

struct ScanResult {
    std::vector<Tag> tags;
    std::vector<ParseError> errors;

    void append(ScanResult&& other);
};

class TaglineParser {
public:
    static constexpr const char* kPrefix = "CRON@";

    // Cheap first stage: only lines carrying the prefix are parsed further
    static bool is_candidate(const std::string& line);

    // Parse one line. Returns nullopt for lines without the prefix and
    // throws FieldError for candidate lines that do not match the grammar.
    static std::optional<Tag> parse_line(const std::string& line,
                                         const std::string& path, int line_no);

    // Parse all lines of one file's content; errors do not stop the scan
    static ScanResult parse(const std::string& content, const std::string& path);

    static ScanResult parse_file(const std::string& path);
};

// Parse every job file in a directory. Hidden files, editor backups
// (`~`, `.bak`) and non-regular entries are skipped; files are visited in
// name order.
ScanResult scan_directory(const std::string& dir);

// Keep tags for `target` (all when empty) with level >= min_level
std::vector<Tag> filter_tags(const std::vector<Tag>& tags,
                             const std::string& target, int min_level = 0);

} // namespace cronrepo
