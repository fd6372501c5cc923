#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cronrepo {

enum class FieldKind { Minute, Hour, DayOfMonth, Month, DayOfWeek };

struct FieldDomain {
    int lo;
    int hi;
    const char* name;
};

// Value range accepted by each schedule position
FieldDomain domain_of(FieldKind kind);

class FieldError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One comma-separated member of a field: a single value, a range, or a
// stepped range. A wildcard is the full domain with the star flag set.
struct CronTerm {
    int lo = 0;
    int hi = 0;
    int step = 1;
    bool star = false;

    bool operator==(const CronTerm& other) const {
        return lo == other.lo && hi == other.hi && step == other.step &&
               star == other.star;
    }
};

// Matching rule for one of the five schedule positions.
class CronField {
public:
    // Parses `*`, `*/s`, `n`, `a-b`, `a-b/s` or a comma list of those.
    // Throws FieldError on malformed syntax or out-of-domain values.
    static CronField parse(const std::string& text, FieldKind kind);

    static CronField wildcard(FieldKind kind);

    bool matches(int value) const;

    // Bare `*`; a stepped `*/s` restricts the field and is not a wildcard
    bool is_wildcard() const;

    // Exactly one plain value, e.g. `5`
    bool is_single() const;

    // Canonical scheduler syntax; parse(render()) == *this
    std::string render() const;

    FieldKind kind() const { return kind_; }
    const std::vector<CronTerm>& terms() const { return terms_; }

    bool operator==(const CronField& other) const {
        return kind_ == other.kind_ && terms_ == other.terms_;
    }
    bool operator!=(const CronField& other) const { return !(*this == other); }

private:
    CronField(FieldKind kind, std::vector<CronTerm> terms)
        : kind_(kind), terms_(std::move(terms)) {}

    FieldKind kind_;
    std::vector<CronTerm> terms_;
};

} // namespace cronrepo
