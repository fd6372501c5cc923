#include "cron_field.hpp"
#include "util.hpp"

namespace cronrepo {

FieldDomain domain_of(FieldKind kind) {
    switch (kind) {
        case FieldKind::Minute:     return {0, 59, "minute"};
        case FieldKind::Hour:       return {0, 23, "hour"};
        case FieldKind::DayOfMonth: return {1, 31, "day of month"};
        case FieldKind::Month:      return {1, 12, "month"};
        case FieldKind::DayOfWeek:  return {0, 6, "day of week"};
    }
    return {0, 0, "unknown"};
}

static int parse_value(const std::string& text, const FieldDomain& dom) {
    int value = 0;
    if (!parse_uint(text, value)) {
        throw FieldError(std::string("invalid ") + dom.name + " value '" + text + "'");
    }
    if (value < dom.lo || value > dom.hi) {
        throw FieldError(std::string(dom.name) + " value " + std::to_string(value) +
                         " out of range " + std::to_string(dom.lo) + "-" +
                         std::to_string(dom.hi));
    }
    return value;
}

static CronTerm parse_term(const std::string& text, const FieldDomain& dom) {
    if (text.empty()) {
        throw FieldError(std::string("empty ") + dom.name + " list member");
    }

    CronTerm term;
    std::string base = text;
    auto slash = text.find('/');
    if (slash != std::string::npos) {
        base = text.substr(0, slash);
        std::string step_text = text.substr(slash + 1);
        int step = 0;
        if (!parse_uint(step_text, step) || step <= 0) {
            throw FieldError(std::string("invalid ") + dom.name + " step '" +
                             step_text + "'");
        }
        term.step = step;
    }

    if (base == "*") {
        term.star = true;
        term.lo = dom.lo;
        term.hi = dom.hi;
        return term;
    }

    auto dash = base.find('-');
    if (dash != std::string::npos) {
        term.lo = parse_value(base.substr(0, dash), dom);
        term.hi = parse_value(base.substr(dash + 1), dom);
        if (term.lo > term.hi) {
            throw FieldError(std::string(dom.name) + " range '" + base +
                             "' has low bound above high bound");
        }
        return term;
    }

    if (slash != std::string::npos) {
        throw FieldError(std::string(dom.name) + " step needs a range or '*': '" +
                         text + "'");
    }
    term.lo = term.hi = parse_value(base, dom);
    return term;
}

CronField CronField::parse(const std::string& text, FieldKind kind) {
    FieldDomain dom = domain_of(kind);
    if (text.empty()) {
        throw FieldError(std::string("missing ") + dom.name + " field");
    }
    std::vector<CronTerm> terms;
    size_t start = 0;
    while (true) {
        auto comma = text.find(',', start);
        terms.push_back(parse_term(text.substr(start, comma - start), dom));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return CronField(kind, std::move(terms));
}

CronField CronField::wildcard(FieldKind kind) {
    FieldDomain dom = domain_of(kind);
    CronTerm term;
    term.lo = dom.lo;
    term.hi = dom.hi;
    term.star = true;
    return CronField(kind, {term});
}

bool CronField::matches(int value) const {
    for (const auto& t : terms_) {
        if (value >= t.lo && value <= t.hi && (value - t.lo) % t.step == 0) {
            return true;
        }
    }
    return false;
}

bool CronField::is_wildcard() const {
    return terms_.size() == 1 && terms_[0].star && terms_[0].step == 1;
}

bool CronField::is_single() const {
    return terms_.size() == 1 && !terms_[0].star && terms_[0].lo == terms_[0].hi &&
           terms_[0].step == 1;
}

std::string CronField::render() const {
    std::string out;
    for (const auto& t : terms_) {
        if (!out.empty()) out += ',';
        if (t.star) {
            out += '*';
        } else if (t.lo == t.hi && t.step == 1) {
            out += std::to_string(t.lo);
        } else {
            out += std::to_string(t.lo) + "-" + std::to_string(t.hi);
        }
        if (t.step != 1) out += "/" + std::to_string(t.step);
    }
    return out;
}

} // namespace cronrepo
