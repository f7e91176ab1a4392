// Validator.cpp – Structural, dictionary, unit/enum and edition-diff checks.

#include "SIMForge/Validator.hpp"
#include "SIMForge/Errors.hpp"
#include "SIMForge/Log.hpp"
#include "SIMForge/Text.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iterator>
#include <map>
#include <set>
#include <sstream>
#include <tuple>
#include <utility>
#include <unordered_map>
#include <unordered_set>

namespace simforge {

std::string messagePath(size_t message) {
    return "messages[" + std::to_string(message) + "]";
}

std::string segmentPath(size_t message, size_t segment) {
    return messagePath(message) + ".segments[" + std::to_string(segment) + "]";
}

std::string fieldPath(size_t message, size_t segment, size_t field) {
    return segmentPath(message, segment) + ".fields[" + std::to_string(field) + "]";
}

size_t countIssues(const std::vector<ValidationIssue>& issues, Severity s) noexcept {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
                                             [s](const ValidationIssue& i) { return i.severity == s; }));
}

static ValidationIssue issue(Severity sev, std::string rule, std::string path, std::string msg,
                             std::optional<std::string> fix = std::nullopt) {
    return ValidationIssue{sev, std::move(rule), std::move(path), std::move(msg), std::move(fix)};
}

// ─────────────────────────────────────────────────────────────────────────────
//  Structural
// ─────────────────────────────────────────────────────────────────────────────

// Editions are a single capital letter: "A", "B", "C".
static bool isEditionLetter(const std::string& edition) {
    return edition.size() == 1 && edition[0] >= 'A' && edition[0] <= 'Z';
}

std::vector<ValidationIssue> Validator::checkStructure(const SemanticModel& model) const {
    std::vector<ValidationIssue> out;

    if (!isEditionLetter(model.document.edition)) {
        out.push_back(issue(Severity::Warning, "version-format", "edition",
                            "edition '" + model.document.edition + "' of " + model.document.standard +
                            " is not a single uppercase letter",
                            "use a single uppercase letter such as 'C'"));
    }

    for (size_t m = 0; m < model.messages.size(); ++m) {
        const Message& msg = model.messages[m];
        for (size_t s = 0; s < msg.segments.size(); ++s) {
            const Segment& seg    = msg.segments[s];
            const auto&    fields = seg.fields;

            if (fields.empty()) {
                out.push_back(issue(Severity::Warning, "empty-segment", segmentPath(m, s),
                                    msg.label + " segment " + std::to_string(seg.index) +
                                    " has no fields"));
                continue;
            }

            for (size_t f = 0; f < fields.size(); ++f) {
                const BitRange& r = fields[f].range;
                if (r.start < 0 || r.start > r.end)
                    throw ContractError("malformed range " + std::to_string(r.start) + ".." +
                                        std::to_string(r.end) + " at " + fieldPath(m, s, f));
            }

            // Pairwise overlap, reported once per pair in field order.
            for (size_t a = 0; a < fields.size(); ++a) {
                for (size_t b = a + 1; b < fields.size(); ++b) {
                    if (!fields[a].range.overlaps(fields[b].range)) continue;
                    out.push_back(issue(
                        Severity::Error, "bit-overlap", fieldPath(m, s, b),
                        "fields '" + fields[a].name + "' (" + formatBitRange(fields[a].range) +
                        ") and '" + fields[b].name + "' (" + formatBitRange(fields[b].range) +
                        ") overlap in " + msg.label + " segment " + std::to_string(seg.index),
                        "check the bit ranges of '" + fields[a].name + "' and '" +
                        fields[b].name + "' against the source table"));
                }
            }

            for (size_t f = 0; f < fields.size(); ++f) {
                const BitRange& r = fields[f].range;
                if (static_cast<int64_t>(r.end) >= static_cast<int64_t>(seg.bit_length)) {
                    out.push_back(issue(
                        Severity::Error, "bit-out-of-bounds", fieldPath(m, s, f),
                        "field '" + fields[f].name + "' (" + formatBitRange(r) +
                        ") exceeds the segment length of " + std::to_string(seg.bit_length)));
                }
                if (fields[f].confidence < cfg_.min_confidence) {
                    std::ostringstream os;
                    os << "field '" << fields[f].name << "' extracted with confidence "
                       << fields[f].confidence << " (threshold " << cfg_.min_confidence << ")";
                    out.push_back(issue(Severity::Warning, "low-confidence", fieldPath(m, s, f),
                                        os.str(), "review the field against the source page " +
                                        std::to_string(fields[f].source_page)));
                }
            }

            if (!cfg_.report_unused_bits || seg.bit_length == 0) continue;

            // Unused runs inside [0, bit_length).
            std::vector<BitRange> sorted;
            sorted.reserve(fields.size());
            for (const auto& f : fields) sorted.push_back(f.range);
            std::sort(sorted.begin(), sorted.end(),
                      [](const BitRange& x, const BitRange& y) { return x.start < y.start; });

            const int64_t limit = seg.bit_length;
            int64_t next = 0;
            auto reportGap = [&](int64_t from, int64_t to) {
                const BitRange gap{static_cast<int32_t>(from), static_cast<int32_t>(to)};
                out.push_back(issue(Severity::Warning, "bit-unused", segmentPath(m, s),
                                    "bits " + formatBitRange(gap) + " of " + msg.label +
                                    " segment " + std::to_string(seg.index) +
                                    " are not covered by any field"));
            };
            for (const auto& r : sorted) {
                if (r.start >= limit) break;
                if (r.start > next) reportGap(next, r.start - 1);
                next = std::max<int64_t>(next, static_cast<int64_t>(r.end) + 1);
            }
            if (next < limit) reportGap(next, limit - 1);
        }
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Dictionary tree
// ─────────────────────────────────────────────────────────────────────────────

static std::string dictionaryPath(size_t n) {
    return "dictionary[" + std::to_string(n) + "]";
}

std::vector<ValidationIssue> Validator::checkDictionary(const SemanticModel& model) const {
    std::vector<ValidationIssue> out;
    const auto& entries = model.dictionary;

    std::unordered_map<std::string, size_t> by_key;
    for (size_t i = 0; i < entries.size(); ++i) by_key.emplace(entries[i].key, i);

    std::map<std::tuple<DictionaryLevel, uint32_t, uint32_t, uint32_t>, size_t> triples;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        auto [it, inserted] = triples.emplace(
            std::make_tuple(e.level, e.category_id, e.sub_category_id, e.item_id), i);
        if (!inserted) {
            out.push_back(issue(Severity::Error, "dict-duplicate", dictionaryPath(i),
                                "entry '" + e.key + "' (" + e.name + ") duplicates " +
                                dictionaryPath(it->second) + " (" + entries[it->second].name + ")"));
        }
    }

    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        if (e.parent.empty()) continue;
        if (!by_key.count(e.parent)) {
            out.push_back(issue(Severity::Error, "dict-dangling-parent", dictionaryPath(i),
                                "entry '" + e.key + "' refers to missing parent '" + e.parent + "'",
                                "add the '" + e.parent + "' entry or correct the identifier"));
        }
    }

    // Cycle detection: walk each parent chain; report each cycle once, at its
    // lowest index member.
    std::set<size_t> reported;
    for (size_t i = 0; i < entries.size(); ++i) {
        std::vector<size_t>        chain;
        std::unordered_set<size_t> seen;
        size_t cur = i;
        for (;;) {
            if (!seen.insert(cur).second) {
                auto start = std::find(chain.begin(), chain.end(), cur);
                const size_t lowest = *std::min_element(start, chain.end());
                if (reported.insert(lowest).second) {
                    std::string path;
                    for (auto it = start; it != chain.end(); ++it)
                        path += entries[*it].key + " -> ";
                    path += entries[cur].key;
                    out.push_back(issue(Severity::Error, "dict-cycle", dictionaryPath(lowest),
                                        "parent chain forms a cycle: " + path));
                }
                break;
            }
            chain.push_back(cur);
            const auto& parent = entries[cur].parent;
            if (parent.empty()) break;
            auto it = by_key.find(parent);
            if (it == by_key.end()) break;
            cur = it->second;
        }
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Units and enums
// ─────────────────────────────────────────────────────────────────────────────

std::vector<ValidationIssue> Validator::checkUnits(const SemanticModel& model) const {
    std::vector<ValidationIssue> out;

    std::unordered_set<std::string> symbols;
    for (const auto& u : model.units) symbols.insert(u.symbol);
    std::unordered_map<std::string, size_t> enums;
    for (size_t i = 0; i < model.enums.size(); ++i) enums.emplace(model.enums[i].key, i);

    for (size_t m = 0; m < model.messages.size(); ++m) {
        const Message& msg = model.messages[m];
        // lower-case field name → (first unit seen, its path)
        std::map<std::string, std::pair<std::string, std::string>> units_by_name;

        for (size_t s = 0; s < msg.segments.size(); ++s) {
            const auto& fields = msg.segments[s].fields;
            for (size_t f = 0; f < fields.size(); ++f) {
                const FieldRecord& fr   = fields[f];
                const std::string  path = fieldPath(m, s, f);

                if (fr.unit && (!fr.unit_resolved || !symbols.count(*fr.unit))) {
                    out.push_back(issue(Severity::Warning, "unit-unresolved", path,
                                        "field '" + fr.name + "' has unknown unit '" + *fr.unit + "'",
                                        "add '" + *fr.unit + "' as an alias in the unit table"));
                }

                if (fr.unit) {
                    auto [it, inserted] = units_by_name.emplace(toLower(fr.name),
                                                                std::make_pair(*fr.unit, path));
                    if (!inserted && it->second.first != *fr.unit) {
                        out.push_back(issue(Severity::Warning, "unit-inconsistent", path,
                                            "field '" + fr.name + "' uses unit '" + *fr.unit +
                                            "' but " + it->second.second + " uses '" +
                                            it->second.first + "'"));
                    }
                }

                if (fr.encoding != FieldEncoding::Enum) continue;
                auto it = fr.enum_ref ? enums.find(*fr.enum_ref) : enums.end();
                if (it == enums.end()) {
                    out.push_back(issue(Severity::Warning, "enum-missing", path,
                                        "enum field '" + fr.name + "' has no enumeration definition"));
                } else if (model.enums[it->second].values.empty()) {
                    out.push_back(issue(Severity::Warning, "enum-incomplete", path,
                                        "enumeration '" + *fr.enum_ref + "' of field '" + fr.name +
                                        "' lists no values",
                                        "supply the code table for '" + fr.name + "'"));
                }
            }
        }
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Cross-edition diff
// ─────────────────────────────────────────────────────────────────────────────

struct FieldLocation {
    const FieldRecord* field;
    std::string        path;
};

// Field name and its 1-based ordinal among equally named fields of a message;
// repeated names such as "Spare" pair up by position.
using FieldKey = std::pair<std::string, size_t>;

static std::map<FieldKey, FieldLocation> indexFields(const Message& msg, size_t m) {
    std::map<FieldKey, FieldLocation> idx;
    std::map<std::string, size_t> seen;
    for (size_t s = 0; s < msg.segments.size(); ++s)
        for (size_t f = 0; f < msg.segments[s].fields.size(); ++f) {
            const std::string& name = msg.segments[s].fields[f].name;
            idx.emplace(FieldKey{name, ++seen[name]},
                        FieldLocation{&msg.segments[s].fields[f], fieldPath(m, s, f)});
        }
    return idx;
}

static std::string describeField(const FieldKey& key) {
    std::string out = "'" + key.first + "'";
    if (key.second > 1) out += " (occurrence " + std::to_string(key.second) + ")";
    return out;
}

std::vector<ValidationIssue> Validator::diff(const SemanticModel& model,
                                             const SemanticModel& prior) const {
    std::vector<ValidationIssue> out;
    const std::string prior_ed = prior.document.edition.empty() ? "prior" : prior.document.edition;

    std::map<std::string, size_t> prior_msgs;
    for (size_t i = 0; i < prior.messages.size(); ++i) prior_msgs.emplace(prior.messages[i].label, i);
    std::set<std::string> current_labels;

    for (size_t m = 0; m < model.messages.size(); ++m) {
        const Message& msg = model.messages[m];
        current_labels.insert(msg.label);
        auto pit = prior_msgs.find(msg.label);
        if (pit == prior_msgs.end()) {
            out.push_back(issue(Severity::Info, "version-diff", messagePath(m),
                                "message " + msg.label + " is not present in edition " + prior_ed));
            continue;
        }

        const auto now    = indexFields(msg, m);
        const auto before = indexFields(prior.messages[pit->second], pit->second);
        for (const auto& [key, loc] : now) {
            auto b = before.find(key);
            if (b == before.end()) {
                out.push_back(issue(Severity::Info, "version-diff", loc.path,
                                    msg.label + " field " + describeField(key) +
                                    " added since edition " + prior_ed));
            } else if (b->second.field->range != loc.field->range) {
                out.push_back(issue(Severity::Info, "version-diff", loc.path,
                                    msg.label + " field " + describeField(key) + " moved from " +
                                    formatBitRange(b->second.field->range) + " to " +
                                    formatBitRange(loc.field->range)));
            }
        }
        for (const auto& [key, loc] : before) {
            if (now.count(key)) continue;
            out.push_back(issue(Severity::Info, "version-diff", "prior." + loc.path,
                                msg.label + " field " + describeField(key) +
                                " removed since edition " + prior_ed));
        }
    }

    for (size_t i = 0; i < prior.messages.size(); ++i) {
        if (current_labels.count(prior.messages[i].label)) continue;
        out.push_back(issue(Severity::Info, "version-diff", "prior." + messagePath(i),
                            "message " + prior.messages[i].label + " from edition " + prior_ed +
                            " is no longer present"));
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  validate
// ─────────────────────────────────────────────────────────────────────────────

std::vector<ValidationIssue> Validator::validate(const SemanticModel& model,
                                                 const SemanticModel* prior) const {
    auto structural = std::async(std::launch::async, [&] { return checkStructure(model); });
    auto dictionary = std::async(std::launch::async, [&] { return checkDictionary(model); });
    auto units      = std::async(std::launch::async, [&] { return checkUnits(model); });
    std::future<std::vector<ValidationIssue>> versions;
    if (prior)
        versions = std::async(std::launch::async, [&] { return diff(model, *prior); });

    // get() is called on every future so that a ContractError from one
    // checker does not leave another running against a destroyed model.
    std::vector<std::vector<ValidationIssue>> parts;
    std::exception_ptr first_error;
    auto collect = [&](std::future<std::vector<ValidationIssue>>& f) {
        if (!f.valid()) return;
        try {
            parts.push_back(f.get());
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    };
    collect(structural);
    collect(dictionary);
    collect(units);
    collect(versions);
    if (first_error) std::rethrow_exception(first_error);

    std::vector<ValidationIssue> out;
    for (auto& p : parts)
        out.insert(out.end(), std::make_move_iterator(p.begin()), std::make_move_iterator(p.end()));

    logger()->info("validation: {} errors, {} warnings, {} info",
                   countIssues(out, Severity::Error), countIssues(out, Severity::Warning),
                   countIssues(out, Severity::Info));
    return out;
}

} // namespace simforge
