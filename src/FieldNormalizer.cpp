// FieldNormalizer.cpp – Row-level parsing, unit resolution and type inference.

#include "SIMForge/FieldNormalizer.hpp"
#include "SIMForge/Errors.hpp"
#include "SIMForge/Log.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <limits>
#include <regex>
#include <set>

namespace simforge {

// Confidence penalties applied to the table score when a sub-parse needed a
// fallback heuristic.
constexpr double kRangeFallbackPenalty  = 0.15;
constexpr double kNameFallbackPenalty   = 0.15;
constexpr double kUnitUnresolvedPenalty = 0.10;

// ─────────────────────────────────────────────────────────────────────────────
//  RowView
// ─────────────────────────────────────────────────────────────────────────────

std::string RowView::raw(ColumnRole role) const {
    auto col = layout_.column(role);
    if (!col || *col >= cells_.size()) return {};
    return cells_[*col];
}

std::string RowView::text(ColumnRole role) const {
    return cleanText(raw(role));
}

std::optional<ParsedRange> RowView::range() const {
    const std::string bits = text(ColumnRole::BitRange);
    if (!bits.empty()) return parseBitRange(bits);

    const std::string start_s = text(ColumnRole::StartBit);
    if (start_s.empty()) return std::nullopt;
    auto start = parseBitRange(start_s);
    if (!start) return std::nullopt;

    const std::string end_s = text(ColumnRole::EndBit);
    if (!end_s.empty()) {
        auto end = parseBitRange(end_s);
        if (!end) return std::nullopt;
        ParsedRange out;
        out.exact = start->exact && end->exact &&
                    start->range.start == start->range.end && end->range.start == end->range.end;
        int32_t a = start->range.start, b = end->range.end;
        if (a > b) { std::swap(a, b); out.exact = false; }
        out.range = BitRange{a, b};
        return out;
    }

    const std::string len_s = text(ColumnRole::Length);
    if (auto len = parseUnsigned(len_s); len && *len > 0) {
        const int64_t end = static_cast<int64_t>(start->range.start) + *len - 1;
        if (end > std::numeric_limits<int32_t>::max()) return std::nullopt;
        ParsedRange out;
        out.exact = start->exact;
        out.range = BitRange{start->range.start, static_cast<int32_t>(end)};
        return out;
    }
    return start;
}

std::string RowView::rangeText() const {
    std::string bits = text(ColumnRole::BitRange);
    if (!bits.empty()) return bits;
    std::string s = text(ColumnRole::StartBit);
    std::string e = text(ColumnRole::EndBit);
    if (!e.empty()) return s + " / " + e;
    return s;
}

std::string RowView::firstUnrecognized() const {
    for (size_t i = 0; i < cells_.size() && i < layout_.roles.size(); ++i) {
        if (layout_.roles[i] != ColumnRole::Unrecognized) continue;
        std::string t = cleanText(cells_[i]);
        if (!t.empty()) return t;
    }
    return {};
}

std::string RowView::firstNonEmpty() const {
    for (const auto& c : cells_) {
        std::string t = cleanText(c);
        if (!t.empty()) return t;
    }
    return {};
}

bool RowView::blank() const {
    return firstNonEmpty().empty();
}

// ─────────────────────────────────────────────────────────────────────────────
//  Marker and enumeration parsing
// ─────────────────────────────────────────────────────────────────────────────

std::optional<SegmentMarker> parseSegmentMarker(std::string_view text) {
    static const std::regex marker_re(
        R"(^(?:(initial|extension|continuation)\s+)?(?:word|segment)(?:\s*(?:no\.?|#)?\s*([a-z]?\d+))?\s*(?:\(\s*(\d+)\s*-?\s*bits?\s*\))?\s*$)",
        std::regex::ECMAScript | std::regex::icase);

    const std::string clean = cleanText(text);
    std::smatch m;
    if (!std::regex_match(clean, m, marker_re)) return std::nullopt;

    SegmentMarker marker;
    marker.type = m[1].matched ? toLower(m[1].str()) : "word";
    if (m[3].matched) marker.declared_length = parseUnsigned(m[3].str());
    return marker;
}

std::vector<EnumValue> parseEnumValues(std::string_view description) {
    static const std::regex pair_re(R"((\d+)\s*[=:]\s*)");

    const std::string text = cleanText(description);
    std::vector<std::pair<size_t, size_t>> hits; // (match begin, label begin)
    std::vector<std::string> codes;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pair_re);
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        // A code must not be glued to a preceding word ("J3.2:").
        const size_t pos = static_cast<size_t>(m.position(0));
        if (pos > 0 && std::isalnum(static_cast<unsigned char>(text[pos - 1]))) continue;
        if (pos > 0 && text[pos - 1] == '.') continue;
        hits.emplace_back(pos, pos + static_cast<size_t>(m.length(0)));
        codes.push_back(m[1].str());
    }

    std::vector<EnumValue> values;
    for (size_t i = 0; i < hits.size(); ++i) {
        const size_t end = i + 1 < hits.size() ? hits[i + 1].first : text.size();
        std::string label = text.substr(hits[i].second, end - hits[i].second);
        while (!label.empty() && (label.back() == ',' || label.back() == ';' || label.back() == ' '))
            label.pop_back();
        label = trim(label);
        if (label.empty()) continue;
        values.push_back({codes[i], std::move(label)});
    }
    if (values.size() < 2) values.clear();
    return values;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Inference helpers
// ─────────────────────────────────────────────────────────────────────────────

static bool containsAnyWord(const std::string& lower, std::initializer_list<const char*> words) {
    for (const char* w : words)
        if (containsWord(lower, w)) return true;
    return false;
}

static bool isPlaceholderCell(const std::string& lower) {
    return lower.empty() || lower == "-" || lower == "--" || lower == "n/a" ||
           lower == "na" || lower == "none" || lower == "nil";
}

static bool isVariableToken(const std::string& lower) {
    return lower == "var" || lower == "variable" || lower == "v" || lower == "*" ||
           lower == "n" || lower == "varies" || lower == "var." ||
           lower.rfind("variable", 0) == 0;
}

struct EncodingInputs {
    const std::string& name_lower;
    const std::string& desc_lower;
    const std::string& type_lower;
    const std::string& length_lower;
    int64_t            width;
    bool               has_enum_values;
};

static FieldEncoding inferEncoding(const EncodingInputs& in) {
    if (isVariableToken(in.length_lower) || containsWord(in.type_lower, "variable"))
        return FieldEncoding::VariableLength;

    if (in.has_enum_values ||
        containsAnyWord(in.type_lower, {"enum", "enumerated", "enumeration", "coded", "code"}) ||
        containsAnyWord(in.desc_lower, {"see table", "enumerated", "enumeration", "coded as",
                                        "see enumeration"}))
        return FieldEncoding::Enum;

    if (containsAnyWord(in.type_lower, {"ascii", "char", "character", "characters", "string",
                                        "text", "utf", "utf-8", "alphanumeric"}) ||
        containsAnyWord(in.desc_lower, {"ascii", "character string", "characters", "string",
                                        "text", "utf-8", "utf8", "alphanumeric"}))
        return FieldEncoding::String;

    if (in.width == 1 || in.width > 64 ||
        containsAnyWord(in.name_lower, {"spare", "reserved", "disused"}) ||
        containsAnyWord(in.desc_lower, {"spare", "reserved", "disused"}) ||
        containsAnyWord(in.type_lower, {"binary", "flag", "flags", "bitmap"}))
        return FieldEncoding::Binary;

    return FieldEncoding::Integer;
}

static bool inferNullable(const std::string& desc_lower) {
    return containsAnyWord(desc_lower, {"optional", "may be", "can be", "if available",
                                        "if present", "no statement"});
}

// ─────────────────────────────────────────────────────────────────────────────
//  FieldNormalizer
// ─────────────────────────────────────────────────────────────────────────────

FieldNormalizer::FieldNormalizer(const PipelineConfig& cfg)
    : cfg_(cfg), units_(cfg.units) {}

void FieldNormalizer::resolveUnit(const std::string& cell, const std::string& description,
                                  FieldRecord& rec) const {
    const std::string lower = toLower(cell);
    if (!isPlaceholderCell(lower)) {
        if (const UnitDefinition* def = units_.resolve(cell)) {
            rec.unit          = def->symbol;
            rec.unit_resolved = true;
        } else {
            rec.unit          = cell;
            rec.unit_resolved = false;
        }
        return;
    }

    // No unit column value: look for an unambiguous unit word in the
    // description. Short alphabetic aliases ("m", "s") are too noisy here.
    const std::string desc = toLower(description);
    if (desc.empty()) return;
    for (const auto& def : units_.definitions()) {
        for (const auto& alias : def.aliases) {
            const bool alpha_only = std::all_of(alias.begin(), alias.end(), [](char c) {
                return std::isalpha(static_cast<unsigned char>(c)) || c == ' ';
            });
            if (alpha_only && alias.size() < 4) continue;
            if (containsWord(desc, alias)) {
                rec.unit          = def.symbol;
                rec.unit_resolved = true;
                return;
            }
        }
    }
}

NormalizedTable FieldNormalizer::normalize(const SelectedTable& table, const Section& section) const {
    NormalizedTable out;
    out.page         = table.candidate.region.page;
    out.region_index = table.candidate.region.index;
    out.table_score  = table.score.total;

    switch (section.kind) {
    case SectionKind::Message:    normalizeMessageRows(table, section, out);    break;
    case SectionKind::Dictionary: normalizeDictionaryRows(table, section, out); break;
    default:
        throw ContractError("FieldNormalizer: section '" + section.label + "' of kind " +
                            toString(section.kind) + " carries no field tables");
    }

    logger()->debug("page {} region {} ({}): {} fields, {} dictionary rows, {} skipped",
                    out.page, out.region_index, section.label, out.fields.size(),
                    out.dictionary_rows.size(), out.skipped.size());
    return out;
}

// ─── Message tables ───────────────────────────────────────────────────────────

void FieldNormalizer::normalizeMessageRows(const SelectedTable& table, const Section& section,
                                           NormalizedTable& out) const {
    const auto& rows   = table.candidate.rows;
    const auto& layout = table.layout;

    std::optional<SegmentMarker> pending;
    std::string                  last_segment_value;

    for (size_t r = layout.header_row + 1; r < rows.size(); ++r) {
        RowView row(rows[r], layout);
        if (row.blank()) continue;

        auto parsed = row.range();

        // Marker rows ("Extension Word 1") carry no range of their own.
        if (!parsed) {
            if (auto marker = parseSegmentMarker(row.firstNonEmpty())) {
                pending = std::move(marker);
                continue;
            }
        }

        // Segment column: a change of value starts a segment.
        const std::string seg = row.segment();
        if (!seg.empty() && seg != last_segment_value) {
            if (!pending) {
                pending = parseSegmentMarker(seg);
                if (!pending) pending = parseSegmentMarker("word " + seg);
                if (!pending) pending = SegmentMarker{"word", std::nullopt};
            }
            last_segment_value = seg;
        }

        FieldRecord rec;
        bool name_fallback = false;
        rec.name = row.name();
        if (rec.name.empty() && !layout.has(ColumnRole::Name)) {
            rec.name      = row.firstUnrecognized();
            name_fallback = !rec.name.empty();
        }

        const uint32_t row_no = static_cast<uint32_t>(r);
        if (rec.name.empty()) {
            out.skipped.push_back({out.page, row_no, section.label, "missing-name",
                                   "row has no field name"});
            continue;
        }
        if (!parsed) {
            const std::string cell = row.rangeText();
            out.skipped.push_back({out.page, row_no, section.label, "unparseable-range",
                                   "field '" + rec.name + "': range cell '" + cell +
                                   "' is not a bit range"});
            continue;
        }

        rec.range       = parsed->range;
        rec.description = row.description();
        rec.source_page = out.page;
        rec.source_row  = row_no;
        if (std::string res = row.resolution(); !isPlaceholderCell(toLower(res)))
            rec.resolution = std::move(res);

        resolveUnit(row.unit(), rec.description, rec);

        const std::string name_lower = toLower(rec.name);
        const std::string desc_lower = toLower(rec.description);
        const std::string type_lower = toLower(row.type());
        const std::string len_lower  = toLower(row.length());

        std::vector<EnumValue> values = parseEnumValues(rec.description);
        rec.encoding = inferEncoding({name_lower, desc_lower, type_lower, len_lower,
                                      rec.range.width(), !values.empty()});
        rec.nullable = inferNullable(desc_lower);

        if (rec.encoding == FieldEncoding::Enum) {
            EnumDefinition def;
            def.key    = section.label + "." + rec.name;
            def.values = std::move(values);
            rec.enum_ref = def.key;
            out.enums.push_back(std::move(def));
        }

        double penalty = 0.0;
        if (!parsed->exact)     penalty += kRangeFallbackPenalty;
        if (name_fallback)      penalty += kNameFallbackPenalty;
        if (!rec.unit_resolved) penalty += kUnitUnresolvedPenalty;
        rec.confidence = std::clamp(table.score.total * (1.0 - penalty), 0.0, 1.0);

        if (pending) {
            rec.segment_marker = std::move(pending);
            pending.reset();
        }
        out.fields.push_back(std::move(rec));
    }
}

// ─── Dictionary tables ────────────────────────────────────────────────────────

// First integer in a cell ("DFI 281" → 281).
static std::optional<uint32_t> firstInteger(const std::string& cell) {
    size_t i = 0;
    while (i < cell.size() && !std::isdigit(static_cast<unsigned char>(cell[i]))) ++i;
    size_t j = i;
    while (j < cell.size() && std::isdigit(static_cast<unsigned char>(cell[j]))) ++j;
    if (i == j) return std::nullopt;
    return parseUnsigned(std::string_view(cell).substr(i, j - i));
}

// "281", "281.1", "281.1.3" → up to three components.
static std::vector<uint32_t> dottedCode(const std::string& cell) {
    std::vector<uint32_t> parts;
    size_t pos = 0;
    while (pos <= cell.size()) {
        size_t dot = cell.find('.', pos);
        if (dot == std::string::npos) dot = cell.size();
        auto v = parseUnsigned(std::string_view(cell).substr(pos, dot - pos));
        if (!v) return {};
        parts.push_back(*v);
        pos = dot + 1;
        if (dot == cell.size()) break;
    }
    if (parts.size() > 3) return {};
    return parts;
}

void FieldNormalizer::normalizeDictionaryRows(const SelectedTable& table, const Section& section,
                                              NormalizedTable& out) const {
    const auto& rows   = table.candidate.rows;
    const auto& layout = table.layout;

    const bool by_columns = layout.has(ColumnRole::Category) ||
                            layout.has(ColumnRole::SubCategory) ||
                            layout.has(ColumnRole::Item);

    // Indentation ranks are computed over the whole table.
    std::set<uint32_t> indents;
    if (!by_columns) {
        for (size_t r = layout.header_row + 1; r < rows.size(); ++r) {
            RowView row(rows[r], layout);
            if (!row.blank()) indents.insert(leadingIndent(row.raw(ColumnRole::Name)));
        }
    }

    for (size_t r = layout.header_row + 1; r < rows.size(); ++r) {
        RowView row(rows[r], layout);
        if (row.blank()) continue;

        DictionaryRow d;
        d.page        = out.page;
        d.row         = static_cast<uint32_t>(r);
        d.name        = row.name();
        d.description = row.description();
        if (d.name.empty()) d.name = d.description;
        if (d.name.empty()) d.name = row.firstUnrecognized();

        if (d.name.empty()) {
            out.skipped.push_back({out.page, d.row, section.label, "missing-name",
                                   "dictionary row has no name"});
            continue;
        }

        if (by_columns) {
            d.category_id     = firstInteger(row.text(ColumnRole::Category));
            d.sub_category_id = firstInteger(row.text(ColumnRole::SubCategory));
            d.item_id         = firstInteger(row.text(ColumnRole::Item));
            if (d.item_id)              d.level = DictionaryLevel::Item;
            else if (d.sub_category_id) d.level = DictionaryLevel::SubCategory;
            else                        d.level = DictionaryLevel::Category;
        } else {
            std::vector<uint32_t> code = dottedCode(row.firstUnrecognized());
            if (!code.empty() && row.firstUnrecognized() != d.name) {
                d.level = static_cast<DictionaryLevel>(code.size() - 1);
                d.category_id = code[0];
                if (code.size() > 1) d.sub_category_id = code[1];
                if (code.size() > 2) d.item_id = code[2];
            } else {
                const uint32_t indent = leadingIndent(row.raw(ColumnRole::Name));
                const auto rank = static_cast<size_t>(std::distance(indents.begin(), indents.find(indent)));
                d.level = static_cast<DictionaryLevel>(std::min<size_t>(rank, 2));
            }
        }
        out.dictionary_rows.push_back(std::move(d));
    }
}

} // namespace simforge
