// Config.cpp – Default tables, unit lookup and the XML configuration loader.
// Parsing uses pugixml.

#include "SIMForge/Config.hpp"
#include "SIMForge/Text.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <initializer_list>
#include <string>

namespace simforge {

// ─────────────────────────────────────────────────────────────────────────────
//  Column roles
// ─────────────────────────────────────────────────────────────────────────────

const char* toString(ColumnRole r) noexcept {
    switch (r) {
    case ColumnRole::Name:         return "name";
    case ColumnRole::BitRange:     return "bit-range";
    case ColumnRole::StartBit:     return "start-bit";
    case ColumnRole::EndBit:       return "end-bit";
    case ColumnRole::Length:       return "length";
    case ColumnRole::Unit:         return "unit";
    case ColumnRole::Description:  return "description";
    case ColumnRole::Segment:      return "segment";
    case ColumnRole::Type:         return "type";
    case ColumnRole::Resolution:   return "resolution";
    case ColumnRole::Category:     return "category";
    case ColumnRole::SubCategory:  return "sub-category";
    case ColumnRole::Item:         return "item";
    case ColumnRole::Unrecognized: return "unrecognized";
    }
    return "unrecognized";
}

std::optional<ColumnRole> parseColumnRole(std::string_view s) {
    for (auto r : {ColumnRole::Name, ColumnRole::BitRange, ColumnRole::StartBit,
                   ColumnRole::EndBit, ColumnRole::Length, ColumnRole::Unit,
                   ColumnRole::Description, ColumnRole::Segment, ColumnRole::Type,
                   ColumnRole::Resolution, ColumnRole::Category, ColumnRole::SubCategory,
                   ColumnRole::Item}) {
        if (s == toString(r)) return r;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
//  UnitTable
// ─────────────────────────────────────────────────────────────────────────────

UnitTable::UnitTable(std::vector<UnitDefinition> defs) : defs_(std::move(defs)) {
    for (size_t i = 0; i < defs_.size(); ++i) {
        const auto& d = defs_[i];
        by_symbol_.emplace(d.symbol, i);
        by_token_.emplace(toLower(d.symbol), i);
        for (const auto& a : d.aliases)
            by_token_.emplace(toLower(cleanText(a)), i);
    }
}

const UnitDefinition* UnitTable::resolve(std::string_view token) const {
    std::string key = toLower(cleanText(token));
    // Tolerate a trailing period ("ft.") and surrounding brackets ("(deg)").
    while (!key.empty() && (key.back() == '.' || key.back() == ')' || key.back() == ']'))
        key.pop_back();
    while (!key.empty() && (key.front() == '(' || key.front() == '['))
        key.erase(key.begin());
    auto it = by_token_.find(key);
    return it == by_token_.end() ? nullptr : &defs_[it->second];
}

const UnitDefinition* UnitTable::find(std::string_view symbol) const {
    auto it = by_symbol_.find(std::string(symbol));
    return it == by_symbol_.end() ? nullptr : &defs_[it->second];
}

std::optional<double> UnitTable::convert(double value, std::string_view from,
                                         std::string_view to) const {
    const UnitDefinition* f = resolve(from);
    const UnitDefinition* t = resolve(to);
    if (!f || !t || f->base_si != t->base_si || t->factor == 0.0)
        return std::nullopt;
    const double si = value * f->factor + f->offset;
    return (si - t->offset) / t->factor;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Built-in tables
// ─────────────────────────────────────────────────────────────────────────────

static std::vector<HeaderKeyword> defaultVocabulary() {
    std::vector<HeaderKeyword> v;
    auto add = [&v](ColumnRole role, std::initializer_list<const char*> words) {
        for (const char* w : words) v.push_back({role, w});
    };
    add(ColumnRole::Name,        {"field", "field name", "name", "data item", "data element",
                                  "parameter", "element"});
    add(ColumnRole::BitRange,    {"bits", "bit", "bit position", "bit positions", "bit range",
                                  "bit(s)", "position", "bit no.", "bytes", "byte", "octets",
                                  "octet", "byte position"});
    add(ColumnRole::StartBit,    {"start", "start bit", "first bit", "from", "msb"});
    add(ColumnRole::EndBit,      {"end", "end bit", "last bit", "to", "lsb"});
    add(ColumnRole::Length,      {"length", "size", "width", "no. of bits", "number of bits",
                                  "bit length", "len"});
    add(ColumnRole::Unit,        {"units", "unit", "uom", "unit of measure"});
    add(ColumnRole::Description, {"description", "desc", "remarks", "meaning", "comment",
                                  "comments", "notes", "definition"});
    add(ColumnRole::Segment,     {"word", "word no.", "word number", "segment", "word type"});
    add(ColumnRole::Type,        {"type", "data type", "format", "encoding", "coding"});
    add(ColumnRole::Resolution,  {"resolution", "lsb value", "scale", "scaling", "accuracy"});
    add(ColumnRole::Category,    {"dfi", "category"});
    add(ColumnRole::SubCategory, {"dui", "sub-category", "subcategory"});
    add(ColumnRole::Item,        {"di", "code", "value", "data item code"});
    return v;
}

static std::vector<UnitDefinition> defaultUnits() {
    return {
        {"degree",           "radian",           0.017453292519943295, 0.0, "angular degrees",
         {"deg", "degs", "degree", "degrees", "\xC2\xB0"}},
        {"radian",           "radian",           1.0,        0.0, "radians",
         {"rad", "rads", "radian", "radians"}},
        {"foot",             "metre",            0.3048,     0.0, "feet",
         {"ft", "feet", "foot"}},
        {"metre",            "metre",            1.0,        0.0, "metres",
         {"m", "meter", "meters", "metre", "metres"}},
        {"kilometre",        "metre",            1000.0,     0.0, "kilometres",
         {"km", "kilometer", "kilometers", "kilometre", "kilometres"}},
        {"nautical-mile",    "metre",            1852.0,     0.0, "nautical miles",
         {"nm", "nmi", "nautical mile", "nautical miles"}},
        {"data-mile",        "metre",            1828.8,     0.0, "data miles (6000 ft)",
         {"dm", "data mile", "data miles"}},
        {"knot",             "metre-per-second", 0.514444,   0.0, "knots",
         {"kt", "kts", "knot", "knots"}},
        {"metre-per-second", "metre-per-second", 1.0,        0.0, "metres per second",
         {"m/s", "mps", "meters per second", "metres per second", "meter/second", "metre/second"}},
        {"foot-per-second",  "metre-per-second", 0.3048,     0.0, "feet per second",
         {"ft/s", "fps", "feet per second", "feet/second"}},
        {"foot-per-minute",  "metre-per-second", 0.00508,    0.0, "feet per minute",
         {"ft/min", "fpm", "feet per minute"}},
        {"second",           "second",           1.0,        0.0, "seconds",
         {"s", "sec", "secs", "second", "seconds"}},
        {"millisecond",      "second",           0.001,      0.0, "milliseconds",
         {"ms", "msec", "millisecond", "milliseconds"}},
        {"minute",           "second",           60.0,       0.0, "minutes",
         {"min", "mins", "minute", "minutes"}},
        {"hour",             "second",           3600.0,     0.0, "hours",
         {"h", "hr", "hrs", "hour", "hours"}},
        {"hertz",            "hertz",            1.0,        0.0, "hertz",
         {"hz", "hertz"}},
        {"kilohertz",        "hertz",            1.0e3,      0.0, "kilohertz",
         {"khz", "kilohertz"}},
        {"megahertz",        "hertz",            1.0e6,      0.0, "megahertz",
         {"mhz", "megahertz"}},
        {"decibel",          "decibel",          1.0,        0.0, "decibels",
         {"db", "decibel", "decibels"}},
        {"percent",          "ratio",            0.01,       0.0, "percent",
         {"%", "pct", "percent"}},
        {"degree-celsius",   "kelvin",           1.0,        273.15, "degrees Celsius",
         {"degc", "\xC2\xB0" "c", "celsius", "degrees celsius"}},
    };
}

static std::vector<SectionRule> defaultSectionRules() {
    return {
        {SectionKind::Message,    R"(^\s*(?!(?:DFI|DUI|DI)\s)([A-Z]{1,3}\s?\d{1,3}(?:\.\d{1,3})+[A-Z]?)\b)", 1, ""},
        {SectionKind::Dictionary, R"(^\s*DFI\s*(\d+)\b)",                           1, "DFI "},
        {SectionKind::Appendix,   R"(^\s*Appendix\s+([A-Z])\b)",                     1, "Appendix "},
        {SectionKind::Other,      R"(^\s*Section\s+(\d+(?:\.\d+)*))",                1, "Section "},
    };
}

PipelineConfig defaultConfig() {
    PipelineConfig cfg;
    cfg.header_vocabulary = defaultVocabulary();
    cfg.units             = defaultUnits();
    cfg.section_rules     = defaultSectionRules();
    return cfg;
}

// ─────────────────────────────────────────────────────────────────────────────
//  XML loader
// ─────────────────────────────────────────────────────────────────────────────

static uint32_t parseU32(const char* s, const char* ctx) {
    uint32_t v = 0;
    auto [ptr, ec] = std::from_chars(s, s + std::strlen(s), v);
    if (ec != std::errc{} || ptr != s + std::strlen(s))
        throw ConfigLoadError(std::string(ctx) + ": cannot parse uint '" + s + "'");
    return v;
}

static double parseDouble(const char* s, const char* ctx) {
    char* end = nullptr;
    double v = std::strtod(s, &end);
    if (end == s || *end != '\0')
        throw ConfigLoadError(std::string(ctx) + ": cannot parse double '" + s + "'");
    return v;
}

static bool parseBool(const char* s, const char* ctx) {
    if (strcmp(s, "true") == 0 || strcmp(s, "1") == 0)  return true;
    if (strcmp(s, "false") == 0 || strcmp(s, "0") == 0) return false;
    throw ConfigLoadError(std::string(ctx) + ": cannot parse bool '" + s + "'");
}

static TieBreak parseTieBreak(const char* s) {
    if (strcmp(s, "density")  == 0) return TieBreak::CellDensity;
    if (strcmp(s, "prefer-a") == 0) return TieBreak::PreferA;
    if (strcmp(s, "prefer-b") == 0) return TieBreak::PreferB;
    throw ConfigLoadError(std::string("Unknown tie_break: '") + s + "'");
}

// ─── <Scoring> ────────────────────────────────────────────────────────────────

static void parseScoring(pugi::xml_node node, PipelineConfig& cfg) {
    if (auto a = node.attribute("header_match"))       cfg.weights.header_match       = parseDouble(a.as_string(), "Scoring.header_match");
    if (auto a = node.attribute("column_consistency")) cfg.weights.column_consistency = parseDouble(a.as_string(), "Scoring.column_consistency");
    if (auto a = node.attribute("bit_parse"))          cfg.weights.bit_parse          = parseDouble(a.as_string(), "Scoring.bit_parse");
    if (auto a = node.attribute("min_table_score"))    cfg.min_table_score            = parseDouble(a.as_string(), "Scoring.min_table_score");
    if (auto a = node.attribute("tie_break"))          cfg.tie_break                  = parseTieBreak(a.as_string());
    if (auto a = node.attribute("header_scan_rows"))   cfg.header_scan_rows           = parseU32(a.as_string(), "Scoring.header_scan_rows");

    const auto& w = cfg.weights;
    if (w.header_match < 0.0 || w.column_consistency < 0.0 || w.bit_parse < 0.0 ||
        w.header_match + w.column_consistency + w.bit_parse <= 0.0)
        throw ConfigLoadError("Scoring weights must be non-negative with a positive sum");
    if (cfg.min_table_score < 0.0 || cfg.min_table_score > 1.0)
        throw ConfigLoadError("Scoring.min_table_score must lie in [0, 1]");
    if (cfg.header_scan_rows == 0)
        throw ConfigLoadError("Scoring.header_scan_rows must be at least 1");
}

// ─── <Vocabulary> ─────────────────────────────────────────────────────────────

static void parseVocabulary(pugi::xml_node node, PipelineConfig& cfg) {
    cfg.header_vocabulary.clear();
    for (auto kw : node.children("Keyword")) {
        const char* role_s = kw.attribute("role").as_string("");
        auto role = parseColumnRole(role_s);
        if (!role)
            throw ConfigLoadError(std::string("Unknown column role: '") + role_s + "'");
        std::string word = toLower(cleanText(kw.child_value()));
        if (word.empty())
            throw ConfigLoadError(std::string("Empty <Keyword> for role '") + role_s + "'");
        cfg.header_vocabulary.push_back({*role, std::move(word)});
    }
}

// ─── <Units> ──────────────────────────────────────────────────────────────────

static void parseUnits(pugi::xml_node node, PipelineConfig& cfg) {
    cfg.units.clear();
    for (auto u : node.children("Unit")) {
        UnitDefinition def;
        def.symbol      = u.attribute("symbol").as_string("");
        def.base_si     = u.attribute("base_si").as_string("");
        def.description = u.attribute("description").as_string("");
        if (auto a = u.attribute("factor")) def.factor = parseDouble(a.as_string(), "Unit.factor");
        if (auto a = u.attribute("offset")) def.offset = parseDouble(a.as_string(), "Unit.offset");
        if (def.symbol.empty())
            throw ConfigLoadError("<Unit> missing 'symbol' attribute");
        if (def.base_si.empty())
            def.base_si = def.symbol;
        for (auto alias : u.children("Alias"))
            def.aliases.emplace_back(toLower(cleanText(alias.child_value())));
        cfg.units.push_back(std::move(def));
    }
}

// ─── <Sections> ───────────────────────────────────────────────────────────────

static void parseSections(pugi::xml_node node, PipelineConfig& cfg) {
    if (auto a = node.attribute("heading_scan_lines"))
        cfg.heading_scan_lines = parseU32(a.as_string(), "Sections.heading_scan_lines");

    if (node.child("Rule")) {
        cfg.section_rules.clear();
        for (auto r : node.children("Rule")) {
            SectionRule rule;
            const char* kind_s = r.attribute("kind").as_string("");
            auto kind = parseSectionKind(kind_s);
            if (!kind)
                throw ConfigLoadError(std::string("Unknown section kind: '") + kind_s + "'");
            rule.kind         = *kind;
            rule.pattern      = r.attribute("pattern").as_string("");
            rule.label_group  = parseU32(r.attribute("label_group").as_string("1"), "Rule.label_group");
            rule.label_prefix = r.attribute("label_prefix").as_string("");
            if (rule.pattern.empty())
                throw ConfigLoadError("<Rule> missing 'pattern' attribute");
            try {
                std::regex re(rule.pattern, std::regex::ECMAScript | std::regex::icase);
                if (rule.label_group > re.mark_count())
                    throw ConfigLoadError("Rule '" + rule.pattern + "' has no capture group " +
                                          std::to_string(rule.label_group));
            } catch (const std::regex_error& e) {
                throw ConfigLoadError("Invalid section pattern '" + rule.pattern + "': " + e.what());
            }
            cfg.section_rules.push_back(std::move(rule));
        }
    }

    if (node.child("ContinuationMarker")) {
        cfg.continuation_markers.clear();
        for (auto m : node.children("ContinuationMarker"))
            cfg.continuation_markers.emplace_back(toLower(cleanText(m.child_value())));
    }
}

// ─── Root ─────────────────────────────────────────────────────────────────────

static PipelineConfig parseRoot(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("PipelineConfig");
    if (!root)
        throw ConfigLoadError("XML root element must be <PipelineConfig>");

    PipelineConfig cfg = defaultConfig();
    if (auto a = root.attribute("log_level")) cfg.log_level = a.as_string();

    if (auto n = root.child("Scoring")) parseScoring(n, cfg);

    if (auto n = root.child("Segments")) {
        cfg.container_sizes.clear();
        for (auto c : n.children("Container")) {
            uint32_t bits = parseU32(c.attribute("size").as_string(""), "Container.size");
            if (bits == 0)
                throw ConfigLoadError("<Container size=\"0\"> is not a valid container");
            cfg.container_sizes.push_back(bits);
        }
    }

    if (auto n = root.child("Execution")) {
        if (auto a = n.attribute("page_timeout_ms"))
            cfg.page_timeout = std::chrono::milliseconds(parseU32(a.as_string(), "Execution.page_timeout_ms"));
        if (auto a = n.attribute("worker_threads"))
            cfg.worker_threads = parseU32(a.as_string(), "Execution.worker_threads");
    }

    if (auto n = root.child("Validation")) {
        if (auto a = n.attribute("min_confidence"))
            cfg.validation.min_confidence = parseDouble(a.as_string(), "Validation.min_confidence");
        if (auto a = n.attribute("report_unused_bits"))
            cfg.validation.report_unused_bits = parseBool(a.as_string(), "Validation.report_unused_bits");
    }

    if (auto n = root.child("Vocabulary")) parseVocabulary(n, cfg);
    if (auto n = root.child("Units"))      parseUnits(n, cfg);
    if (auto n = root.child("Sections"))   parseSections(n, cfg);

    return cfg;
}

PipelineConfig loadConfig(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw ConfigLoadError("Failed to parse XML '" + xml_path.string() +
                              "': " + result.description());
    return parseRoot(doc);
}

PipelineConfig loadConfigFromString(std::string_view xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result)
        throw ConfigLoadError(std::string("Failed to parse XML configuration: ") +
                              result.description());
    return parseRoot(doc);
}

} // namespace simforge
