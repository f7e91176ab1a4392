// test_normalizer.cpp – Row parsing, unit resolution, encodings and markers.

#include "SIMForge/Arbiter.hpp"
#include "SIMForge/Config.hpp"
#include "SIMForge/Errors.hpp"
#include "SIMForge/FieldNormalizer.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace simforge;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

using Grid = std::vector<std::vector<std::string>>;

// A selected table with a fixed score so that confidences are predictable.
static SelectedTable selected(const PipelineConfig& cfg, Grid rows, uint32_t page = 12) {
    SelectedTable t;
    t.candidate.method      = ExtractionMethod::A;
    t.candidate.method_name = "lattice";
    t.candidate.region      = PageRegion{page, 0, 0, 0, 1, 1};
    t.candidate.rows        = std::move(rows);
    t.layout                = resolveHeader(t.candidate.rows, cfg.header_vocabulary, cfg.header_scan_rows);
    t.score.total           = 0.9;
    return t;
}

static Section section(SectionKind kind, std::string label) {
    Section s;
    s.kind       = kind;
    s.label      = std::move(label);
    s.first_page = 12;
    s.last_page  = 14;
    return s;
}

static const FieldRecord* find(const NormalizedTable& t, const std::string& name) {
    for (const auto& f : t.fields)
        if (f.name == name) return &f;
    return nullptr;
}

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: marker and enumeration grammars
// ─────────────────────────────────────────────────────────────────────────────
static void testGrammars() {
    std::cout << "\n=== Test: Marker and enum grammars ===\n";
    auto w2 = parseSegmentMarker("Word 2");
    CHECK(w2 && w2->type == "word" && !w2->declared_length, "'Word 2'");
    auto ext = parseSegmentMarker("Extension Word (70 bits)");
    CHECK(ext && ext->type == "extension" && ext->declared_length == 70u, "'Extension Word (70 bits)'");
    auto cont = parseSegmentMarker("Continuation Word No. 3");
    CHECK(cont && cont->type == "continuation", "'Continuation Word No. 3'");
    auto init = parseSegmentMarker("INITIAL WORD");
    CHECK(init && init->type == "initial", "upper-case initial word");
    CHECK(!parseSegmentMarker("Altitude"), "field name is not a marker");
    CHECK(!parseSegmentMarker("Word count of the message"), "prose is not a marker");

    auto v = parseEnumValues("0 = No Statement, 1 = Friend, 2 = Hostile");
    CHECK(v.size() == 3, "three coded values");
    if (v.size() == 3) {
        CHECK(v[0].code == "0" && v[0].label == "No Statement", "first value");
        CHECK(v[2].code == "2" && v[2].label == "Hostile",      "last value");
    }
    CHECK(parseEnumValues("1: Active; 0: Inactive").size() == 2, "colon separator");
    CHECK(parseEnumValues("See J3.2: note 4").empty(), "label-glued code ignored");
    CHECK(parseEnumValues("1 = Only one").empty(),     "single value is not an enumeration");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: message rows
// ─────────────────────────────────────────────────────────────────────────────
static void testMessageRows(const FieldNormalizer& n, const PipelineConfig& cfg) {
    std::cout << "\n=== Test: Message rows ===\n";
    auto t = selected(cfg, {
        {"Field", "Bits", "Units", "Description"},
        {"Initial Word", "", "", ""},
        {"Altitude", "0-15", "feet", "Current altitude"},
        {"Identity", "16-18", "", "0 = No Statement, 1 = Friend, 2 = Hostile"},
        {"Reserved", "N/A", "", ""},
        {"Spare", "19", "", ""},
        {"Callsign", "20-67", "", "ASCII characters"},
        {"", "", "", ""},
        {"Extension Word (70 bits)", "", "", ""},
        {"Speed", "0-9", "kts", ""},
        {"Course", "10-18", "furlongs", ""},
        {"Mode", "19 (MSB) through 22", "", ""},
        {"", "23-24", "", "orphan range"},
    });
    NormalizedTable out = n.normalize(t, section(SectionKind::Message, "J3.2"));

    CHECK(out.page == 12 && out.fields.size() == 7, "seven fields from twelve data rows");
    CHECK(out.skipped.size() == 2, "two rows skipped");
    if (out.skipped.size() == 2) {
        CHECK(out.skipped[0].reason == "unparseable-range" && out.skipped[0].row == 4,
              "'N/A' range skipped with row index");
        CHECK(out.skipped[0].detail.find("N/A") != std::string::npos, "skip detail quotes the cell");
        CHECK(out.skipped[1].reason == "missing-name", "nameless row skipped");
    }

    const FieldRecord* alt = find(out, "Altitude");
    CHECK(alt && alt->range == (BitRange{0, 15}), "Altitude 0-15");
    CHECK(alt && alt->unit == "foot" && alt->unit_resolved, "'feet' → foot");
    CHECK(alt && alt->encoding == FieldEncoding::Integer, "Altitude integer");
    CHECK(alt && near(alt->confidence, 0.9), "clean row keeps the table score");
    CHECK(alt && alt->segment_marker && alt->segment_marker->type == "initial",
          "marker row attaches to the next field");
    CHECK(alt && alt->source_page == 12 && alt->source_row == 2, "provenance");

    const FieldRecord* id = find(out, "Identity");
    CHECK(id && id->encoding == FieldEncoding::Enum, "coded values → enum");
    CHECK(id && id->enum_ref == "J3.2.Identity", "enum reference key");
    CHECK(id && id->nullable, "'No Statement' → nullable");
    CHECK(id && !id->segment_marker, "marker consumed once");
    CHECK(out.enums.size() == 1 && out.enums[0].values.size() == 3, "enum definition emitted");

    const FieldRecord* spare = find(out, "Spare");
    CHECK(spare && spare->encoding == FieldEncoding::Binary && spare->range.width() == 1, "spare bit binary");

    const FieldRecord* cs = find(out, "Callsign");
    CHECK(cs && cs->encoding == FieldEncoding::String, "ASCII → string");

    const FieldRecord* speed = find(out, "Speed");
    CHECK(speed && speed->unit == "knot", "'kts' → knot");
    CHECK(speed && speed->segment_marker && speed->segment_marker->type == "extension" &&
          speed->segment_marker->declared_length == 70u, "extension marker with declared length");

    const FieldRecord* course = find(out, "Course");
    CHECK(course && course->unit == "furlongs" && !course->unit_resolved, "unknown unit kept verbatim");
    CHECK(course && near(course->confidence, 0.9 * 0.9), "unresolved unit penalty");

    const FieldRecord* mode = find(out, "Mode");
    CHECK(mode && mode->range == (BitRange{19, 22}), "fallback range");
    CHECK(mode && near(mode->confidence, 0.9 * 0.85), "fallback range penalty");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: alternative column layouts
// ─────────────────────────────────────────────────────────────────────────────
static void testColumnLayouts(const FieldNormalizer& n, const PipelineConfig& cfg) {
    std::cout << "\n=== Test: Column layouts ===\n";
    const Section j = section(SectionKind::Message, "J7.0");

    auto start_len = selected(cfg, {
        {"Field", "Start", "Length", "Type"},
        {"Free Text", "0", "variable", "ASCII"},
        {"Count", "8", "8", "unsigned"},
    });
    NormalizedTable a = n.normalize(start_len, j);
    const FieldRecord* text  = find(a, "Free Text");
    const FieldRecord* count = find(a, "Count");
    CHECK(text && text->encoding == FieldEncoding::VariableLength, "variable length column");
    CHECK(count && count->range == (BitRange{8, 15}), "start + length → 8-15");
    CHECK(count && count->encoding == FieldEncoding::Integer, "unsigned → integer");

    auto start_end = selected(cfg, {
        {"Field", "Start Bit", "End Bit"},
        {"Track Number", "4", "18"},
    });
    NormalizedTable b = n.normalize(start_end, j);
    CHECK(b.fields.size() == 1 && b.fields[0].range == (BitRange{4, 18}), "start/end columns");

    auto no_name = selected(cfg, {
        {"Mnemonic", "Bits", "Description"},
        {"ALT", "0-11", "Altitude"},
    });
    NormalizedTable c = n.normalize(no_name, j);
    CHECK(c.fields.size() == 1 && c.fields[0].name == "ALT", "name from unrecognized column");
    CHECK(c.fields.size() == 1 && near(c.fields[0].confidence, 0.9 * 0.85), "name fallback penalty");

    auto words = selected(cfg, {
        {"Word", "Field", "Bits"},
        {"1", "A", "0-3"},
        {"1", "B", "4-7"},
        {"2", "C", "0-3"},
    });
    NormalizedTable d = n.normalize(words, j);
    CHECK(d.fields.size() == 3, "three fields");
    if (d.fields.size() == 3) {
        CHECK(d.fields[0].segment_marker.has_value(),  "first segment value opens a segment");
        CHECK(!d.fields[1].segment_marker.has_value(), "same value continues the segment");
        CHECK(d.fields[2].segment_marker.has_value(),  "changed value opens a new segment");
    }

    auto unit_in_desc = selected(cfg, {
        {"Field", "Bits", "Description"},
        {"Range", "0-9", "Range in nautical miles"},
    });
    NormalizedTable e = n.normalize(unit_in_desc, j);
    CHECK(e.fields.size() == 1 && e.fields[0].unit == "nautical-mile", "unit word found in description");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: dictionary rows
// ─────────────────────────────────────────────────────────────────────────────
static void testDictionaryRows(const FieldNormalizer& n, const PipelineConfig& cfg) {
    std::cout << "\n=== Test: Dictionary rows ===\n";
    const Section dfi = section(SectionKind::Dictionary, "DFI 281");

    auto cols = selected(cfg, {
        {"DFI", "DUI", "DI", "Name"},
        {"281", "", "", "Track Number"},
        {"281", "1", "", "TN Source"},
        {"281", "1", "3", "Octal"},
    });
    NormalizedTable a = n.normalize(cols, dfi);
    CHECK(a.dictionary_rows.size() == 3, "three rows by columns");
    if (a.dictionary_rows.size() == 3) {
        CHECK(a.dictionary_rows[0].level == DictionaryLevel::Category && a.dictionary_rows[0].category_id == 281u,
              "category row");
        CHECK(a.dictionary_rows[1].level == DictionaryLevel::SubCategory && a.dictionary_rows[1].sub_category_id == 1u,
              "sub-category row");
        CHECK(a.dictionary_rows[2].level == DictionaryLevel::Item && a.dictionary_rows[2].item_id == 3u,
              "item row");
    }

    auto dotted = selected(cfg, {
        {"Number", "Name"},
        {"281", "Track Number"},
        {"281.1", "TN Source"},
        {"281.1.3", "Octal"},
    });
    NormalizedTable b = n.normalize(dotted, dfi);
    CHECK(b.dictionary_rows.size() == 3, "three rows by dotted code");
    if (b.dictionary_rows.size() == 3) {
        CHECK(b.dictionary_rows[1].level == DictionaryLevel::SubCategory, "281.1 → sub-category");
        CHECK(b.dictionary_rows[2].level == DictionaryLevel::Item && b.dictionary_rows[2].item_id == 3u,
              "281.1.3 → item 3");
    }

    auto indented = selected(cfg, {
        {"Name", "Description"},
        {"Track Number", "Identifies a track"},
        {"  TN Source", "Originator"},
        {"    Octal", "Octal digits"},
        {"Other", "Second category"},
    });
    NormalizedTable c = n.normalize(indented, dfi);
    CHECK(c.dictionary_rows.size() == 4, "four rows by indentation");
    if (c.dictionary_rows.size() == 4) {
        CHECK(c.dictionary_rows[0].level == DictionaryLevel::Category,    "indent 0 → category");
        CHECK(c.dictionary_rows[1].level == DictionaryLevel::SubCategory, "indent 2 → sub-category");
        CHECK(c.dictionary_rows[1].name == "TN Source",                    "name cleaned");
        CHECK(c.dictionary_rows[2].level == DictionaryLevel::Item,        "indent 4 → item");
        CHECK(c.dictionary_rows[3].level == DictionaryLevel::Category,    "dedent → category");
    }
}

// Ranges up to the largest accepted bit index.
static void testWideRange(const FieldNormalizer& n, const PipelineConfig& cfg) {
    std::cout << "\n=== Test: Full-width range ===\n";
    auto t = selected(cfg, {{"Field", "Bits"}, {"Payload", "0-2147483647"}});
    NormalizedTable out = n.normalize(t, section(SectionKind::Message, "J28.2"));
    const FieldRecord* p = find(out, "Payload");
    CHECK(p && p->range == (BitRange{0, 2147483647}), "range parsed");
    CHECK(p && p->range.width() == 2147483648LL, "width does not wrap");
    CHECK(p && p->encoding == FieldEncoding::Binary, "over 64 bits → binary");
}

static void testUnsupportedSection(const FieldNormalizer& n, const PipelineConfig& cfg) {
    std::cout << "\n=== Test: Unsupported section kind ===\n";
    auto t = selected(cfg, {{"Field", "Bits"}, {"A", "0-1"}});
    bool threw = false;
    try {
        (void)n.normalize(t, section(SectionKind::Appendix, "Appendix B"));
    } catch (const ContractError&) {
        threw = true;
    }
    CHECK(threw, "appendix table → ContractError");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    const PipelineConfig cfg = defaultConfig();
    const FieldNormalizer n(cfg);

    testGrammars();
    testMessageRows(n, cfg);
    testColumnLayouts(n, cfg);
    testDictionaryRows(n, cfg);
    testWideRange(n, cfg);
    testUnsupportedSection(n, cfg);

    std::cout << '\n' << (failures == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << " (" << failures << " failure(s))\n";
    return failures == 0 ? 0 : 1;
}
