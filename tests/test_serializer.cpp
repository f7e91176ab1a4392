// test_serializer.cpp – SIM XML and JSON writers/readers and the validation report
// formats.

#include "SIMForge/Config.hpp"
#include "SIMForge/SimSerializer.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
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

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Reports whether fromXml rejects `xml` with SimFormatError.
static bool rejects(const std::string& xml) {
    try {
        (void)fromXml(xml);
    } catch (const SimFormatError& e) {
        std::cout << "     rejected: " << e.what() << '\n';
        return true;
    }
    return false;
}

static bool rejectsJson(const std::string& text) {
    try {
        (void)fromJson(text);
    } catch (const SimFormatError& e) {
        std::cout << "     rejected: " << e.what() << '\n';
        return true;
    }
    return false;
}

static size_t occurrences(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1))
        ++n;
    return n;
}

static SemanticModel sampleModel() {
    SemanticModel m;
    m.document = Document{"MIL-STD-6016", "C", 812, TransportUnit::Bit};

    FieldRecord alt;
    alt.name          = "Altitude";
    alt.range         = BitRange{0, 15};
    alt.encoding      = FieldEncoding::Integer;
    alt.unit          = "foot";
    alt.description   = "Current altitude <MSL> & \"QNH\"";
    alt.confidence    = 0.9234567891234;
    alt.resolution    = "25 ft";
    alt.source_page   = 14;
    alt.source_row    = 3;

    FieldRecord id;
    id.name        = "Identity";
    id.range       = BitRange{16, 18};
    id.encoding    = FieldEncoding::Enum;
    id.enum_ref    = "J3.2.Identity";
    id.nullable    = true;
    id.confidence  = 0.81;
    id.source_page = 14;
    id.source_row  = 4;

    FieldRecord course;
    course.name          = "Course";
    course.range         = BitRange{0, 8};
    course.unit          = "furlongs";
    course.unit_resolved = false;
    course.confidence    = 0.7;

    Segment initial{"initial", 0, 70, true, {alt, id}};
    Segment ext{"extension", 1, 70, true, {course}};
    m.messages.push_back(Message{"J3.2", "Air Track", "C", 14, {initial, ext}});
    m.messages.push_back(Message{"J7.0", "Track Management", "C", 40, {}});

    DictionaryEntry root{"DFI-281", "", DictionaryLevel::Category, 281, 0, 0, "Track Number", ""};
    DictionaryEntry sub{"DFI-281/DUI-1", "DFI-281", DictionaryLevel::SubCategory, 281, 1, 0,
                        "TN Source", "Originator of the track number"};
    DictionaryEntry item{"DFI-281/DUI-1/DI-3", "DFI-281/DUI-1", DictionaryLevel::Item, 281, 1, 3,
                         "Octal", ""};
    m.dictionary = {root, sub, item};

    m.enums = {EnumDefinition{"J3.2.Identity", {{"0", "No Statement"}, {"1", "Friend"}}}};
    m.units = defaultConfig().units;
    return m;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: model round trip
// ─────────────────────────────────────────────────────────────────────────────
static void testRoundTrip() {
    std::cout << "\n=== Test: SIM round trip ===\n";
    const SemanticModel m = sampleModel();
    const std::string xml = toXml(m);

    CHECK(contains(xml, "<sim standard=\"MIL-STD-6016\""), "root element");
    CHECK(contains(xml, "transport_unit=\"bit\""),         "transport unit attribute");
    CHECK(contains(xml, "<segment type=\"initial\""),      "segment element");
    CHECK(contains(xml, "units=\"foot\""),                 "canonical unit");
    CHECK(contains(xml, "&lt;MSL&gt; &amp;"),              "description escaped");

    SemanticModel back = fromXml(xml);
    CHECK(back.document == m.document,     "document survives");
    CHECK(back.messages == m.messages,     "messages survive");
    CHECK(back.dictionary == m.dictionary, "dictionary survives");
    CHECK(back.enums == m.enums,           "enums survive");
    CHECK(back.units == m.units,           "units and aliases survive");
    CHECK(back == m,                       "whole model equal");
    CHECK(toXml(back) == xml,              "serialization is stable");

    const fs::path path = fs::temp_directory_path() / "simforge_test_roundtrip.xml";
    saveSim(m, path);
    SemanticModel loaded = loadSim(path);
    CHECK(loaded == m, "file round trip");
    std::error_code ec;
    fs::remove(path, ec);
}

static void testWideSegment() {
    std::cout << "\n=== Test: Segment longer than 2^31 bits ===\n";
    SemanticModel m = sampleModel();
    FieldRecord blob;
    blob.name  = "Payload";
    blob.range = BitRange{0, 2147483647};
    m.messages[1].segments.push_back(Segment{"initial", 0, 2147483648u, false, {blob}});

    CHECK(fromXml(toXml(m)) == m,   "XML keeps the length");
    CHECK(fromJson(toJson(m)) == m, "JSON keeps the length");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: JSON form
// ─────────────────────────────────────────────────────────────────────────────
static void testJson() {
    std::cout << "\n=== Test: SIM JSON ===\n";
    const SemanticModel m = sampleModel();
    const std::string text = toJson(m);

    CHECK(contains(text, "\"standard\": \"MIL-STD-6016\""), "standard key");
    CHECK(contains(text, "\"transport_unit\": \"bit\""),    "transport unit key");
    CHECK(contains(text, "\"bit_length\": 70"),              "segment length key");
    CHECK(text.find("\"standard\"") < text.find("\"messages\"") &&
          text.find("\"messages\"") < text.find("\"dictionary\"") &&
          text.find("\"dictionary\"") < text.find("\"enums\"") &&
          text.find("\"enums\"") < text.find("\"units\""),
          "keys in document order");
    CHECK(occurrences(text, "\"enum_ref\"") == 1,   "absent enum_ref omitted");
    CHECK(occurrences(text, "\"resolution\"") == 1, "absent resolution omitted");

    SemanticModel back = fromJson(text);
    CHECK(back == m, "model survives the JSON form");
    CHECK(back.messages[0].segments[0].fields[0].confidence == m.messages[0].segments[0].fields[0].confidence,
          "confidence keeps every digit");

    const fs::path path = fs::temp_directory_path() / "simforge_test_roundtrip.json";
    saveSim(m, path);
    SemanticModel loaded = loadSim(path);
    CHECK(loaded == m, "extension selects the JSON file form");
    std::error_code ec;
    fs::remove(path, ec);

    CHECK(rejectsJson("{"),                                    "unparseable JSON");
    CHECK(rejectsJson("[]"),                                   "root is not an object");
    CHECK(rejectsJson(R"({"transport_unit": "bit"})"),         "missing standard");
    CHECK(rejectsJson(R"({"standard": 7, "transport_unit": "bit"})"), "standard of the wrong type");
    CHECK(rejectsJson(R"({"standard": "x", "transport_unit": "nibble"})"), "unknown transport unit");
    CHECK(rejectsJson(R"({"standard": "x", "transport_unit": "bit", "messages": {}})"),
          "messages not an array");
    CHECK(rejectsJson(R"({"standard": "x", "transport_unit": "bit", "messages": [{"label": "J1.0",
        "segments": [{"type": "initial", "index": 0, "bit_length": 8,
        "fields": [{"name": "A", "start": 5, "end": 2, "encoding": "integer"}]}]}]})"),
          "inverted range");
    CHECK(rejectsJson(R"({"standard": "x", "transport_unit": "bit", "messages": [{"label": "J1.0",
        "segments": [{"type": "initial", "index": 0, "bit_length": 8,
        "fields": [{"name": "A", "start": 0, "end": 2, "encoding": "integer", "nullable": "no"}]}]}]})"),
          "flag of the wrong type");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: malformed input
// ─────────────────────────────────────────────────────────────────────────────
static void testMalformed() {
    std::cout << "\n=== Test: Malformed SIM input ===\n";
    CHECK(rejects("<sim"),                                         "unparseable XML");
    CHECK(rejects("<model standard=\"x\" transport_unit=\"bit\"/>"), "wrong root");
    CHECK(rejects("<sim transport_unit=\"bit\"/>"),                "missing standard");
    CHECK(rejects("<sim standard=\"x\" transport_unit=\"nibble\"/>"), "unknown transport unit");
    CHECK(rejects(R"(<sim standard="x" transport_unit="bit"><messages><message label="J1.0">
                     <segments><segment type="initial" index="0" bit_length="70">
                     <fields><field name="A" start="9" end="3" encoding="integer"/></fields>
                     </segment></segments></message></messages></sim>)"),     "inverted range");
    CHECK(rejects(R"(<sim standard="x" transport_unit="bit"><messages><message label="J1.0">
                     <segments><segment type="initial" index="0" bit_length="70">
                     <fields><field name="A" start="0" end="3" encoding="float"/></fields>
                     </segment></segments></message></messages></sim>)"),     "unknown encoding");
    CHECK(rejects(R"(<sim standard="x" transport_unit="bit"><messages><message label="J1.0">
                     <segments><segment type="initial" index="-1" bit_length="70"/>
                     </segments></message></messages></sim>)"),              "negative index");
    CHECK(rejects(R"(<sim standard="x" transport_unit="bit"><dictionary>
                     <entry key="DFI-1" level="root"/></dictionary></sim>)"), "unknown dictionary level");

    bool threw = false;
    try {
        (void)loadSim(fs::temp_directory_path() / "simforge_no_such_file.xml");
    } catch (const SimFormatError&) {
        threw = true;
    }
    CHECK(threw, "missing file → SimFormatError");

    SemanticModel minimal = fromXml("<sim standard=\"MIL-STD-6016\" transport_unit=\"byte\"/>");
    CHECK(minimal.document.transport_unit == TransportUnit::Byte && minimal.messages.empty(),
          "minimal document accepted");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: report formats
// ─────────────────────────────────────────────────────────────────────────────
static void testReports() {
    std::cout << "\n=== Test: Report formats ===\n";
    std::vector<ValidationIssue> issues = {
        {Severity::Error, "bit-overlap", "messages[0].segments[0].fields[1]",
         "fields 'Track Number' (0-14) and 'Strength' (10-19) overlap", std::string("check the ranges")},
        {Severity::Warning, "coverage-gap", "pages[12].regions[1]", "no candidates", std::nullopt},
        {Severity::Warning, "low-confidence", "messages[0].segments[0].fields[2]", "confidence 0.4",
         std::nullopt},
        {Severity::Info, "version-diff", "messages[1]", "message J7.0 is new", std::nullopt},
    };

    const std::string xml = reportToXml(issues);
    CHECK(contains(xml, "<report errors=\"1\" warnings=\"2\" info=\"1\""), "report counts");
    CHECK(contains(xml, "rule_id=\"bit-overlap\""),                          "issue rule id");
    CHECK(contains(xml, "suggested_fix=\"check the ranges\""),               "suggested fix attribute");
    CHECK(contains(xml, "target_path=\"pages[12].regions[1]\""),             "target path attribute");

    Diagnostics d;
    d.regions         = 4;
    d.tables_selected = 3;
    d.gaps.resize(1);
    d.field_count     = 12;
    d.mean_confidence = 0.8125;
    CHECK(d.coverage() == 0.75, "coverage fraction");
    CHECK(Diagnostics{}.coverage() == 1.0, "no regions → full coverage");

    const std::string text = formatReport(issues, d);
    std::cout << text;
    CHECK(contains(text, "1 errors, 2 warnings, 1 info"), "summary line");
    CHECK(contains(text, "[bit-overlap] messages[0].segments[0].fields[1]"), "issue line");
    CHECK(contains(text, "fix: check the ranges"),       "fix line");
    CHECK(text.find("error") < text.find("warning") &&
          text.find("── warning") < text.find("── info"), "grouped by severity");
    CHECK(contains(text, "3/4 regions (75.0%), 1 gaps"), "coverage line");
    CHECK(contains(text, "Fields: 12, mean confidence 0.812") ||
          contains(text, "Fields: 12, mean confidence 0.813"), "confidence line");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    testRoundTrip();
    testWideSegment();
    testJson();
    testMalformed();
    testReports();

    std::cout << '\n' << (failures == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << " (" << failures << " failure(s))\n";
    return failures == 0 ? 0 : 1;
}
