// test_config.cpp – Built-in configuration, XML loading and schema errors.
//
// Usage:
//   ./build/test_config [path/to/mil_std_6016.xml]

#include "SIMForge/Config.hpp"
#include "SIMForge/Log.hpp"

#include <filesystem>
#include <iostream>
#include <string>

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

// Runs `xml` through the loader and reports whether ConfigLoadError was thrown.
static bool rejects(const std::string& xml) {
    try {
        (void)loadConfigFromString(xml);
    } catch (const ConfigLoadError& e) {
        std::cout << "     rejected: " << e.what() << '\n';
        return true;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: defaults
// ─────────────────────────────────────────────────────────────────────────────
static void testDefaults() {
    std::cout << "\n=== Test: defaultConfig ===\n";
    PipelineConfig cfg = defaultConfig();
    CHECK(!cfg.header_vocabulary.empty(),       "vocabulary populated");
    CHECK(!cfg.units.empty(),                   "unit table populated");
    CHECK(cfg.section_rules.size() == 4,        "four section rules");
    CHECK(cfg.section_rules[0].kind == SectionKind::Message, "message rule has priority");
    CHECK(cfg.min_table_score == 0.30,          "min_table_score 0.30");
    CHECK(cfg.tie_break == TieBreak::CellDensity, "cell-density tie break");
    CHECK(cfg.container_sizes.empty(),          "no container sizes by default");
    CHECK(cfg.validation.min_confidence == 0.60, "min_confidence 0.60");

    for (auto r : {ColumnRole::Name, ColumnRole::BitRange, ColumnRole::Unit,
                   ColumnRole::Description, ColumnRole::SubCategory}) {
        CHECK(parseColumnRole(toString(r)) == r, std::string("role round trip: ") + toString(r));
    }
    CHECK(!parseColumnRole("unrecognized"), "'unrecognized' is not a configurable role");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: sample configuration file
// ─────────────────────────────────────────────────────────────────────────────
static void testSampleFile(const fs::path& path) {
    std::cout << "\n=== Test: loadConfig(" << path.filename().string() << ") ===\n";
    try {
        PipelineConfig cfg = loadConfig(path);
        CHECK(cfg.container_sizes.size() == 1 && cfg.container_sizes[0] == 70, "70-bit J-series words");
        CHECK(cfg.section_rules.size() == 4,              "section rules replaced");
        CHECK(cfg.section_rules[1].label_prefix == "DFI ", "dictionary label prefix");
        CHECK(cfg.continuation_markers.size() == 3,       "continuation markers");
        CHECK(cfg.page_timeout.count() == 30000,          "page timeout");
        CHECK(!cfg.units.empty(),                         "units kept from defaults");
        CHECK(cfg.log_level == "info",                    "log level");
    } catch (const std::exception& e) {
        std::cerr << "FAIL sample config: " << e.what() << '\n';
        ++failures;
    }

    bool threw = false;
    try {
        (void)loadConfig(path.parent_path() / "does_not_exist.xml");
    } catch (const ConfigLoadError&) {
        threw = true;
    }
    CHECK(threw, "missing file → ConfigLoadError");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: overrides from a string
// ─────────────────────────────────────────────────────────────────────────────
static void testOverrides() {
    std::cout << "\n=== Test: XML overrides ===\n";
    PipelineConfig cfg = loadConfigFromString(R"(
        <PipelineConfig log_level="debug">
          <Scoring min_table_score="0.5" tie_break="prefer-b" header_scan_rows="2"/>
          <Segments><Container size="32"/><Container size="16"/></Segments>
          <Execution page_timeout_ms="250" worker_threads="2"/>
          <Validation min_confidence="0.75" report_unused_bits="false"/>
          <Vocabulary>
            <Keyword role="name">Mnemonic</Keyword>
            <Keyword role="bit-range">Octets</Keyword>
          </Vocabulary>
          <Units>
            <Unit symbol="furlong" base_si="metre" factor="201.168"><Alias>fur</Alias></Unit>
          </Units>
        </PipelineConfig>)");

    CHECK(cfg.log_level == "debug",                    "log level");
    CHECK(cfg.min_table_score == 0.5,                  "min_table_score");
    CHECK(cfg.tie_break == TieBreak::PreferB,          "tie_break prefer-b");
    CHECK(cfg.header_scan_rows == 2,                   "header_scan_rows");
    CHECK(cfg.container_sizes.size() == 2,             "two containers");
    CHECK(cfg.page_timeout.count() == 250,             "page timeout");
    CHECK(cfg.worker_threads == 2,                     "worker threads");
    CHECK(cfg.validation.min_confidence == 0.75,       "min_confidence");
    CHECK(!cfg.validation.report_unused_bits,          "unused-bit reports disabled");
    CHECK(cfg.header_vocabulary.size() == 2,           "vocabulary replaced");
    CHECK(cfg.header_vocabulary[0].keyword == "mnemonic", "keywords lower-cased");
    CHECK(cfg.units.size() == 1 && cfg.units[0].aliases[0] == "fur", "units replaced");
    CHECK(cfg.section_rules.size() == 4,               "section rules kept");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: schema violations
// ─────────────────────────────────────────────────────────────────────────────
static void testErrors() {
    std::cout << "\n=== Test: schema violations ===\n";
    CHECK(rejects("<NotAConfig/>"),                                         "wrong root");
    CHECK(rejects("<PipelineConfig><Scoring"),                              "malformed XML");
    CHECK(rejects(R"(<PipelineConfig><Scoring min_table_score="abc"/></PipelineConfig>)"), "bad double");
    CHECK(rejects(R"(<PipelineConfig><Scoring min_table_score="1.5"/></PipelineConfig>)"), "score out of range");
    CHECK(rejects(R"(<PipelineConfig><Scoring header_match="0" column_consistency="0" bit_parse="0"/></PipelineConfig>)"),
          "zero weight sum");
    CHECK(rejects(R"(<PipelineConfig><Scoring tie_break="coin-flip"/></PipelineConfig>)"), "unknown tie break");
    CHECK(rejects(R"(<PipelineConfig><Segments><Container size="0"/></Segments></PipelineConfig>)"), "zero container");
    CHECK(rejects(R"(<PipelineConfig><Vocabulary><Keyword role="colour">x</Keyword></Vocabulary></PipelineConfig>)"),
          "unknown column role");
    CHECK(rejects(R"(<PipelineConfig><Sections><Rule kind="message" pattern="(unclosed"/></Sections></PipelineConfig>)"),
          "invalid regex");
    CHECK(rejects(R"(<PipelineConfig><Sections><Rule kind="message" pattern="J\d+" label_group="1"/></Sections></PipelineConfig>)"),
          "missing capture group");
    CHECK(rejects(R"xml(<PipelineConfig><Sections><Rule kind="chapter" pattern="(x)"/></Sections></PipelineConfig>)xml"),
          "unknown section kind");
    CHECK(rejects(R"(<PipelineConfig><Units><Unit base_si="metre"/></Units></PipelineConfig>)"), "unit without symbol");
}

static void testLogLevel() {
    std::cout << "\n=== Test: log level ===\n";
    CHECK(setLogLevel("warn"),          "'warn' accepted");
    CHECK(logger()->level() == spdlog::level::warn, "level applied");
    CHECK(!setLogLevel("chatty"),       "unknown level rejected");
    CHECK(logger()->level() == spdlog::level::warn, "level unchanged after rejection");
    CHECK(setLogLevel("off"),           "'off' accepted");
    CHECK(setLogLevel("info"),          "back to info");

    configureLogging("error");
    CHECK(logger()->level() == spdlog::level::err, "configured level applied");
    configureLogging("verbose");
    CHECK(logger()->level() == spdlog::level::err, "unknown configured level keeps the current one");
    configureLogging("info");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    const fs::path cfg_path = argc > 1
        ? fs::path(argv[1])
        : fs::path(__FILE__).parent_path().parent_path() / "config" / "mil_std_6016.xml";

    testDefaults();
    testSampleFile(cfg_path);
    testOverrides();
    testErrors();
    testLogLevel();

    std::cout << '\n' << (failures == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << " (" << failures << " failure(s))\n";
    return failures == 0 ? 0 : 1;
}
