#pragma once
// Config.hpp – Immutable lookup tables and tuning constants for one pipeline.
//
// A PipelineConfig is built once (defaultConfig() or loadConfig()) and handed
// by value to the Pipeline, which passes const references to every stage.

#include "Types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace simforge {

// ─── Column roles recognised in a table header ────────────────────────────────
enum class ColumnRole {
    Name,
    BitRange,     // "Bits", "Bit Position": "0-15"
    StartBit,
    EndBit,
    Length,       // width or "variable"
    Unit,
    Description,
    Segment,      // "Word": segment-boundary column
    Type,
    Resolution,
    Category,     // dictionary: DFI
    SubCategory,  // dictionary: DUI
    Item,         // dictionary: DI / code
    Unrecognized,
};

const char* toString(ColumnRole r) noexcept;
std::optional<ColumnRole> parseColumnRole(std::string_view s);

struct HeaderKeyword {
    ColumnRole  role{ColumnRole::Unrecognized};
    std::string keyword; // lower-case
};

// ─── Arbitration scoring ──────────────────────────────────────────────────────
struct ScoringWeights {
    double header_match{0.40};
    double column_consistency{0.25};
    double bit_parse{0.35};
};

// Resolution of exactly equal candidate scores.
enum class TieBreak {
    CellDensity, // more non-empty cells wins; still equal → method A
    PreferA,
    PreferB,
};

// ─── Section recognition rule ─────────────────────────────────────────────────
// `pattern` is an ECMAScript regex applied case-insensitively to one heading
// line. The label is `label_prefix` + capture group `label_group` with
// whitespace removed.
struct SectionRule {
    SectionKind kind{SectionKind::Other};
    std::string pattern;
    uint32_t    label_group{1};
    std::string label_prefix;
};

struct ValidationConfig {
    double min_confidence{0.60};
    bool   report_unused_bits{true};
};

// ─── Unit lookup ──────────────────────────────────────────────────────────────
class UnitTable {
public:
    UnitTable() = default;
    explicit UnitTable(std::vector<UnitDefinition> defs);

    // Resolves a raw token ("ft", "Feet", "°") to its definition.
    [[nodiscard]] const UnitDefinition* resolve(std::string_view token) const;

    // Exact canonical-symbol lookup.
    [[nodiscard]] const UnitDefinition* find(std::string_view symbol) const;

    // Converts between two units sharing a base SI unit.
    [[nodiscard]] std::optional<double> convert(double value, std::string_view from,
                                                std::string_view to) const;

    [[nodiscard]] const std::vector<UnitDefinition>& definitions() const noexcept { return defs_; }

private:
    std::vector<UnitDefinition>             defs_;
    std::unordered_map<std::string, size_t> by_token_;  // lower-case alias/symbol → index
    std::unordered_map<std::string, size_t> by_symbol_;
};

// ─── Full pipeline configuration ──────────────────────────────────────────────
struct PipelineConfig {
    std::vector<HeaderKeyword>  header_vocabulary;
    std::vector<UnitDefinition> units;
    std::vector<SectionRule>    section_rules;
    std::vector<std::string>    continuation_markers{"continued", "cont'd", "cont."};

    ScoringWeights weights;
    double         min_table_score{0.30};
    TieBreak       tie_break{TieBreak::CellDensity};
    uint32_t       header_scan_rows{3};
    uint32_t       heading_scan_lines{3};

    // Fixed segment container sizes declared by the standard (e.g. 70-bit
    // J-series words). Empty: segment length is the observed maximum.
    std::vector<uint32_t> container_sizes;

    std::chrono::milliseconds page_timeout{30000};
    uint32_t                  worker_threads{0}; // 0 = hardware concurrency

    ValidationConfig validation;
    std::string      log_level{"info"}; // applied by configureLogging(), not by Pipeline
};

// Built-in tables: English header vocabulary, aeronautical/SI units and the
// message/dictionary/appendix/section heading rules.
[[nodiscard]] PipelineConfig defaultConfig();

// Thrown when a configuration file is unreadable or violates its schema.
class ConfigLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Loads a configuration from XML. Elements that are absent keep the values of
// defaultConfig(); a <vocabulary>, <units> or <sections> element replaces the
// whole corresponding default table.
[[nodiscard]] PipelineConfig loadConfig(const std::filesystem::path& xml_path);
[[nodiscard]] PipelineConfig loadConfigFromString(std::string_view xml);

} // namespace simforge
