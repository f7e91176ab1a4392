#pragma once
// FieldNormalizer.hpp – Turns the rows of a selected table into FieldRecords
// (message sections) or DictionaryRows (dictionary sections).
//
// Rows that cannot yield a name and a range are reported as SkippedRows with
// a reason; they are never dropped silently.

#include "Arbiter.hpp"
#include "Config.hpp"
#include "Text.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace simforge {

// ─────────────────────────────────────────────────────────────────────────────
//  RowView – typed access to one data row through a resolved HeaderLayout
// ─────────────────────────────────────────────────────────────────────────────
class RowView {
public:
    RowView(const std::vector<std::string>& cells, const HeaderLayout& layout) noexcept
        : cells_(cells), layout_(layout) {}

    // Cleaned cell text for a role; empty when the column is absent.
    [[nodiscard]] std::string text(ColumnRole role) const;
    // Uncleaned cell text (indentation preserved).
    [[nodiscard]] std::string raw(ColumnRole role) const;

    [[nodiscard]] std::string name()        const { return text(ColumnRole::Name); }
    [[nodiscard]] std::string unit()        const { return text(ColumnRole::Unit); }
    [[nodiscard]] std::string description() const { return text(ColumnRole::Description); }
    [[nodiscard]] std::string segment()     const { return text(ColumnRole::Segment); }
    [[nodiscard]] std::string length()      const { return text(ColumnRole::Length); }
    [[nodiscard]] std::string type()        const { return text(ColumnRole::Type); }
    [[nodiscard]] std::string resolution()  const { return text(ColumnRole::Resolution); }

    // Range from the bit-range column, else start/end columns, else start +
    // length. `exact` is false when any part needed the fallback grammar.
    [[nodiscard]] std::optional<ParsedRange> range() const;

    // The raw text the range was read from (for skip reports).
    [[nodiscard]] std::string rangeText() const;

    // First non-empty cell in an Unrecognized column.
    [[nodiscard]] std::string firstUnrecognized() const;
    // First non-empty cell of the row.
    [[nodiscard]] std::string firstNonEmpty() const;

    [[nodiscard]] bool blank() const;

private:
    const std::vector<std::string>& cells_;
    const HeaderLayout&             layout_;
};

// ─── Outputs ──────────────────────────────────────────────────────────────────

struct SkippedRow {
    uint32_t    page{0};
    uint32_t    row{0};            // row index inside the candidate grid
    std::string section_label;
    std::string reason;            // "missing-name", "unparseable-range"
    std::string detail;
};

struct DictionaryRow {
    std::optional<uint32_t> category_id;
    std::optional<uint32_t> sub_category_id;
    std::optional<uint32_t> item_id;
    DictionaryLevel         level{DictionaryLevel::Category};
    std::string             name;
    std::string             description;
    uint32_t                page{0};
    uint32_t                row{0};
};

struct NormalizedTable {
    uint32_t                    page{0};
    uint32_t                    region_index{0};
    double                      table_score{0.0};
    std::vector<FieldRecord>    fields;
    std::vector<DictionaryRow>  dictionary_rows;
    std::vector<EnumDefinition> enums;
    std::vector<SkippedRow>     skipped;
};

// Parses "Word 2", "Extension Word (70 bits)", "Initial Word" marker text.
[[nodiscard]] std::optional<SegmentMarker> parseSegmentMarker(std::string_view text);

// Extracts "0 = No Statement, 1 = Friend" style code/label pairs.
[[nodiscard]] std::vector<EnumValue> parseEnumValues(std::string_view description);

class FieldNormalizer {
public:
    explicit FieldNormalizer(const PipelineConfig& cfg);
    FieldNormalizer(PipelineConfig&&) = delete; // keeps a reference to the configuration

    // Normalizes every data row of `table`. Message and dictionary sections
    // are supported; other kinds throw ContractError.
    [[nodiscard]] NormalizedTable normalize(const SelectedTable& table, const Section& section) const;

private:
    const PipelineConfig& cfg_;
    UnitTable             units_;

    void normalizeMessageRows(const SelectedTable& table, const Section& section,
                              NormalizedTable& out) const;
    void normalizeDictionaryRows(const SelectedTable& table, const Section& section,
                                 NormalizedTable& out) const;

    // Unit from the unit cell, else from a unit word in the description.
    void resolveUnit(const std::string& cell, const std::string& description,
                     FieldRecord& rec) const;
};

} // namespace simforge
