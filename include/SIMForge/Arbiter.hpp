#pragma once
// Arbiter.hpp – Chooses one of two independent table extractions per region.
//
// Usage example:
//   ExtractionArbiter arbiter{cfg};
//   ArbitrationResult r = arbiter.arbitrate(region, candidate_a, candidate_b);
//   if (r.selected) use(r.selected->candidate);
//   else            record(r.gap);
//
// Selection is a pure function of the two candidates: the arbiter never merges
// partial extractions.

#include "Config.hpp"
#include "Types.hpp"

#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace simforge {

// ─────────────────────────────────────────────────────────────────────────────
//  Extractor interface (implemented by the external extraction collaborator)
// ─────────────────────────────────────────────────────────────────────────────
class TableExtractor {
public:
    virtual ~TableExtractor() = default;

    // Returns the table found in the region, or nullopt when there is none.
    // Long-running implementations should poll `stop` and return early.
    [[nodiscard]] virtual std::optional<TableCandidate>
    extract(const PageRegion& region, std::stop_token stop) = 0;
};

// Serves candidates that were produced ahead of time, keyed by
// (page, region index). Stamps the configured method on every candidate.
class MemoryExtractor final : public TableExtractor {
public:
    MemoryExtractor(ExtractionMethod method, std::string method_name);

    void add(uint32_t page, uint32_t region_index, std::vector<std::vector<std::string>> rows);

    [[nodiscard]] std::optional<TableCandidate>
    extract(const PageRegion& region, std::stop_token stop) override;

private:
    ExtractionMethod method_;
    std::string      method_name_;
    std::map<std::pair<uint32_t, uint32_t>, std::vector<std::vector<std::string>>> tables_;
};

// ─────────────────────────────────────────────────────────────────────────────
//  Header layout
// ─────────────────────────────────────────────────────────────────────────────
// Column roles are resolved once per table; rows are then read through
// column indices instead of repeated header-text lookups.
struct HeaderLayout {
    size_t                  header_row{0};
    std::vector<ColumnRole> roles;          // one per header cell
    size_t                  matched_cells{0};

    [[nodiscard]] std::optional<size_t> column(ColumnRole role) const noexcept;
    [[nodiscard]] bool has(ColumnRole role) const noexcept { return column(role).has_value(); }
};

// Role of a single header cell, or Unrecognized. The longest keyword that the
// cleaned cell equals, or starts with followed by ' ' or '(', wins.
[[nodiscard]] ColumnRole classifyHeaderCell(std::string_view cell,
                                            const std::vector<HeaderKeyword>& vocabulary);

// Picks the header row among the first `scan_rows` rows (most matched cells,
// earliest on ties) and assigns roles. Duplicate roles after the first column
// become Unrecognized.
[[nodiscard]] HeaderLayout resolveHeader(const std::vector<std::vector<std::string>>& rows,
                                         const std::vector<HeaderKeyword>& vocabulary,
                                         uint32_t scan_rows);

// ─────────────────────────────────────────────────────────────────────────────
//  Scoring
// ─────────────────────────────────────────────────────────────────────────────
struct ScoreBreakdown {
    double header_match{0.0};       // matched header cells / header cells
    double column_consistency{0.0}; // rows with the modal cell count / rows
    double bit_parse{0.0};          // data rows whose bit cell parses / data rows
    double total{0.0};              // weighted, normalized to [0, 1]
    size_t non_empty_cells{0};
};

struct SelectedTable {
    TableCandidate candidate;
    HeaderLayout   layout;
    ScoreBreakdown score;
};

enum class GapReason { NoCandidates, BelowThreshold, TimedOut, ExtractorFailed };

const char* toString(GapReason r) noexcept;

struct CoverageGap {
    PageRegion  region;
    GapReason   reason{GapReason::NoCandidates};
    std::string detail;
};

struct ArbitrationResult {
    std::optional<SelectedTable> selected;
    std::optional<CoverageGap>   gap;      // set iff selected is empty
    ScoreBreakdown               score_a;
    ScoreBreakdown               score_b;
};

class ExtractionArbiter {
public:
    explicit ExtractionArbiter(const PipelineConfig& cfg) : cfg_(cfg) {}
    ExtractionArbiter(PipelineConfig&&) = delete; // keeps a reference to the configuration

    [[nodiscard]] ScoreBreakdown score(const TableCandidate& c, const HeaderLayout& layout) const;
    [[nodiscard]] ScoreBreakdown score(const TableCandidate& c) const;

    // `region` identifies the gap when neither candidate is usable.
    [[nodiscard]] ArbitrationResult arbitrate(const PageRegion& region,
                                              const std::optional<TableCandidate>& a,
                                              const std::optional<TableCandidate>& b) const;

private:
    const PipelineConfig& cfg_;

    // True when `a` beats `b` on an exact score tie.
    [[nodiscard]] bool winsTie(const TableCandidate& a, const ScoreBreakdown& sa,
                               const TableCandidate& b, const ScoreBreakdown& sb) const;
};

} // namespace simforge
