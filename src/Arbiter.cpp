// Arbiter.cpp – Header-role resolution, candidate scoring and selection.

#include "SIMForge/Arbiter.hpp"
#include "SIMForge/Log.hpp"
#include "SIMForge/Text.hpp"

#include <algorithm>
#include <map>

namespace simforge {

// ─────────────────────────────────────────────────────────────────────────────
//  MemoryExtractor
// ─────────────────────────────────────────────────────────────────────────────

MemoryExtractor::MemoryExtractor(ExtractionMethod method, std::string method_name)
    : method_(method), method_name_(std::move(method_name)) {}

void MemoryExtractor::add(uint32_t page, uint32_t region_index,
                          std::vector<std::vector<std::string>> rows) {
    tables_[{page, region_index}] = std::move(rows);
}

std::optional<TableCandidate> MemoryExtractor::extract(const PageRegion& region,
                                                       std::stop_token stop) {
    if (stop.stop_requested()) return std::nullopt;
    auto it = tables_.find({region.page, region.index});
    if (it == tables_.end()) return std::nullopt;

    TableCandidate c;
    c.method      = method_;
    c.method_name = method_name_;
    c.region      = region;
    c.rows        = it->second;
    return c;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Header layout
// ─────────────────────────────────────────────────────────────────────────────

std::optional<size_t> HeaderLayout::column(ColumnRole role) const noexcept {
    for (size_t i = 0; i < roles.size(); ++i)
        if (roles[i] == role) return i;
    return std::nullopt;
}

ColumnRole classifyHeaderCell(std::string_view cell, const std::vector<HeaderKeyword>& vocabulary) {
    const std::string text = toLower(cleanText(cell));
    if (text.empty()) return ColumnRole::Unrecognized;

    ColumnRole best     = ColumnRole::Unrecognized;
    size_t     best_len = 0;
    for (const auto& kw : vocabulary) {
        const std::string& k = kw.keyword;
        if (k.size() <= best_len || text.compare(0, k.size(), k) != 0) continue;
        const bool whole = text.size() == k.size() ||
                           text[k.size()] == ' ' || text[k.size()] == '(';
        if (!whole) continue;
        best     = kw.role;
        best_len = k.size();
    }
    return best;
}

HeaderLayout resolveHeader(const std::vector<std::vector<std::string>>& rows,
                           const std::vector<HeaderKeyword>& vocabulary,
                           uint32_t scan_rows) {
    HeaderLayout best;
    const size_t limit = std::min<size_t>(rows.size(), std::max<uint32_t>(scan_rows, 1));

    for (size_t r = 0; r < limit; ++r) {
        HeaderLayout cand;
        cand.header_row = r;
        for (const auto& cell : rows[r]) {
            ColumnRole role = classifyHeaderCell(cell, vocabulary);
            if (role != ColumnRole::Unrecognized) {
                if (cand.has(role)) {
                    role = ColumnRole::Unrecognized;
                } else {
                    ++cand.matched_cells;
                }
            }
            cand.roles.push_back(role);
        }
        if (r == 0 || cand.matched_cells > best.matched_cells)
            best = std::move(cand);
    }
    return best;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Gap reasons
// ─────────────────────────────────────────────────────────────────────────────

const char* toString(GapReason r) noexcept {
    switch (r) {
    case GapReason::NoCandidates:    return "no-candidates";
    case GapReason::BelowThreshold:  return "below-threshold";
    case GapReason::TimedOut:        return "timed-out";
    case GapReason::ExtractorFailed: return "extractor-failed";
    }
    return "no-candidates";
}

// ─────────────────────────────────────────────────────────────────────────────
//  Scoring
// ─────────────────────────────────────────────────────────────────────────────

static bool rowIsBlank(const std::vector<std::string>& row) {
    return std::all_of(row.begin(), row.end(),
                       [](const std::string& c) { return cleanText(c).empty(); });
}

ScoreBreakdown ExtractionArbiter::score(const TableCandidate& c) const {
    return score(c, resolveHeader(c.rows, cfg_.header_vocabulary, cfg_.header_scan_rows));
}

ScoreBreakdown ExtractionArbiter::score(const TableCandidate& c, const HeaderLayout& layout) const {
    ScoreBreakdown s;
    for (const auto& row : c.rows)
        for (const auto& cell : row)
            if (!cleanText(cell).empty()) ++s.non_empty_cells;

    // A table needs a header and at least one data row to be scored at all.
    if (c.rows.size() < 2) return s;

    // (i) header keyword match ratio
    const size_t header_cells = layout.roles.size();
    s.header_match = header_cells == 0 ? 0.0
                   : static_cast<double>(layout.matched_cells) / static_cast<double>(header_cells);

    // (ii) column-count consistency against the modal count
    std::map<size_t, size_t> widths;
    for (const auto& row : c.rows) ++widths[row.size()];
    size_t modal = 0;
    for (const auto& [width, count] : widths) modal = std::max(modal, count);
    s.column_consistency = static_cast<double>(modal) / static_cast<double>(c.rows.size());

    // (iii) bit-range parse ratio over the designated column
    std::optional<size_t> bit_col = layout.column(ColumnRole::BitRange);
    if (!bit_col) bit_col = layout.column(ColumnRole::StartBit);
    if (bit_col) {
        size_t data_rows = 0, parsed = 0;
        for (size_t r = layout.header_row + 1; r < c.rows.size(); ++r) {
            const auto& row = c.rows[r];
            if (rowIsBlank(row)) continue;
            ++data_rows;
            if (*bit_col < row.size() && parseBitRange(row[*bit_col])) ++parsed;
        }
        if (data_rows > 0)
            s.bit_parse = static_cast<double>(parsed) / static_cast<double>(data_rows);
    }

    const auto& w   = cfg_.weights;
    const double ws = w.header_match + w.column_consistency + w.bit_parse;
    if (ws > 0.0) {
        s.total = (w.header_match * s.header_match +
                   w.column_consistency * s.column_consistency +
                   w.bit_parse * s.bit_parse) / ws;
    }
    return s;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Selection
// ─────────────────────────────────────────────────────────────────────────────

bool ExtractionArbiter::winsTie(const TableCandidate& a, const ScoreBreakdown& sa,
                                const TableCandidate& b, const ScoreBreakdown& sb) const {
    switch (cfg_.tie_break) {
    case TieBreak::PreferA: return a.method == ExtractionMethod::A;
    case TieBreak::PreferB: return a.method == ExtractionMethod::B;
    case TieBreak::CellDensity:
        if (sa.non_empty_cells != sb.non_empty_cells)
            return sa.non_empty_cells > sb.non_empty_cells;
        return a.method == ExtractionMethod::A || b.method != ExtractionMethod::A;
    }
    return true;
}

ArbitrationResult ExtractionArbiter::arbitrate(const PageRegion& region,
                                               const std::optional<TableCandidate>& a,
                                               const std::optional<TableCandidate>& b) const {
    ArbitrationResult out;

    if (!a && !b) {
        out.gap = CoverageGap{region, GapReason::NoCandidates, "no extractor found a table"};
        return out;
    }

    HeaderLayout la, lb;
    if (a) {
        la          = resolveHeader(a->rows, cfg_.header_vocabulary, cfg_.header_scan_rows);
        out.score_a = score(*a, la);
    }
    if (b) {
        lb          = resolveHeader(b->rows, cfg_.header_vocabulary, cfg_.header_scan_rows);
        out.score_b = score(*b, lb);
    }

    const bool usable_a = a && out.score_a.total >= cfg_.min_table_score;
    const bool usable_b = b && out.score_b.total >= cfg_.min_table_score;

    if (!usable_a && !usable_b) {
        const double best = std::max(a ? out.score_a.total : 0.0, b ? out.score_b.total : 0.0);
        out.gap = CoverageGap{region, GapReason::BelowThreshold,
                              "best score " + std::to_string(best) + " below threshold " +
                              std::to_string(cfg_.min_table_score)};
        logger()->debug("page {} region {}: no usable table ({})", region.page, region.index,
                        out.gap->detail);
        return out;
    }

    bool pick_a = false;
    if (usable_a && usable_b) {
        if (out.score_a.total != out.score_b.total)
            pick_a = out.score_a.total > out.score_b.total;
        else
            pick_a = winsTie(*a, out.score_a, *b, out.score_b);
    } else {
        pick_a = usable_a;
    }

    if (pick_a) out.selected = SelectedTable{*a, std::move(la), out.score_a};
    else        out.selected = SelectedTable{*b, std::move(lb), out.score_b};

    logger()->debug("page {} region {}: selected method {} ({}) score {:.3f} vs {:.3f}",
                    region.page, region.index, toString(out.selected->candidate.method),
                    out.selected->candidate.method_name, out.score_a.total, out.score_b.total);
    return out;
}

} // namespace simforge
