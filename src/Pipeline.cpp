// Pipeline.cpp – Stage scheduling, per-page timeouts, cancellation and report
// assembly.

#include "SIMForge/Pipeline.hpp"
#include "SIMForge/Errors.hpp"
#include "SIMForge/Log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <optional>
#include <set>

namespace simforge {

using Clock = std::chrono::steady_clock;

// Upper bound on one wait before the run stop token is polled again.
constexpr auto kPollInterval = std::chrono::milliseconds(10);

// Extraction state shared by all regions of one page.
struct PageWork {
    std::stop_source       stop;
    std::atomic<Clock::rep> started{0}; // first region task start, 0 = not yet
    // Set by the collector on its first wait for the page; never moved.
    std::optional<Clock::time_point> deadline;
    bool                   timed_out{false};
};

static CoverageGap timeoutGap(const PageRegion& region, std::chrono::milliseconds timeout) {
    return CoverageGap{region, GapReason::TimedOut,
                       "page extraction exceeded " + std::to_string(timeout.count()) + " ms"};
}

struct Pipeline::PendingRegions {
    std::vector<PageRegion>                      regions;
    std::vector<std::shared_ptr<PageWork>>       work;    // per region
    std::vector<std::future<ArbitrationResult>>  futures; // per region

    void cancel() {
        for (auto& w : work) w->stop.request_stop();
    }
};

// ─────────────────────────────────────────────────────────────────────────────
//  Construction
// ─────────────────────────────────────────────────────────────────────────────

Pipeline::Pipeline(PipelineConfig cfg, std::shared_ptr<TableExtractor> method_a,
                   std::shared_ptr<TableExtractor> method_b)
    : cfg_(std::move(cfg)),
      method_a_(std::move(method_a)),
      method_b_(std::move(method_b)),
      arbiter_(cfg_),
      classifier_(cfg_),
      normalizer_(cfg_),
      builder_(cfg_),
      validator_(cfg_.validation),
      pool_(cfg_.worker_threads) {
    if (!method_a_ || !method_b_)
        throw ContractError("Pipeline requires two table extractors");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Arbitration stage
// ─────────────────────────────────────────────────────────────────────────────

std::optional<TableCandidate>
Pipeline::extractWith(TableExtractor& extractor, ExtractionMethod method, const PageRegion& region,
                      std::stop_token stop, std::string& failure) const {
    try {
        auto c = extractor.extract(region, stop);
        if (c) {
            c->method = method;
            c->region = region;
        }
        return c;
    } catch (const std::exception& e) {
        logger()->warn("page {} region {}: extractor {} failed: {}", region.page, region.index,
                       toString(method), e.what());
        if (!failure.empty()) failure += "; ";
        failure += std::string("method ") + toString(method) + ": " + e.what();
        return std::nullopt;
    }
}

Pipeline::PendingRegions Pipeline::submitRegions(const DocumentSource& source) {
    PendingRegions pending;
    std::map<uint32_t, std::shared_ptr<PageWork>> pages;

    for (const auto& region : source.regions) {
        auto& work = pages[region.page];
        if (!work) work = std::make_shared<PageWork>();

        auto a = method_a_;
        auto b = method_b_;
        pending.regions.push_back(region);
        pending.work.push_back(work);
        pending.futures.push_back(pool_.submit([this, region, work, a, b] {
            // Regions of a page already abandoned are never handed to the extractors.
            if (work->stop.stop_requested()) {
                ArbitrationResult r;
                r.gap = timeoutGap(region, cfg_.page_timeout);
                return r;
            }
            Clock::rep expected = 0;
            work->started.compare_exchange_strong(expected, Clock::now().time_since_epoch().count());

            std::string failure;
            auto ca = extractWith(*a, ExtractionMethod::A, region, work->stop.get_token(), failure);
            auto cb = extractWith(*b, ExtractionMethod::B, region, work->stop.get_token(), failure);
            // Anything the extractors returned after the page was stopped is partial.
            if (work->stop.stop_requested()) {
                ArbitrationResult r;
                r.gap = timeoutGap(region, cfg_.page_timeout);
                return r;
            }
            ArbitrationResult r = arbiter_.arbitrate(region, ca, cb);
            if (!ca && !cb && !failure.empty())
                r.gap = CoverageGap{region, GapReason::ExtractorFailed, failure};
            return r;
        }));
    }
    return pending;
}

std::vector<ArbitrationResult> Pipeline::collectRegions(PendingRegions& pending,
                                                        std::stop_token stop) {
    std::vector<ArbitrationResult> results(pending.futures.size());

    for (size_t i = 0; i < pending.futures.size(); ++i) {
        const PageRegion& region = pending.regions[i];
        PageWork&         work   = *pending.work[i];
        auto&             fut    = pending.futures[i];

        for (;;) {
            if (stop.stop_requested()) {
                pending.cancel();
                throw RunCancelled("run cancelled during table extraction");
            }

            auto wait = std::chrono::duration_cast<Clock::duration>(kPollInterval);
            if (!work.timed_out) {
                const auto now = Clock::now();
                // The page budget runs from its first task start or from the
                // collector's first wait, whichever came first, so a page stuck
                // behind busy workers still expires.
                if (!work.deadline) {
                    const Clock::rep started = work.started.load();
                    const auto base = started != 0 ? Clock::time_point(Clock::duration(started)) : now;
                    work.deadline = base + cfg_.page_timeout;
                }
                if (now >= *work.deadline) {
                    work.timed_out = true;
                    work.stop.request_stop();
                    logger()->warn("page {}: extraction exceeded {} ms", region.page,
                                   cfg_.page_timeout.count());
                } else {
                    wait = std::min(wait, *work.deadline - now);
                }
            }

            if (fut.wait_for(work.timed_out ? Clock::duration::zero() : wait) ==
                std::future_status::ready) {
                results[i] = fut.get();
                break;
            }
            if (work.timed_out) {
                results[i].gap = timeoutGap(region, cfg_.page_timeout);
                break;
            }
        }
    }
    return results;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Report helpers
// ─────────────────────────────────────────────────────────────────────────────

static std::string regionPath(const PageRegion& r) {
    return "pages[" + std::to_string(r.page) + "].regions[" + std::to_string(r.index) + "]";
}

// Consecutive pages that carry tables but belong to no section become
// synthetic message sections.
static std::vector<Section> unlabelledSections(const std::vector<Section>& sections,
                                               const std::set<uint32_t>& table_pages) {
    std::vector<Section> out;
    for (uint32_t page : table_pages) {
        if (sectionForPage(sections, page)) continue;
        if (!out.empty()) {
            Section& last = out.back();
            bool contiguous = true;
            for (uint32_t p = last.last_page + 1; p < page && contiguous; ++p)
                contiguous = !sectionForPage(sections, p);
            if (contiguous) {
                last.last_page = page;
                continue;
            }
        }
        Section s;
        s.kind       = SectionKind::Message;
        s.label      = "UNLABELLED-P" + std::to_string(page);
        s.first_page = page;
        s.last_page  = page;
        s.synthetic  = true;
        out.push_back(std::move(s));
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  run
// ─────────────────────────────────────────────────────────────────────────────

PipelineResult Pipeline::run(const DocumentSource& source, std::stop_token stop,
                             const SemanticModel* prior) {
    if (source.document.standard.empty())
        throw ContractError("Pipeline::run: document has no standard name");

    auto checkpoint = [&stop](const char* stage) {
        if (stop.stop_requested())
            throw RunCancelled(std::string("run cancelled before ") + stage);
    };
    checkpoint("extraction");

    const auto t0 = Clock::now();
    logger()->info("run {} edition {}: {} pages, {} regions", source.document.standard,
                   source.document.edition, source.pages.size(), source.regions.size());

    PipelineResult result;
    Diagnostics&   diag = result.diagnostics;
    diag.regions        = source.regions.size();

    // Arbitration runs on the pool while the classifier works on this thread.
    PendingRegions pending = submitRegions(source);
    std::vector<Section> sections;
    try {
        sections = classifier_.classify(source.pages, stop);
    } catch (...) {
        pending.cancel();
        throw;
    }
    std::vector<ArbitrationResult> arbitrated = collectRegions(pending, stop);

    std::vector<SelectedTable> selected;
    for (auto& r : arbitrated) {
        if (r.selected) {
            selected.push_back(std::move(*r.selected));
        } else if (r.gap) {
            logger()->warn("page {} region {}: coverage gap ({}): {}", r.gap->region.page,
                           r.gap->region.index, toString(r.gap->reason), r.gap->detail);
            diag.gaps.push_back(std::move(*r.gap));
        }
    }
    std::stable_sort(selected.begin(), selected.end(), [](const SelectedTable& x, const SelectedTable& y) {
        const auto& a = x.candidate.region;
        const auto& b = y.candidate.region;
        return a.page != b.page ? a.page < b.page : a.index < b.index;
    });
    diag.tables_selected = selected.size();

    // Tables outside every section.
    std::set<uint32_t> table_pages;
    for (const auto& t : selected) table_pages.insert(t.candidate.region.page);
    std::vector<Section> synthetic = unlabelledSections(sections, table_pages);
    if (!synthetic.empty()) {
        sections.insert(sections.end(), synthetic.begin(), synthetic.end());
        std::stable_sort(sections.begin(), sections.end(),
                         [](const Section& a, const Section& b) { return a.first_page < b.first_page; });
    }
    diag.sections = sections;

    // Normalization, one task per table of a message or dictionary section.
    struct Job {
        size_t                         section_index;
        std::future<NormalizedTable>   result;
    };
    std::vector<Job>           jobs;
    std::vector<PageRegion>    unmodelled;
    for (const auto& table : selected) {
        const size_t idx = *sectionForPage(sections, table.candidate.region.page);
        const SectionKind kind = sections[idx].kind;
        if (kind != SectionKind::Message && kind != SectionKind::Dictionary) {
            unmodelled.push_back(table.candidate.region);
            continue;
        }
        checkpoint("normalization");
        jobs.push_back({idx, pool_.submit([this, table, section = sections[idx]] {
                            return normalizer_.normalize(table, section);
                        })});
    }

    std::vector<SectionFields> inputs;
    for (size_t j = 0; j < jobs.size(); ++j) {
        if (stop.stop_requested())
            throw RunCancelled("run cancelled during normalization");
        NormalizedTable table = jobs[j].result.get();
        for (const auto& s : table.skipped) diag.skipped.push_back(s);
        if (inputs.empty() || inputs.back().section_index != jobs[j].section_index)
            inputs.push_back(SectionFields{jobs[j].section_index, {}});
        inputs.back().tables.push_back(std::move(table));
    }

    checkpoint("model assembly");
    result.model = builder_.build(source.document, sections, inputs);

    double confidence_sum = 0.0;
    for (const auto& m : result.model.messages)
        for (const auto& s : m.segments)
            for (const auto& f : s.fields) {
                ++diag.field_count;
                confidence_sum += f.confidence;
            }
    if (diag.field_count > 0)
        diag.mean_confidence = confidence_sum / static_cast<double>(diag.field_count);

    checkpoint("validation");
    result.issues = validator_.validate(result.model, prior);
    checkpoint("report");

    // Document-level findings the validator cannot see in the model.
    for (const auto& gap : diag.gaps) {
        result.issues.push_back({Severity::Warning, "coverage-gap", regionPath(gap.region),
                                 std::string("no usable table (") + toString(gap.reason) + "): " +
                                 gap.detail, std::nullopt});
    }
    for (const auto& row : diag.skipped) {
        result.issues.push_back({Severity::Warning, "row-skipped",
                                 "pages[" + std::to_string(row.page) + "].rows[" +
                                 std::to_string(row.row) + "]",
                                 row.section_label + ": " + row.reason + ": " + row.detail,
                                 std::nullopt});
    }
    for (const auto& s : synthetic) {
        std::string path = "sections[" + s.label + "]";
        for (size_t m = 0; m < result.model.messages.size(); ++m)
            if (result.model.messages[m].label == s.label) { path = messagePath(m); break; }
        result.issues.push_back({Severity::Warning, "unlabelled-section", path,
                                 "tables on pages " + std::to_string(s.first_page) + "-" +
                                 std::to_string(s.last_page) + " match no section heading",
                                 "add a section rule for the heading used on page " +
                                 std::to_string(s.first_page)});
    }
    for (const auto& region : unmodelled) {
        const auto& s = sections[*sectionForPage(sections, region.page)];
        result.issues.push_back({Severity::Info, "table-unmodelled", regionPath(region),
                                 "table in " + std::string(toString(s.kind)) + " section '" +
                                 s.label + "' is not modelled", std::nullopt});
    }
    if (diag.field_count == 0 && result.model.dictionary.empty()) {
        result.issues.push_back({Severity::Warning, "coverage-gap", "document",
                                 "no field data extracted from " + std::to_string(diag.regions) +
                                 " regions", std::nullopt});
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count();
    logger()->info("run complete in {} ms: {} fields, {} gaps, {} skipped rows, coverage {:.1f}%",
                   ms, diag.field_count, diag.gaps.size(), diag.skipped.size(),
                   diag.coverage() * 100.0);
    return result;
}

} // namespace simforge
