#pragma once
// Pipeline.hpp – build(document) entry point: arbitration, classification,
// normalization, model assembly and validation for one document.
//
// Usage example:
//   auto a = std::make_shared<MemoryExtractor>(ExtractionMethod::A, "lattice");
//   auto b = std::make_shared<MemoryExtractor>(ExtractionMethod::B, "stream");
//   Pipeline pipeline{defaultConfig(), a, b};
//   PipelineResult r = pipeline.run(source);
//   for (const auto& issue : r.issues) ...
//
// One Pipeline serves any number of sequential runs. Independent documents
// may use separate Pipeline instances concurrently.

#include "Arbiter.hpp"
#include "Config.hpp"
#include "FieldNormalizer.hpp"
#include "ModelBuilder.hpp"
#include "SectionClassifier.hpp"
#include "Types.hpp"
#include "Validator.hpp"
#include "WorkerPool.hpp"

#include <memory>
#include <stop_token>
#include <vector>

namespace simforge {

// Run statistics that are not part of the model.
struct Diagnostics {
    size_t                   regions{0};
    size_t                   tables_selected{0};
    std::vector<Section>     sections;       // including synthetic ones
    std::vector<CoverageGap> gaps;
    std::vector<SkippedRow>  skipped;
    size_t                   field_count{0};
    double                   mean_confidence{0.0};

    // Fraction of regions that produced a usable table (1.0 for no regions).
    [[nodiscard]] double coverage() const noexcept {
        return regions == 0 ? 1.0
                            : static_cast<double>(tables_selected) / static_cast<double>(regions);
    }
};

struct PipelineResult {
    SemanticModel                model;
    std::vector<ValidationIssue> issues;
    Diagnostics                  diagnostics;
};

class Pipeline {
public:
    // Throws ContractError when either extractor is null.
    Pipeline(PipelineConfig cfg, std::shared_ptr<TableExtractor> method_a,
             std::shared_ptr<TableExtractor> method_b);

    Pipeline(const Pipeline&)            = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Produces a complete model plus its report, or throws RunCancelled when
    // `stop` is requested before the run completes. `prior` enables the
    // cross-edition diff.
    [[nodiscard]] PipelineResult run(const DocumentSource& source, std::stop_token stop = {},
                                     const SemanticModel* prior = nullptr);

    [[nodiscard]] const PipelineConfig& config() const noexcept { return cfg_; }

private:
    PipelineConfig                  cfg_;
    std::shared_ptr<TableExtractor> method_a_;
    std::shared_ptr<TableExtractor> method_b_;
    ExtractionArbiter               arbiter_;
    SectionClassifier               classifier_;
    FieldNormalizer                 normalizer_;
    ModelBuilder                    builder_;
    Validator                       validator_;
    // Queued tasks reference the stages above; the pool must be destroyed first.
    WorkerPool                      pool_;

    struct PendingRegions;

    [[nodiscard]] PendingRegions submitRegions(const DocumentSource& source);
    [[nodiscard]] std::vector<ArbitrationResult> collectRegions(PendingRegions& pending,
                                                                std::stop_token stop);

    [[nodiscard]] std::optional<TableCandidate>
    extractWith(TableExtractor& extractor, ExtractionMethod method, const PageRegion& region,
                std::stop_token stop, std::string& failure) const;
};

} // namespace simforge
