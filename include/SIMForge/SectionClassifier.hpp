#pragma once
// SectionClassifier.hpp – Partitions document pages into labelled sections.
//
// Rules are tried in configuration order against each page heading; the
// first match wins. A section runs from its first page to the page before the
// next section start. Pages before the first match stay unassigned.

#include "Config.hpp"
#include "Types.hpp"

#include <optional>
#include <regex>
#include <stop_token>
#include <string>
#include <vector>

namespace simforge {

// Outcome of matching one page heading.
struct HeadingMatch {
    SectionKind kind{SectionKind::Other};
    std::string label;
    std::string title;
    bool        continuation{false};
};

class SectionClassifier {
public:
    // Compiles the configured rules; throws ContractError on an invalid pattern.
    explicit SectionClassifier(const PipelineConfig& cfg);
    SectionClassifier(PipelineConfig&&) = delete; // keeps a reference to the configuration

    // Classifies one heading line. A bare continuation heading ("(continued)")
    // yields a match with an empty label and `continuation` set.
    [[nodiscard]] std::optional<HeadingMatch> matchHeading(std::string_view line) const;

    // `pages` must be ordered by page number. Checks `stop` between pages and
    // throws RunCancelled when it is requested.
    [[nodiscard]] std::vector<Section> classify(const std::vector<PageText>& pages,
                                                std::stop_token stop = {}) const;

private:
    struct CompiledRule {
        SectionRule rule;
        std::regex  re;
    };

    const PipelineConfig&     cfg_;
    std::vector<CompiledRule> rules_;

    [[nodiscard]] bool isContinuation(std::string_view lower_line) const;
    [[nodiscard]] std::optional<HeadingMatch> matchPage(const PageText& page) const;
};

// Index of the section containing `page`, if any.
[[nodiscard]] std::optional<size_t> sectionForPage(const std::vector<Section>& sections,
                                                   uint32_t page) noexcept;

} // namespace simforge
