// SectionClassifier.cpp – Heading rules and page-span assembly.

#include "SIMForge/SectionClassifier.hpp"
#include "SIMForge/Errors.hpp"
#include "SIMForge/Log.hpp"
#include "SIMForge/Text.hpp"

#include <cctype>

namespace simforge {

SectionClassifier::SectionClassifier(const PipelineConfig& cfg) : cfg_(cfg) {
    rules_.reserve(cfg.section_rules.size());
    for (const auto& rule : cfg.section_rules) {
        try {
            rules_.push_back({rule, std::regex(rule.pattern, std::regex::ECMAScript | std::regex::icase)});
        } catch (const std::regex_error& e) {
            throw ContractError("Section rule '" + rule.pattern + "' does not compile: " + e.what());
        }
    }
}

bool SectionClassifier::isContinuation(std::string_view lower_line) const {
    for (const auto& marker : cfg_.continuation_markers)
        if (containsWord(lower_line, marker)) return true;
    return false;
}

// Removes "(continued)"-style markers and leading separators from a title.
static std::string tidyTitle(std::string title, const std::vector<std::string>& markers) {
    for (const auto& marker : markers) {
        const std::string lower = toLower(title);
        const size_t pos = lower.find(marker);
        if (pos == std::string::npos) continue;
        size_t begin = pos, end = pos + marker.size();
        if (begin > 0 && title[begin - 1] == '(') --begin;
        if (end < title.size() && title[end] == ')') ++end;
        title.erase(begin, end - begin);
    }
    size_t b = 0;
    while (b < title.size() && (title[b] == ':' || title[b] == '-' || title[b] == '.' || title[b] == ' '))
        ++b;
    return trim(std::string_view(title).substr(b));
}

std::optional<HeadingMatch> SectionClassifier::matchHeading(std::string_view line) const {
    const std::string clean = cleanText(line);
    if (clean.empty()) return std::nullopt;
    const bool continued = isContinuation(toLower(clean));

    for (const auto& cr : rules_) {
        std::smatch m;
        if (!std::regex_search(clean, m, cr.re)) continue;
        if (cr.rule.label_group >= m.size() || !m[cr.rule.label_group].matched) continue;

        HeadingMatch hm;
        hm.kind = cr.rule.kind;
        hm.label = cr.rule.label_prefix;
        for (char ch : m[cr.rule.label_group].str())
            if (!std::isspace(static_cast<unsigned char>(ch))) hm.label += ch;
        hm.title        = tidyTitle(m.suffix().str(), cfg_.continuation_markers);
        hm.continuation = continued;
        return hm;
    }

    if (continued) {
        HeadingMatch hm;
        hm.continuation = true;
        return hm;
    }
    return std::nullopt;
}

std::optional<HeadingMatch> SectionClassifier::matchPage(const PageText& page) const {
    if (!cleanText(page.heading).empty())
        return matchHeading(page.heading);

    // No explicit heading: scan the first few non-empty body lines.
    uint32_t scanned = 0;
    size_t   pos     = 0;
    while (pos <= page.body.size() && scanned < cfg_.heading_scan_lines) {
        size_t nl = page.body.find('\n', pos);
        if (nl == std::string::npos) nl = page.body.size();
        std::string_view line(page.body.data() + pos, nl - pos);
        pos = nl + 1;
        if (cleanText(line).empty()) continue;
        ++scanned;
        if (auto m = matchHeading(line)) return m;
    }
    return std::nullopt;
}

std::vector<Section> SectionClassifier::classify(const std::vector<PageText>& pages,
                                                 std::stop_token stop) const {
    std::vector<Section> sections;
    uint32_t previous_page = 0;

    for (const auto& page : pages) {
        if (stop.stop_requested())
            throw RunCancelled("section classification cancelled");
        if (page.page <= previous_page)
            throw ContractError("pages must be ordered by strictly increasing page number (page " +
                                std::to_string(page.page) + " after " +
                                std::to_string(previous_page) + ")");
        previous_page = page.page;

        auto m = matchPage(page);
        if (!m) {
            if (!sections.empty()) sections.back().last_page = page.page;
            continue;
        }

        if (!sections.empty()) {
            Section& cur = sections.back();
            const bool same_label = m->label == cur.label && m->kind == cur.kind;
            if (same_label || (m->continuation && m->label.empty())) {
                cur.last_page = page.page;
                continue;
            }
            if (m->continuation)
                logger()->debug("page {}: continued heading '{}' differs from open section '{}'; "
                                "starting a new section", page.page, m->label, cur.label);
        }

        if (m->label.empty()) continue; // bare "continued" before any section

        Section s;
        s.kind       = m->kind;
        s.label      = m->label;
        s.title      = m->title;
        s.first_page = page.page;
        s.last_page  = page.page;
        sections.push_back(std::move(s));
    }

    logger()->info("classified {} pages into {} sections", pages.size(), sections.size());
    return sections;
}

std::optional<size_t> sectionForPage(const std::vector<Section>& sections, uint32_t page) noexcept {
    for (size_t i = 0; i < sections.size(); ++i)
        if (page >= sections[i].first_page && page <= sections[i].last_page) return i;
    return std::nullopt;
}

} // namespace simforge
