// test_sections.cpp – Heading rules, continuation handling and page spans.

#include "SIMForge/Config.hpp"
#include "SIMForge/Errors.hpp"
#include "SIMForge/SectionClassifier.hpp"

#include <iostream>
#include <random>
#include <string>
#include <vector>

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

static PageText page(uint32_t n, std::string heading, std::string body = {}) {
    return PageText{n, std::move(heading), std::move(body)};
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: single headings
// ─────────────────────────────────────────────────────────────────────────────
static void testHeadings(const SectionClassifier& sc) {
    std::cout << "\n=== Test: Heading rules ===\n";

    auto j = sc.matchHeading("J3.2 Air Track Message");
    CHECK(j && j->kind == SectionKind::Message && j->label == "J3.2", "J3.2 → message");
    CHECK(j && j->title == "Air Track Message", "title after label");

    auto spaced = sc.matchHeading("J 2.2I Indirect PPLI");
    CHECK(spaced && spaced->label == "J2.2I", "spaces removed from label");

    auto dfi = sc.matchHeading("DFI 281 Track Number");
    CHECK(dfi && dfi->kind == SectionKind::Dictionary && dfi->label == "DFI 281",
          "DFI heading → dictionary, not message");

    auto app = sc.matchHeading("Appendix B Abbreviations");
    CHECK(app && app->kind == SectionKind::Appendix && app->label == "Appendix B", "appendix");

    auto other = sc.matchHeading("Section 4.1 General");
    CHECK(other && other->kind == SectionKind::Other && other->label == "Section 4.1", "numbered section");

    auto cont = sc.matchHeading("J3.2 Air Track (continued)");
    CHECK(cont && cont->label == "J3.2" && cont->continuation, "continued heading keeps label");
    CHECK(cont && cont->title == "Air Track", "continuation marker removed from title");

    auto bare = sc.matchHeading("(Continued)");
    CHECK(bare && bare->label.empty() && bare->continuation, "bare continuation");

    CHECK(!sc.matchHeading("Table of Contents"), "plain text matches nothing");
    CHECK(!sc.matchHeading(""), "empty heading matches nothing");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: page spans
// ─────────────────────────────────────────────────────────────────────────────
static void testSpans(const SectionClassifier& sc) {
    std::cout << "\n=== Test: Page spans ===\n";
    std::vector<PageText> pages = {
        page(1, "Foreword"),
        page(2, "J3.2 Air Track"),
        page(3, ""),                              // no heading: extends J3.2
        page(4, "J3.2 Air Track (continued)"),    // continuation folds
        page(5, "J3.2 Air Track"),                // same label extends
        page(6, "", "\n\nJ3.3 Surface Track\nbody text"),
        page(7, "DFI 281 Track Number"),
        page(8, "Continued"),
        page(9, "Appendix A Notes"),
    };
    auto sections = sc.classify(pages);

    CHECK(sections.size() == 4, "four sections");
    if (sections.size() == 4) {
        CHECK(sections[0].label == "J3.2" && sections[0].first_page == 2 && sections[0].last_page == 5,
              "J3.2 spans 2-5");
        CHECK(sections[1].label == "J3.3" && sections[1].first_page == 6 && sections[1].last_page == 6,
              "heading found in body lines");
        CHECK(sections[2].kind == SectionKind::Dictionary && sections[2].last_page == 8,
              "bare continuation extends dictionary section");
        CHECK(sections[3].kind == SectionKind::Appendix && sections[3].last_page == 9, "appendix to end");
    }
    CHECK(!sectionForPage(sections, 1), "page before first match unassigned");
    CHECK(sectionForPage(sections, 3) == 0u, "page 3 in J3.2");
    CHECK(sectionForPage(sections, 8) == 2u, "page 8 in DFI 281");
}

static void testContinuedDifferentLabel(const SectionClassifier& sc) {
    std::cout << "\n=== Test: Continued heading with another label ===\n";
    auto sections = sc.classify({
        page(1, "J3.2 Air Track"),
        page(2, "J3.3 Surface Track (continued)"),
        page(3, "J3.2 Air Track"),
    });
    CHECK(sections.size() == 3, "different label starts a new section even when continued");
    if (sections.size() == 3)
        CHECK(sections[2].label == "J3.2" && sections[2].first_page == 3,
              "non-adjacent reuse of a label is its own section");

    auto leading = sc.classify({page(1, "(continued)"), page(2, "J7.0 Track Management")});
    CHECK(leading.size() == 1 && leading[0].first_page == 2, "leading bare continuation unassigned");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: disjointness over random heading sequences
// ─────────────────────────────────────────────────────────────────────────────
static void testDisjointProperty(const SectionClassifier& sc) {
    std::cout << "\n=== Test: Sections are disjoint ===\n";
    const std::vector<std::string> headings = {
        "", "", "J3.2 Air Track", "J3.3 Surface Track", "(continued)", "DFI 281 Track",
        "J3.2 Air Track (cont'd)", "Appendix C", "Index", "Section 2 Scope",
    };
    std::mt19937 rng(6016);
    bool ok = true;
    for (int round = 0; round < 200 && ok; ++round) {
        std::vector<PageText> pages;
        const uint32_t n = 1 + rng() % 40;
        for (uint32_t p = 1; p <= n; ++p)
            pages.push_back(page(p, headings[rng() % headings.size()]));
        auto sections = sc.classify(pages);
        for (size_t i = 0; i < sections.size() && ok; ++i) {
            ok = sections[i].first_page <= sections[i].last_page && sections[i].last_page <= n;
            if (i > 0) ok = ok && sections[i - 1].last_page < sections[i].first_page;
        }
    }
    CHECK(ok, "200 random documents yield ordered, disjoint sections");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: contract violations and cancellation
// ─────────────────────────────────────────────────────────────────────────────
static void testErrors(const SectionClassifier& sc) {
    std::cout << "\n=== Test: Errors ===\n";
    bool threw = false;
    try {
        (void)sc.classify({page(2, "J3.2"), page(1, "J3.3")});
    } catch (const ContractError&) {
        threw = true;
    }
    CHECK(threw, "unordered pages → ContractError");

    std::stop_source stop;
    stop.request_stop();
    threw = false;
    try {
        (void)sc.classify({page(1, "J3.2")}, stop.get_token());
    } catch (const RunCancelled&) {
        threw = true;
    }
    CHECK(threw, "stop requested → RunCancelled");

    PipelineConfig bad = defaultConfig();
    bad.section_rules.push_back({SectionKind::Other, "([", 1, ""});
    threw = false;
    try {
        SectionClassifier broken(bad);
    } catch (const ContractError&) {
        threw = true;
    }
    CHECK(threw, "invalid rule pattern → ContractError");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    const PipelineConfig cfg = defaultConfig();
    const SectionClassifier sc(cfg);

    testHeadings(sc);
    testSpans(sc);
    testContinuedDifferentLabel(sc);
    testDisjointProperty(sc);
    testErrors(sc);

    std::cout << '\n' << (failures == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << " (" << failures << " failure(s))\n";
    return failures == 0 ? 0 : 1;
}
