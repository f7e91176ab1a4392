#pragma once
// Text.hpp – Cell text cleaning and the bit-range grammar.
//
// Accepted range forms (after cleaning, case-insensitive):
//   "6-15"   "6–15"   "6..15"   "6 to 15"   "bits 6-15"   "7"
// Full-width digits and punctuation ("６－１５") are folded to ASCII first.

#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace simforge {

// Folds width/dash/ligature variants to ASCII, strips control and zero-width
// characters, collapses whitespace and trims. Malformed UTF-8 bytes are dropped.
[[nodiscard]] std::string cleanText(std::string_view raw);

[[nodiscard]] std::string toLower(std::string_view s);
[[nodiscard]] std::string trim(std::string_view s);

// Splits on ASCII whitespace; empty tokens are never returned.
[[nodiscard]] std::vector<std::string> splitWords(std::string_view s);

// True when `word` occurs in `text` delimited by non-alphanumerics.
// Both arguments are expected in the same case.
[[nodiscard]] bool containsWord(std::string_view text, std::string_view word);

// Whole-string unsigned decimal; rejects signs, blanks and overflow past int32.
[[nodiscard]] std::optional<uint32_t> parseUnsigned(std::string_view s);

// Leading indentation of an uncleaned cell (tab = 4 columns).
[[nodiscard]] uint32_t leadingIndent(std::string_view raw) noexcept;

struct ParsedRange {
    BitRange range;
    bool     exact{true}; // false: recovered by the fallback or swapped
};

[[nodiscard]] std::optional<ParsedRange> parseBitRange(std::string_view cell);

// "S-E", or "S" for one-unit ranges. parseBitRange(formatBitRange(r)) == r.
[[nodiscard]] std::string formatBitRange(const BitRange& r);

} // namespace simforge
