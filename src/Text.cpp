// Text.cpp – UTF-8 cell cleaning and bit-range parsing.

#include "SIMForge/Text.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <utility>

namespace simforge {

// ─── UTF-8 helpers ────────────────────────────────────────────────────────────

// Decodes the code point at s[i] and advances i past it. On a malformed
// sequence i advances by one byte and false is returned.
static bool decodeUtf8(std::string_view s, size_t& i, char32_t& cp) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    if (b0 < 0x80)                { cp = b0;          len = 1; }
    else if ((b0 & 0xE0u) == 0xC0) { cp = b0 & 0x1Fu; len = 2; }
    else if ((b0 & 0xF0u) == 0xE0) { cp = b0 & 0x0Fu; len = 3; }
    else if ((b0 & 0xF8u) == 0xF0) { cp = b0 & 0x07u; len = 4; }
    else { ++i; return false; }

    if (i + len > s.size()) { ++i; return false; }
    for (size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0u) != 0x80) { ++i; return false; }
        cp = (cp << 6) | (b & 0x3Fu);
    }
    // Reject overlong forms and surrogates.
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++i;
        return false;
    }
    i += len;
    return true;
}

static void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

static bool isDashVariant(char32_t cp) noexcept {
    return (cp >= 0x2010 && cp <= 0x2015) || cp == 0x2212 ||
           cp == 0xFE58 || cp == 0xFE63;
}

static bool isSpaceVariant(char32_t cp) noexcept {
    return cp == 0x00A0 || cp == 0x2007 || cp == 0x202F || cp == 0x3000 ||
           cp == 0x2028 || cp == 0x2029 || cp == '\t' || cp == '\n' || cp == '\r';
}

static bool isDropped(char32_t cp) noexcept {
    if (cp < 0x20 || cp == 0x7F) return true;          // C0 / DEL
    if (cp >= 0x80 && cp <= 0x9F) return true;         // C1
    return cp == 0x00AD || cp == 0x200B || cp == 0x200C ||
           cp == 0x200D || cp == 0xFEFF;               // soft hyphen, zero-width
}

// ─── Cleaning ─────────────────────────────────────────────────────────────────

std::string cleanText(std::string_view raw) {
    std::string mapped;
    mapped.reserve(raw.size());

    size_t i = 0;
    while (i < raw.size()) {
        char32_t cp = 0;
        if (!decodeUtf8(raw, i, cp)) continue;

        if (cp >= 0xFF01 && cp <= 0xFF5E) cp -= 0xFEE0; // full-width ASCII block
        if (isSpaceVariant(cp)) cp = ' ';
        else if (isDashVariant(cp)) cp = '-';

        switch (cp) {
        case 0xFB01: mapped += "fi";  continue;
        case 0xFB02: mapped += "fl";  continue;
        case 0x2026: mapped += "..."; continue;
        default: break;
        }
        if (isDropped(cp)) continue;
        appendUtf8(mapped, cp);
    }

    std::string out;
    out.reserve(mapped.size());
    bool pending_space = false;
    for (char c : mapped) {
        if (c == ' ') {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

std::string toLower(std::string_view s) {
    std::string out(s);
    for (char& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

std::vector<std::string> splitWords(std::string_view s) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
        size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
        if (i > start) words.emplace_back(s.substr(start, i - start));
    }
    return words;
}

static bool isWordChar(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool containsWord(std::string_view text, std::string_view word) {
    if (word.empty()) return false;
    size_t pos = text.find(word);
    while (pos != std::string_view::npos) {
        const bool left_ok  = pos == 0 || !isWordChar(text[pos - 1]) || !isWordChar(word.front());
        const size_t after  = pos + word.size();
        const bool right_ok = after >= text.size() || !isWordChar(text[after]) || !isWordChar(word.back());
        if (left_ok && right_ok) return true;
        pos = text.find(word, pos + 1);
    }
    return false;
}

std::optional<uint32_t> parseUnsigned(std::string_view s) {
    if (s.empty()) return std::nullopt;
    uint32_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    if (v > static_cast<uint32_t>(std::numeric_limits<int32_t>::max())) return std::nullopt;
    return v;
}

uint32_t leadingIndent(std::string_view raw) noexcept {
    uint32_t n = 0;
    for (char c : raw) {
        if (c == ' ')       n += 1;
        else if (c == '\t') n += 4;
        else break;
    }
    return n;
}

// ─── Bit-range grammar ────────────────────────────────────────────────────────

namespace {

// Cursor over a cleaned, lower-cased cell.
struct RangeScanner {
    std::string_view s;
    size_t           pos{0};

    void skipSpace() {
        while (pos < s.size() && s[pos] == ' ') ++pos;
    }
    bool atEnd() const { return pos >= s.size(); }

    bool consume(std::string_view tok) {
        if (s.substr(pos, tok.size()) == tok) { pos += tok.size(); return true; }
        return false;
    }

    std::optional<uint32_t> number() {
        size_t start = pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        if (pos == start || pos - start > 10) return std::nullopt;
        return parseUnsigned(s.substr(start, pos - start));
    }
};

// Optional unit prefix: "bits", "bit", "bytes", "byte", each followed by
// a space, a colon or a digit.
void skipRangePrefix(RangeScanner& sc) {
    for (std::string_view p : {"bits", "bit", "bytes", "byte"}) {
        const size_t save = sc.pos;
        if (sc.consume(p)) {
            if (sc.atEnd() || sc.s[sc.pos] == ' ' || sc.s[sc.pos] == ':' ||
                std::isdigit(static_cast<unsigned char>(sc.s[sc.pos]))) {
                sc.skipSpace();
                sc.consume(":");
                sc.skipSpace();
                return;
            }
            sc.pos = save;
        }
    }
}

std::optional<std::pair<uint32_t, std::optional<uint32_t>>> strictParse(std::string_view text) {
    RangeScanner sc{text};
    sc.skipSpace();
    skipRangePrefix(sc);

    auto first = sc.number();
    if (!first) return std::nullopt;
    sc.skipSpace();
    if (sc.atEnd()) return std::make_pair(*first, std::optional<uint32_t>{});

    if (!sc.consume("..") && !sc.consume("-")) {
        const size_t save = sc.pos;
        if (!sc.consume("to") || (!sc.atEnd() && sc.s[sc.pos] != ' ' &&
                                  !std::isdigit(static_cast<unsigned char>(sc.s[sc.pos])))) {
            sc.pos = save;
            return std::nullopt;
        }
    }
    sc.skipSpace();
    auto second = sc.number();
    if (!second) return std::nullopt;
    sc.skipSpace();
    if (!sc.atEnd()) return std::nullopt;
    return std::make_pair(*first, std::optional<uint32_t>{*second});
}

// First one or two integers found anywhere in the text.
std::vector<uint32_t> scanIntegers(std::string_view text, size_t limit) {
    std::vector<uint32_t> out;
    RangeScanner sc{text};
    while (!sc.atEnd() && out.size() < limit) {
        if (std::isdigit(static_cast<unsigned char>(sc.s[sc.pos]))) {
            auto n = sc.number();
            if (!n) return {};
            out.push_back(*n);
        } else {
            ++sc.pos;
        }
    }
    return out;
}

} // namespace

std::optional<ParsedRange> parseBitRange(std::string_view cell) {
    const std::string text = toLower(cleanText(cell));
    if (text.empty()) return std::nullopt;

    ParsedRange out;
    uint32_t a = 0, b = 0;
    if (auto strict = strictParse(text)) {
        a = strict->first;
        b = strict->second.value_or(a);
    } else {
        auto nums = scanIntegers(text, 2);
        if (nums.empty()) return std::nullopt;
        a = nums[0];
        b = nums.size() > 1 ? nums[1] : a;
        out.exact = false;
    }
    if (a > b) {
        std::swap(a, b);
        out.exact = false;
    }
    out.range = BitRange{static_cast<int32_t>(a), static_cast<int32_t>(b)};
    return out;
}

std::string formatBitRange(const BitRange& r) {
    if (r.start == r.end) return std::to_string(r.start);
    return std::to_string(r.start) + "-" + std::to_string(r.end);
}

} // namespace simforge
