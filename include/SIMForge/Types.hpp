#pragma once
// Types.hpp – Core data model for the SIMForge extraction pipeline.
// Every stage consumes and produces values of these structures; nothing is
// mutated after the stage that owns it has completed.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace simforge {

// ─── Transport unit of the source document ────────────────────────────────────
// Field ranges and segment lengths are expressed in this unit.
enum class TransportUnit { Bit, Byte };

// ─── Section classification ───────────────────────────────────────────────────
enum class SectionKind { Message, Dictionary, Appendix, Other };

// ─── Inferred data encoding of one field ──────────────────────────────────────
enum class FieldEncoding {
    Integer,        // Unsigned/signed numeric value
    Enum,           // Coded value resolved through an EnumDefinition
    String,         // Character data
    VariableLength, // Length not fixed by the table ("variable")
    Binary,         // Flags, spares and opaque blocks
};

enum class Severity { Error, Warning, Info };

// ─── Document metadata ────────────────────────────────────────────────────────
struct Document {
    std::string   standard;      // e.g. "MIL-STD-6016"
    std::string   edition;       // e.g. "C"
    uint32_t      page_count{0};
    TransportUnit transport_unit{TransportUnit::Bit};

    bool operator==(const Document&) const = default;
};

// ─── Page inputs supplied by the extraction collaborator ──────────────────────
struct PageText {
    uint32_t    page{0};  // 1-based
    std::string heading;
    std::string body;
};

struct PageRegion {
    uint32_t page{0};
    uint32_t index{0};    // ordinal of the region on its page
    double   x0{0.0}, y0{0.0}, x1{0.0}, y1{0.0};
};

enum class ExtractionMethod { A, B };

struct TableCandidate {
    ExtractionMethod                      method{ExtractionMethod::A};
    std::string                           method_name; // "lattice", "stream", …
    PageRegion                            region;
    std::vector<std::vector<std::string>> rows;
};

// ─── Everything one run needs, held in memory ─────────────────────────────────
struct DocumentSource {
    Document                document;
    std::vector<PageText>   pages;
    std::vector<PageRegion> regions;
};

// ─── A labelled span of pages ─────────────────────────────────────────────────
struct Section {
    SectionKind kind{SectionKind::Other};
    std::string label;       // "J3.2", "DFI 281", "Appendix B"
    std::string title;
    uint32_t    first_page{0};
    uint32_t    last_page{0};
    bool        synthetic{false}; // created for tables on unassigned pages
};

// ─── Inclusive, 0-based range in transport units ──────────────────────────────
struct BitRange {
    int32_t start{0};
    int32_t end{0};

    [[nodiscard]] int64_t width() const noexcept { return int64_t{end} - start + 1; }
    [[nodiscard]] bool overlaps(const BitRange& o) const noexcept {
        return start <= o.end && o.start <= end;
    }
    bool operator==(const BitRange&) const = default;
};

// Marks the first field of a new segment ("word").
struct SegmentMarker {
    std::string             type;            // "initial", "extension", …
    std::optional<uint32_t> declared_length; // "(70 bits)" in the marker text

    bool operator==(const SegmentMarker&) const = default;
};

// ─── One normalized table row ─────────────────────────────────────────────────
struct FieldRecord {
    std::string                  name;
    BitRange                     range;
    FieldEncoding                encoding{FieldEncoding::Integer};
    std::optional<std::string>   unit;          // canonical symbol or verbatim token
    bool                         unit_resolved{true};
    std::string                  description;
    double                       confidence{0.0};
    std::optional<std::string>   resolution;
    bool                         nullable{false};
    std::optional<std::string>   enum_ref;      // EnumDefinition::key
    uint32_t                     source_page{0};
    uint32_t                     source_row{0};
    std::optional<SegmentMarker> segment_marker;

    bool operator==(const FieldRecord&) const = default;
};

struct Segment {
    std::string              type;          // "initial", "extension", "continuation", "word"
    uint32_t                 index{0};
    uint32_t                 bit_length{0}; // in transport units
    bool                     declared{false};
    std::vector<FieldRecord> fields;

    bool operator==(const Segment&) const = default;
};

struct Message {
    std::string          label;
    std::string          title;
    std::string          edition;
    uint32_t             first_page{0};
    std::vector<Segment> segments;

    bool operator==(const Message&) const = default;
};

// ─── Hierarchical identifiers (DFI → DUI → DI) ────────────────────────────────
enum class DictionaryLevel { Category, SubCategory, Item };

struct DictionaryEntry {
    std::string     key;    // "DFI-281/DUI-1/DI-3"
    std::string     parent; // empty for category roots
    DictionaryLevel level{DictionaryLevel::Category};
    uint32_t        category_id{0};
    uint32_t        sub_category_id{0};
    uint32_t        item_id{0};
    std::string     name;
    std::string     description;

    bool operator==(const DictionaryEntry&) const = default;
};

struct EnumValue {
    std::string code;
    std::string label;

    bool operator==(const EnumValue&) const = default;
};

struct EnumDefinition {
    std::string            key;    // "<message label>.<field name>"
    std::vector<EnumValue> values;

    bool operator==(const EnumDefinition&) const = default;
};

struct UnitDefinition {
    std::string              symbol;  // canonical: "foot", "degree", …
    std::string              base_si; // "metre", "radian", …
    double                   factor{1.0};
    double                   offset{0.0};
    std::string              description;
    std::vector<std::string> aliases; // lower-case tokens that resolve to symbol

    bool operator==(const UnitDefinition&) const = default;
};

// ─── The Semantic Intermediate Model ──────────────────────────────────────────
struct SemanticModel {
    Document                     document;
    std::vector<Message>         messages;
    std::vector<DictionaryEntry> dictionary;
    std::vector<EnumDefinition>  enums;
    std::vector<UnitDefinition>  units;

    bool operator==(const SemanticModel&) const = default;
};

// ─── Validation output (never part of the SIM) ────────────────────────────────
struct ValidationIssue {
    Severity                   severity{Severity::Warning};
    std::string                rule_id;
    std::string                target_path; // "messages[2].segments[0].fields[3]"
    std::string                message;
    std::optional<std::string> suggested_fix;

    bool operator==(const ValidationIssue&) const = default;
};

// ─── String forms used by the serialized formats ──────────────────────────────
const char* toString(TransportUnit u) noexcept;
const char* toString(SectionKind k) noexcept;
const char* toString(FieldEncoding e) noexcept;
const char* toString(Severity s) noexcept;
const char* toString(DictionaryLevel l) noexcept;
const char* toString(ExtractionMethod m) noexcept;

std::optional<TransportUnit>   parseTransportUnit(std::string_view s);
std::optional<SectionKind>     parseSectionKind(std::string_view s);
std::optional<FieldEncoding>   parseFieldEncoding(std::string_view s);
std::optional<Severity>        parseSeverity(std::string_view s);
std::optional<DictionaryLevel> parseDictionaryLevel(std::string_view s);

} // namespace simforge
