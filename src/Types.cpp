// Types.cpp – String forms of the model enumerations.

#include "SIMForge/Types.hpp"

namespace simforge {

const char* toString(TransportUnit u) noexcept {
    return u == TransportUnit::Byte ? "byte" : "bit";
}

const char* toString(SectionKind k) noexcept {
    switch (k) {
    case SectionKind::Message:    return "message";
    case SectionKind::Dictionary: return "dictionary";
    case SectionKind::Appendix:   return "appendix";
    case SectionKind::Other:      return "other";
    }
    return "other";
}

const char* toString(FieldEncoding e) noexcept {
    switch (e) {
    case FieldEncoding::Integer:        return "integer";
    case FieldEncoding::Enum:           return "enum";
    case FieldEncoding::String:         return "string";
    case FieldEncoding::VariableLength: return "variable-length";
    case FieldEncoding::Binary:         return "binary";
    }
    return "integer";
}

const char* toString(Severity s) noexcept {
    switch (s) {
    case Severity::Error:   return "error";
    case Severity::Warning: return "warning";
    case Severity::Info:    return "info";
    }
    return "warning";
}

const char* toString(DictionaryLevel l) noexcept {
    switch (l) {
    case DictionaryLevel::Category:    return "category";
    case DictionaryLevel::SubCategory: return "sub-category";
    case DictionaryLevel::Item:        return "item";
    }
    return "category";
}

const char* toString(ExtractionMethod m) noexcept {
    return m == ExtractionMethod::A ? "A" : "B";
}

std::optional<TransportUnit> parseTransportUnit(std::string_view s) {
    if (s == "bit")  return TransportUnit::Bit;
    if (s == "byte") return TransportUnit::Byte;
    return std::nullopt;
}

std::optional<SectionKind> parseSectionKind(std::string_view s) {
    if (s == "message")    return SectionKind::Message;
    if (s == "dictionary") return SectionKind::Dictionary;
    if (s == "appendix")   return SectionKind::Appendix;
    if (s == "other")      return SectionKind::Other;
    return std::nullopt;
}

std::optional<FieldEncoding> parseFieldEncoding(std::string_view s) {
    if (s == "integer")         return FieldEncoding::Integer;
    if (s == "enum")            return FieldEncoding::Enum;
    if (s == "string")          return FieldEncoding::String;
    if (s == "variable-length") return FieldEncoding::VariableLength;
    if (s == "binary")          return FieldEncoding::Binary;
    return std::nullopt;
}

std::optional<Severity> parseSeverity(std::string_view s) {
    if (s == "error")   return Severity::Error;
    if (s == "warning") return Severity::Warning;
    if (s == "info")    return Severity::Info;
    return std::nullopt;
}

std::optional<DictionaryLevel> parseDictionaryLevel(std::string_view s) {
    if (s == "category")     return DictionaryLevel::Category;
    if (s == "sub-category") return DictionaryLevel::SubCategory;
    if (s == "item")         return DictionaryLevel::Item;
    return std::nullopt;
}

} // namespace simforge
