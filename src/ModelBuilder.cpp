// ModelBuilder.cpp – Segment grouping, container sizing and dictionary forest.

#include "SIMForge/ModelBuilder.hpp"
#include "SIMForge/Errors.hpp"
#include "SIMForge/Log.hpp"
#include "SIMForge/Text.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <set>

namespace simforge {

// ─────────────────────────────────────────────────────────────────────────────
//  Dictionary keys
// ─────────────────────────────────────────────────────────────────────────────

std::string dictionaryKey(uint32_t category) {
    return "DFI-" + std::to_string(category);
}

std::string dictionaryKey(uint32_t category, uint32_t sub_category) {
    return dictionaryKey(category) + "/DUI-" + std::to_string(sub_category);
}

std::string dictionaryKey(uint32_t category, uint32_t sub_category, uint32_t item) {
    return dictionaryKey(category, sub_category) + "/DI-" + std::to_string(item);
}

// Item hanging directly under its category.
static std::string categoryItemKey(uint32_t category, uint32_t item) {
    return dictionaryKey(category) + "/DI-" + std::to_string(item);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Segments
// ─────────────────────────────────────────────────────────────────────────────

uint32_t ModelBuilder::containerFor(uint32_t observed) const noexcept {
    uint32_t best = 0;
    for (uint32_t size : cfg_.container_sizes)
        if (size >= observed && (best == 0 || size < best)) best = size;
    return best == 0 ? observed : best;
}

void ModelBuilder::closeSegment(Segment& seg) const {
    if (seg.declared) return;
    int32_t max_end = -1;
    for (const auto& f : seg.fields) max_end = std::max(max_end, f.range.end);
    seg.bit_length = containerFor(static_cast<uint32_t>(int64_t{max_end} + 1));
    // A configured container is a length the document declares for every word.
    seg.declared = std::find(cfg_.container_sizes.begin(), cfg_.container_sizes.end(),
                             seg.bit_length) != cfg_.container_sizes.end();
}

Message ModelBuilder::buildMessage(const Document& document, const Section& section,
                                   const SectionFields& input) const {
    Message msg;
    msg.label      = section.label;
    msg.title      = section.title;
    msg.edition    = document.edition;
    msg.first_page = section.first_page;

    Segment cur;
    cur.type  = "initial";
    cur.index = 0;

    for (const auto& table : input.tables) {
        for (FieldRecord f : table.fields) {
            if (f.segment_marker) {
                SegmentMarker marker = std::move(*f.segment_marker);
                f.segment_marker.reset();
                if (!cur.fields.empty()) {
                    closeSegment(cur);
                    const uint32_t next = cur.index + 1;
                    msg.segments.push_back(std::move(cur));
                    cur       = Segment{};
                    cur.index = next;
                }
                cur.type       = marker.type;
                cur.bit_length = marker.declared_length.value_or(0);
                cur.declared   = marker.declared_length.has_value();
            }
            cur.fields.push_back(std::move(f));
        }
    }

    if (!cur.fields.empty()) {
        closeSegment(cur);
        msg.segments.push_back(std::move(cur));
    }
    return msg;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Dictionary forest
// ─────────────────────────────────────────────────────────────────────────────

// First integer in a section label ("DFI 281" → 281).
static std::optional<uint32_t> labelNumber(const std::string& label) {
    size_t i = 0;
    while (i < label.size() && !std::isdigit(static_cast<unsigned char>(label[i]))) ++i;
    size_t j = i;
    while (j < label.size() && std::isdigit(static_cast<unsigned char>(label[j]))) ++j;
    if (i == j) return std::nullopt;
    return parseUnsigned(std::string_view(label).substr(i, j - i));
}

void ModelBuilder::buildDictionary(const Section& section, const SectionFields& input,
                                   std::vector<DictionaryEntry>& out) const {
    const std::optional<uint32_t> section_category = labelNumber(section.label);

    std::optional<uint32_t> open_category = section_category;
    std::optional<uint32_t> open_sub;
    bool section_root_emitted = false;
    std::map<std::string, uint32_t> ordinals; // parent key → children seen

    auto nextOrdinal = [&](const std::string& parent) { return ++ordinals[parent]; };

    // The section heading itself names the default category.
    auto ensureSectionRoot = [&](uint32_t category) {
        if (section_root_emitted || !section_category || category != *section_category) return;
        DictionaryEntry root;
        root.key         = dictionaryKey(category);
        root.level       = DictionaryLevel::Category;
        root.category_id = category;
        root.name        = section.title.empty() ? section.label : section.title;
        out.push_back(std::move(root));
        section_root_emitted = true;
    };

    for (const auto& table : input.tables) {
        for (const auto& row : table.dictionary_rows) {
            DictionaryEntry e;
            e.level       = row.level;
            e.name        = row.name;
            e.description = row.description != row.name ? row.description : std::string{};

            switch (row.level) {
            case DictionaryLevel::Category: {
                const uint32_t c = row.category_id ? *row.category_id
                                 : open_category   ? *open_category
                                                   : nextOrdinal("");
                e.key         = dictionaryKey(c);
                e.category_id = c;
                if (section_category && c == *section_category) section_root_emitted = true;
                open_category = c;
                open_sub.reset();
                break;
            }
            case DictionaryLevel::SubCategory: {
                const uint32_t c = row.category_id ? *row.category_id
                                 : open_category   ? *open_category : 0;
                ensureSectionRoot(c);
                const std::string parent = dictionaryKey(c);
                const uint32_t s = row.sub_category_id ? *row.sub_category_id : nextOrdinal(parent);
                e.key             = dictionaryKey(c, s);
                e.parent          = parent;
                e.category_id     = c;
                e.sub_category_id = s;
                open_category     = c;
                open_sub          = s;
                break;
            }
            case DictionaryLevel::Item: {
                const uint32_t c = row.category_id ? *row.category_id
                                 : open_category   ? *open_category : 0;
                ensureSectionRoot(c);
                std::optional<uint32_t> s = row.sub_category_id;
                if (!s && (!row.category_id || row.category_id == open_category)) s = open_sub;
                const std::string parent = s ? dictionaryKey(c, *s) : dictionaryKey(c);
                const uint32_t i = row.item_id ? *row.item_id : nextOrdinal(parent);
                e.key             = s ? dictionaryKey(c, *s, i) : categoryItemKey(c, i);
                e.parent          = parent;
                e.category_id     = c;
                e.sub_category_id = s.value_or(0);
                e.item_id         = i;
                break;
            }
            }
            out.push_back(std::move(e));
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Enum keys
// ─────────────────────────────────────────────────────────────────────────────

static std::string claimEnumKey(const std::string& key, std::set<std::string>& used) {
    std::string unique = key;
    for (uint32_t n = 2; used.count(unique) != 0; ++n)
        unique = key + "#" + std::to_string(n);
    used.insert(unique);
    if (unique != key) logger()->debug("enum table '{}' renamed to '{}'", key, unique);
    return unique;
}

// The normalizer emits one enum table per enum field, in field order; each
// field keeps pointing at its own table after renaming.
static void assignEnumKeys(NormalizedTable& table, std::set<std::string>& used) {
    size_t next = 0;
    for (auto& f : table.fields) {
        if (!f.enum_ref || next >= table.enums.size() || table.enums[next].key != *f.enum_ref)
            continue;
        EnumDefinition& def = table.enums[next++];
        def.key    = claimEnumKey(def.key, used);
        f.enum_ref = def.key;
    }
    for (; next < table.enums.size(); ++next)
        table.enums[next].key = claimEnumKey(table.enums[next].key, used);
}

// ─────────────────────────────────────────────────────────────────────────────
//  build
// ─────────────────────────────────────────────────────────────────────────────

SemanticModel ModelBuilder::build(const Document& document,
                                  const std::vector<Section>& sections,
                                  const std::vector<SectionFields>& inputs) const {
    if (document.standard.empty())
        throw ContractError("ModelBuilder: document has no standard name");

    SemanticModel model;
    model.document = document;
    model.units    = cfg_.units;

    std::set<std::string> enum_keys;
    for (const auto& original : inputs) {
        SectionFields input = original;
        for (auto& table : input.tables) assignEnumKeys(table, enum_keys);

        if (input.section_index >= sections.size())
            throw ContractError("ModelBuilder: section index " + std::to_string(input.section_index) +
                                " out of range (" + std::to_string(sections.size()) + " sections)");
        const Section& section = sections[input.section_index];

        switch (section.kind) {
        case SectionKind::Message:
            model.messages.push_back(buildMessage(document, section, input));
            break;
        case SectionKind::Dictionary:
            buildDictionary(section, input, model.dictionary);
            break;
        default:
            throw ContractError("ModelBuilder: section '" + section.label + "' of kind " +
                                toString(section.kind) + " cannot be modelled");
        }

        for (const auto& table : input.tables)
            for (const auto& def : table.enums) model.enums.push_back(def);
    }

    logger()->info("built model: {} messages, {} dictionary entries, {} enums",
                   model.messages.size(), model.dictionary.size(), model.enums.size());
    return model;
}

} // namespace simforge
