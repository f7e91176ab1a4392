#pragma once
// ModelBuilder.hpp – Single-writer assembly of the Semantic Intermediate Model.
//
// The builder groups normalized fields into Segments and Messages, turns
// dictionary rows into the DFI → DUI → DI forest and collects the enum and
// unit tables. It runs after every normalization task has completed and
// never reorders or deduplicates its input. Enum keys are unique across the
// model: a repeated key gets a "#2", "#3", … suffix, applied to the field
// that references it as well.

#include "Config.hpp"
#include "FieldNormalizer.hpp"
#include "Types.hpp"

#include <string>
#include <vector>

namespace simforge {

// Normalized tables of one section, in page/region order.
struct SectionFields {
    size_t                       section_index{0};
    std::vector<NormalizedTable> tables;
};

// Key of a dictionary node: "DFI-281", "DFI-281/DUI-1", "DFI-281/DUI-1/DI-3".
[[nodiscard]] std::string dictionaryKey(uint32_t category);
[[nodiscard]] std::string dictionaryKey(uint32_t category, uint32_t sub_category);
[[nodiscard]] std::string dictionaryKey(uint32_t category, uint32_t sub_category, uint32_t item);

class ModelBuilder {
public:
    explicit ModelBuilder(const PipelineConfig& cfg) : cfg_(cfg) {}
    ModelBuilder(PipelineConfig&&) = delete; // keeps a reference to the configuration

    // `inputs` must reference message or dictionary sections only, in
    // section order. Throws ContractError on an empty standard name, a
    // section index out of range or a section of another kind.
    [[nodiscard]] SemanticModel build(const Document& document,
                                      const std::vector<Section>& sections,
                                      const std::vector<SectionFields>& inputs) const;

    // Smallest configured container that holds `observed` units, or
    // `observed` itself when none does.
    [[nodiscard]] uint32_t containerFor(uint32_t observed) const noexcept;

private:
    const PipelineConfig& cfg_;

    [[nodiscard]] Message buildMessage(const Document& document, const Section& section,
                                       const SectionFields& input) const;
    void buildDictionary(const Section& section, const SectionFields& input,
                         std::vector<DictionaryEntry>& out) const;
    void closeSegment(Segment& seg) const;
};

} // namespace simforge
