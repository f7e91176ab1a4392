#pragma once
// Validator.hpp – Read-only checks over a completed SemanticModel.
//
// Four independent checkers run concurrently on the same model and their
// issue lists are merged in fixed order:
//   structural  version-format, bit-overlap, bit-out-of-bounds, bit-unused,
//               low-confidence, empty-segment
//   dictionary  dict-dangling-parent, dict-cycle, dict-duplicate
//   units       unit-unresolved, unit-inconsistent, enum-missing,
//               enum-incomplete
//   diff        version-diff (only when a prior edition is supplied)
//
// Data problems never throw. A malformed model (negative or inverted range)
// throws ContractError.

#include "Config.hpp"
#include "Types.hpp"

#include <string>
#include <vector>

namespace simforge {

// "messages[2].segments[0].fields[3]"
[[nodiscard]] std::string fieldPath(size_t message, size_t segment, size_t field);
[[nodiscard]] std::string segmentPath(size_t message, size_t segment);
[[nodiscard]] std::string messagePath(size_t message);

class Validator {
public:
    explicit Validator(ValidationConfig cfg) : cfg_(cfg) {}

    [[nodiscard]] std::vector<ValidationIssue>
    validate(const SemanticModel& model, const SemanticModel* prior = nullptr) const;

    [[nodiscard]] std::vector<ValidationIssue> checkStructure(const SemanticModel& model) const;
    [[nodiscard]] std::vector<ValidationIssue> checkDictionary(const SemanticModel& model) const;
    [[nodiscard]] std::vector<ValidationIssue> checkUnits(const SemanticModel& model) const;
    [[nodiscard]] std::vector<ValidationIssue> diff(const SemanticModel& model,
                                                    const SemanticModel& prior) const;

private:
    ValidationConfig cfg_;
};

// Number of issues of a given severity.
[[nodiscard]] size_t countIssues(const std::vector<ValidationIssue>& issues, Severity s) noexcept;

} // namespace simforge
