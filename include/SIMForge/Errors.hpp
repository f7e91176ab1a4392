#pragma once
// Errors.hpp – Exceptions for conditions that abort a pipeline run.
// Document-quality problems are never thrown; they are reported as
// ValidationIssues alongside a best-effort model.

#include <stdexcept>

namespace simforge {

// The caller violated an interface contract (null collaborator, malformed
// model handed to the validator, section index out of range, …).
class ContractError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// A run observed its stop token; no partial model is exposed.
class RunCancelled : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace simforge
