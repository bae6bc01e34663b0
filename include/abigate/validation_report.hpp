#pragma once

#include <string>
#include <vector>

#include "abigate/policy_engine.hpp"

namespace abigate
{
struct ValidationFailure
{
    ClassificationResult result;
    std::string message; // rendered, includes the rule label
};

struct ValidationOutcome
{
    bool passed{true};
    std::vector<ValidationFailure> failures; // declaration order
};

// Collects every non-Allowed result. Never stops at the first failure.
// Failing results are moved into the outcome, not copied.
ValidationOutcome make_outcome(std::vector<ClassificationResult> results);

// "<label>: import `<name>` from module `<namespace>` is not supported; <explanation>."
std::string render_failure(const ClassificationResult& result);

// Text block for stderr. Empty for a passed outcome.
std::string render_diagnostics(const ValidationOutcome& outcome, const std::string& module_label);

} // namespace abigate
