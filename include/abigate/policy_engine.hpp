#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "abigate/host_abi.hpp"
#include "abigate/import_descriptor.hpp"

namespace abigate
{
enum class Verdict
{
    Allowed,
    Forbidden
};

// Forbidden results are split by whether a named rule recognised them.
enum class Classification
{
    Allowed,
    ForbiddenKnown,
    ForbiddenUnknown
};

inline std::ostream& operator<<(std::ostream& os, Classification c)
{
    switch (c)
    {
    case Classification::Allowed:
        return os << "Allowed";
    case Classification::ForbiddenKnown:
        return os << "ForbiddenKnown";
    case Classification::ForbiddenUnknown:
        return os << "ForbiddenUnknown";
    default:
        return os << "Unknown";
    }
}

using ImportMatcher = std::function<bool(const ImportDescriptor&)>;

// `label` is the stable text consumers grep for on stderr; changing one is a
// breaking change.
struct PolicyRule
{
    std::string label;
    std::string explanation;
    Verdict verdict{Verdict::Forbidden};
    ImportMatcher matches;
};

struct ClassificationResult
{
    ImportDescriptor descriptor;
    Classification classification{Classification::ForbiddenUnknown};
    std::string rule_label; // empty when no rule matched
    std::string explanation;

    [[nodiscard]] bool allowed() const { return classification == Classification::Allowed; }
};

inline constexpr const char* kUnknownImportLabel = "unrecognized host import";
inline constexpr const char* kUnknownImportExplanation = "only the sanctioned host interface may be imported";

/**
 * PolicyEngine
 *
 * Classifies imports against an ordered rule list.
 *
 * Resolution strategy (default deny):
 *   1. Rules are tried in registration order; the first match decides.
 *   2. An import no rule matches is ForbiddenUnknown.
 *
 * The engine never mutates during classification, so one instance may be
 * shared read-only between concurrent builds.
 */
class PolicyEngine
{
public:
    PolicyEngine() = default;
    explicit PolicyEngine(std::vector<PolicyRule> rules);

    void add_rule(PolicyRule rule);

    [[nodiscard]] ClassificationResult classify(const ImportDescriptor& import) const;

    // One result per import, in the same order.
    [[nodiscard]] std::vector<ClassificationResult> classify(const std::vector<ImportDescriptor>& imports) const;

    [[nodiscard]] const std::vector<PolicyRule>& rules() const { return rules_; }

private:
    std::vector<PolicyRule> rules_;
};

// ── Built-in rules ───────────────────────────────────────────────────────────

/// Heuristic over wasm-bindgen's generated namespaces ("wbg",
/// "__wbindgen_placeholder__", ...) and helper names ("__wbindgen_*",
/// "__wbg_*"). Catches renamed helpers across releases, but is not a proof
/// that a module is free of JS glue.
PolicyRule wasm_bindgen_detected();

/// Imports from any WASI preview namespace.
PolicyRule wasi_detected();

/// Emscripten's JS runtime support imports under "env".
PolicyRule emscripten_runtime_detected();

/// Host namespace with a well-formed but incompatible ABI version.
PolicyRule unsupported_host_abi_version(const HostAbi& abi);

/// Tables, memories and globals requested from the host namespace.
PolicyRule host_non_function_import(const HostAbi& abi);

/// Sanctioned host function declared with a different signature.
PolicyRule host_signature_mismatch(const HostAbi& abi);

/// The sanctioned host interface itself.
PolicyRule sanctioned_host_import(const HostAbi& abi);

/// Anything else under a compatible host namespace.
PolicyRule unknown_host_function(const HostAbi& abi);

/// Returns a PolicyEngine pre-loaded with all built-in rules, most specific first.
PolicyEngine default_policy_engine(const HostAbi& abi = default_host_abi());

} // namespace abigate
