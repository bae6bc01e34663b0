#include "abigate/policy_engine.hpp"

#include <array>
#include <span>
#include <string_view>
#include <utility>

namespace abigate
{
namespace
{
bool starts_with_any(std::string_view text, std::span<const std::string_view> prefixes)
{
    for (auto prefix : prefixes)
    {
        if (text.starts_with(prefix))
        {
            return true;
        }
    }
    return false;
}

bool in_compatible_namespace(const HostAbi& abi, const ImportDescriptor& import)
{
    auto version = parse_abi_namespace(import.module_name, abi.prefix);
    return version && is_compatible(abi.version, *version);
}

// Signature is unconstrained when the ABI entry carries none.
bool signature_matches(const HostFunction& function, const ImportDescriptor& import)
{
    return !function.signature || (import.signature && *import.signature == *function.signature);
}
} // namespace

// ── PolicyEngine ─────────────────────────────────────────────────────────────

PolicyEngine::PolicyEngine(std::vector<PolicyRule> rules)
    : rules_(std::move(rules))
{
}

void PolicyEngine::add_rule(PolicyRule rule)
{
    rules_.push_back(std::move(rule));
}

ClassificationResult PolicyEngine::classify(const ImportDescriptor& import) const
{
    for (const auto& rule : rules_)
    {
        if (rule.matches && rule.matches(import))
        {
            return ClassificationResult{import,
                                        rule.verdict == Verdict::Allowed ? Classification::Allowed
                                                                         : Classification::ForbiddenKnown,
                                        rule.label,
                                        rule.explanation};
        }
    }
    return ClassificationResult{import, Classification::ForbiddenUnknown, "", kUnknownImportExplanation};
}

std::vector<ClassificationResult> PolicyEngine::classify(const std::vector<ImportDescriptor>& imports) const
{
    std::vector<ClassificationResult> results;
    results.reserve(imports.size());
    for (const auto& import : imports)
    {
        results.push_back(classify(import));
    }
    return results;
}

// ── Built-in rules ───────────────────────────────────────────────────────────

PolicyRule wasm_bindgen_detected()
{
    return {
        "wasm-bindgen detected",
        "remove the wasm-bindgen dependency",
        Verdict::Forbidden,
        [](const ImportDescriptor& import) {
            static constexpr std::array<std::string_view, 4> kNamespaces = {
                "wbg",
                "__wbindgen_placeholder__",
                "__wbindgen_externref_xform__",
                "__wbindgen_anyref_xform__",
            };
            static constexpr std::array<std::string_view, 1> kNamespacePrefixes = {"__wbindgen"};
            static constexpr std::array<std::string_view, 2> kNamePrefixes = {"__wbindgen_", "__wbg_"};

            for (auto name : kNamespaces)
            {
                if (import.module_name == name)
                {
                    return true;
                }
            }
            return starts_with_any(import.module_name, kNamespacePrefixes) ||
                   starts_with_any(import.name, kNamePrefixes);
        },
    };
}

PolicyRule wasi_detected()
{
    return {
        "WASI imports detected",
        "the reducer host provides no WASI environment; build for wasm32-unknown-unknown",
        Verdict::Forbidden,
        [](const ImportDescriptor& import) {
            static constexpr std::array<std::string_view, 3> kPrefixes = {
                "wasi_snapshot_preview",
                "wasi_unstable",
                "wasi:",
            };
            return starts_with_any(import.module_name, kPrefixes);
        },
    };
}

PolicyRule emscripten_runtime_detected()
{
    return {
        "emscripten runtime detected",
        "the reducer host provides no JS runtime; build without emscripten",
        Verdict::Forbidden,
        [](const ImportDescriptor& import) {
            static constexpr std::array<std::string_view, 4> kPrefixes = {
                "emscripten_",
                "_emscripten_",
                "invoke_",
                "__syscall_",
            };
            return import.module_name == "env" && starts_with_any(import.name, kPrefixes);
        },
    };
}

PolicyRule unsupported_host_abi_version(const HostAbi& abi)
{
    return {
        "unsupported host ABI version",
        "this tool supports host ABI " + abi.namespace_name() + "; rebuild against matching module bindings",
        Verdict::Forbidden,
        [abi](const ImportDescriptor& import) {
            auto version = parse_abi_namespace(import.module_name, abi.prefix);
            return version && !is_compatible(abi.version, *version);
        },
    };
}

PolicyRule host_non_function_import(const HostAbi& abi)
{
    return {
        "host ABI imports functions only",
        "define tables, memories and globals inside the module instead of importing them",
        Verdict::Forbidden,
        [abi](const ImportDescriptor& import) {
            return import.kind != ImportKind::Function && in_compatible_namespace(abi, import);
        },
    };
}

PolicyRule host_signature_mismatch(const HostAbi& abi)
{
    return {
        "host function signature mismatch",
        "the declared signature differs from " + abi.namespace_name() + "; regenerate the module bindings",
        Verdict::Forbidden,
        [abi](const ImportDescriptor& import) {
            if (import.kind != ImportKind::Function || !in_compatible_namespace(abi, import))
            {
                return false;
            }
            const auto* function = abi.find_function(import.name);
            return function != nullptr && !signature_matches(*function, import);
        },
    };
}

PolicyRule sanctioned_host_import(const HostAbi& abi)
{
    return {
        "sanctioned host import",
        "",
        Verdict::Allowed,
        [abi](const ImportDescriptor& import) {
            if (import.kind != ImportKind::Function || !in_compatible_namespace(abi, import))
            {
                return false;
            }
            const auto* function = abi.find_function(import.name);
            return function != nullptr && signature_matches(*function, import);
        },
    };
}

PolicyRule unknown_host_function(const HostAbi& abi)
{
    return {
        "unknown host function",
        abi.namespace_name() + " does not provide this function",
        Verdict::Forbidden,
        [abi](const ImportDescriptor& import) { return in_compatible_namespace(abi, import); },
    };
}

PolicyEngine default_policy_engine(const HostAbi& abi)
{
    PolicyEngine engine;
    engine.add_rule(wasm_bindgen_detected());
    engine.add_rule(wasi_detected());
    engine.add_rule(emscripten_runtime_detected());
    engine.add_rule(unsupported_host_abi_version(abi));
    engine.add_rule(host_non_function_import(abi));
    engine.add_rule(host_signature_mismatch(abi));
    engine.add_rule(sanctioned_host_import(abi));
    engine.add_rule(unknown_host_function(abi));
    return engine;
}

} // namespace abigate
