#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "abigate/import_descriptor.hpp"
#include "abigate/policy_engine.hpp"
#include "abigate/validation_report.hpp"

namespace abigate
{
enum ExitStatus : int
{
    kExitPassed = 0,
    kExitPolicyViolation = 1,
    kExitMalformedModule = 2, // toolchain problem, not a policy violation
    kExitToolError = 3,
};

using ModuleSource = std::function<std::vector<uint8_t>()>;

// Sees the imports of a module that parsed, before the outcome is reported.
using ImportListener = std::function<void(const std::vector<ImportDescriptor>&)>;

struct BuildStep
{
    std::string module_path;
    std::optional<std::string> compile_command; // run before reading module_path
    bool verbose{false};
    ImportListener on_imports;
};

std::vector<uint8_t> read_file(const std::string& path);

// extract -> classify -> report. MalformedModule propagates to the caller.
ValidationOutcome validate_module(std::span<const uint8_t> bytes, const PolicyEngine& engine);

// Orchestrator boundary: runs the pipeline on the bytes produced by `source`,
// writes diagnostics to `err` and returns the process exit status. Never
// throws for bad module bytes.
int run_validation(const ModuleSource& source,
                   const std::string& module_label,
                   const PolicyEngine& engine,
                   std::ostream& err,
                   bool verbose = false,
                   const ImportListener& on_imports = {});

// Runs the optional compiler command, then validates the artifact it produced.
int run_build_step(const BuildStep& step, const PolicyEngine& engine, std::ostream& err);

} // namespace abigate
