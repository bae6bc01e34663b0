#include "abigate/build_pipeline.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "abigate/errors.hpp"
#include "abigate/import_extractor.hpp"

namespace abigate
{
std::vector<uint8_t> read_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error("failed to open file: " + path);
    }
    file.seekg(0, std::ios::end);
    const auto end = file.tellg();
    if (end < 0)
    {
        throw std::runtime_error("failed to size file: " + path);
    }
    const auto size = static_cast<size_t>(end);
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> buffer(size);
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
    if (!file)
    {
        throw std::runtime_error("failed to read file: " + path);
    }
    return buffer;
}

ValidationOutcome validate_module(std::span<const uint8_t> bytes, const PolicyEngine& engine)
{
    const auto imports = extract_imports(bytes);
    return make_outcome(engine.classify(imports));
}

int run_validation(const ModuleSource& source,
                   const std::string& module_label,
                   const PolicyEngine& engine,
                   std::ostream& err,
                   bool verbose,
                   const ImportListener& on_imports)
{
    std::vector<uint8_t> bytes;
    try
    {
        bytes = source();
    }
    catch (const std::exception& ex)
    {
        err << "error: " << ex.what() << "\n";
        return kExitToolError;
    }

    if (verbose)
    {
        err << "[abigate] validating imports of " << module_label << " (" << bytes.size() << " bytes)\n";
    }

    std::vector<ImportDescriptor> imports;
    try
    {
        imports = extract_imports(bytes);
    }
    catch (const MalformedModule& ex)
    {
        err << "error: malformed module " << module_label << ": " << ex.what() << "\n";
        return kExitMalformedModule;
    }

    if (on_imports)
    {
        on_imports(imports);
    }

    auto outcome = make_outcome(engine.classify(imports));

    if (verbose)
    {
        err << "[abigate] " << outcome.failures.size() << " import(s) rejected\n";
    }

    err << render_diagnostics(outcome, module_label);
    return outcome.passed ? kExitPassed : kExitPolicyViolation;
}

int run_build_step(const BuildStep& step, const PolicyEngine& engine, std::ostream& err)
{
    if (step.compile_command)
    {
        if (step.verbose)
        {
            err << "[abigate] running compiler: " << *step.compile_command << "\n";
        }
        const int status = std::system(step.compile_command->c_str());
        if (status != 0)
        {
            err << "error: compiler invocation failed (status " << status << "): " << *step.compile_command
                << "\n";
            return kExitToolError;
        }
    }

    return run_validation([&step] { return read_file(step.module_path); }, step.module_path, engine, err,
                          step.verbose, step.on_imports);
}

} // namespace abigate
