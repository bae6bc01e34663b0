#include "abigate/validation_report.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace abigate
{
namespace
{
std::string import_noun(ImportKind kind)
{
    switch (kind)
    {
    case ImportKind::Function:
        return "import";
    case ImportKind::Table:
        return "table import";
    case ImportKind::Memory:
        return "memory import";
    case ImportKind::Global:
        return "global import";
    default:
        return "import";
    }
}

// Control bytes are escaped so a crafted name cannot forge extra diagnostic lines.
std::string printable(const std::string& text)
{
    std::ostringstream os;
    for (char c : text)
    {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7F)
        {
            os << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte) << std::dec;
        }
        else
        {
            os << c;
        }
    }
    return os.str();
}
} // namespace

std::string render_failure(const ClassificationResult& result)
{
    const auto& label = result.rule_label.empty() ? std::string(kUnknownImportLabel) : result.rule_label;
    const auto& explanation =
        result.explanation.empty() ? std::string(kUnknownImportExplanation) : result.explanation;

    std::ostringstream os;
    os << label << ": " << import_noun(result.descriptor.kind) << " `" << printable(result.descriptor.name)
       << "` from module `" << printable(result.descriptor.module_name) << "` is not supported; "
       << explanation << ".";
    return os.str();
}

ValidationOutcome make_outcome(std::vector<ClassificationResult> results)
{
    ValidationOutcome outcome;
    for (auto& result : results)
    {
        if (result.allowed())
        {
            continue;
        }
        auto message = render_failure(result);
        outcome.failures.push_back({std::move(result), std::move(message)});
    }
    outcome.passed = outcome.failures.empty();
    return outcome;
}

std::string render_diagnostics(const ValidationOutcome& outcome, const std::string& module_label)
{
    if (outcome.passed)
    {
        return {};
    }

    std::ostringstream os;
    os << "error: " << module_label << " imports " << outcome.failures.size()
       << (outcome.failures.size() == 1 ? " item" : " items") << " outside the reducer host ABI\n";
    for (const auto& failure : outcome.failures)
    {
        os << "  " << failure.message << "\n";
    }
    return os.str();
}

} // namespace abigate
