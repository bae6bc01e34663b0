#include "abigate/import_descriptor.hpp"

#include <sstream>

namespace abigate
{
namespace
{
void append_limits(std::ostringstream& out, const Limits& limits)
{
    out << " min=" << limits.min;
    if (limits.max)
    {
        out << " max=" << *limits.max;
    }
    if (limits.shared)
    {
        out << " shared";
    }
}
} // namespace

std::string describe_import_type(const ImportDescriptor& import)
{
    std::ostringstream out;
    switch (import.kind)
    {
    case ImportKind::Function:
        out << "func ";
        if (import.signature &&
            import.signature->params.size() + import.signature->results.size() <= kMaxRenderedValueTypes)
        {
            out << to_string(*import.signature);
        }
        else if (import.signature)
        {
            out << "(type " << import.type_index << ": " << import.signature->params.size() << " params, "
                << import.signature->results.size() << " results)";
        }
        else
        {
            out << "(type " << import.type_index << ")";
        }
        break;
    case ImportKind::Table:
        out << "table type=" << to_string(import.table_type.element_type);
        append_limits(out, import.table_type.limits);
        break;
    case ImportKind::Memory:
        out << "memory";
        append_limits(out, import.memory_type.limits);
        break;
    case ImportKind::Global:
        out << "global " << (import.global_type.is_mutable ? "mut " : "")
            << to_string(import.global_type.value_type);
        break;
    }
    return out.str();
}
} // namespace abigate
