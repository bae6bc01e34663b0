#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "abigate/types.hpp"

namespace abigate
{
enum class ImportKind : uint8_t
{
    Function = 0x00,
    Table = 0x01,
    Memory = 0x02,
    Global = 0x03,
};

inline std::string_view to_string(ImportKind kind)
{
    switch (kind)
    {
    case ImportKind::Function:
        return "function";
    case ImportKind::Table:
        return "table";
    case ImportKind::Memory:
        return "memory";
    case ImportKind::Global:
        return "global";
    default:
        return "unknown";
    }
}

struct TableType
{
    ValueType element_type{ValueType::FuncRef};
    Limits limits;
};

struct MemoryType
{
    Limits limits;
};

struct GlobalType
{
    ValueType value_type{ValueType::I32};
    bool is_mutable{false};
};

// One entry of a module's import section. Identity is (module_name, name,
// kind); a module may legally repeat a pair, each entry stands alone.
struct ImportDescriptor
{
    std::string module_name;
    std::string name;
    ImportKind kind{ImportKind::Function};
    uint32_t type_index{0}; // for functions
    // Shared with the type section entry; every import of the same type points
    // at one signature. Null when unresolved.
    std::shared_ptr<const FunctionSignature> signature;
    TableType table_type;
    MemoryType memory_type;
    GlobalType global_type;
};

// Signatures longer than this many value types are summarised by count.
inline constexpr size_t kMaxRenderedValueTypes = 32;

std::string describe_import_type(const ImportDescriptor& import);
} // namespace abigate
