#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace abigate
{
enum class ValueType : uint8_t
{
    I32 = 0x7F,
    I64 = 0x7E,
    F32 = 0x7D,
    F64 = 0x7C,
    V128 = 0x7B,
    FuncRef = 0x70,
    ExternRef = 0x6F,
};

inline bool is_value_type(uint8_t byte)
{
    switch (byte)
    {
    case 0x7F:
    case 0x7E:
    case 0x7D:
    case 0x7C:
    case 0x7B:
    case 0x70:
    case 0x6F:
        return true;
    default:
        return false;
    }
}

inline std::string to_string(ValueType type)
{
    switch (type)
    {
    case ValueType::I32:
        return "i32";
    case ValueType::I64:
        return "i64";
    case ValueType::F32:
        return "f32";
    case ValueType::F64:
        return "f64";
    case ValueType::V128:
        return "v128";
    case ValueType::FuncRef:
        return "funcref";
    case ValueType::ExternRef:
        return "externref";
    default:
        return "unknown";
    }
}

struct FunctionSignature
{
    std::vector<ValueType> params;
    std::vector<ValueType> results;

    bool operator==(const FunctionSignature&) const = default;
};

// Renders as "(i32, i32) -> i32"; an empty result list renders as "-> ()".
inline std::string to_string(const FunctionSignature& signature)
{
    std::string text = "(";
    for (size_t i = 0; i < signature.params.size(); ++i)
    {
        if (i != 0)
        {
            text += ", ";
        }
        text += to_string(signature.params[i]);
    }
    text += ") -> ";
    if (signature.results.size() == 1)
    {
        return text + to_string(signature.results.front());
    }
    text += "(";
    for (size_t i = 0; i < signature.results.size(); ++i)
    {
        if (i != 0)
        {
            text += ", ";
        }
        text += to_string(signature.results[i]);
    }
    return text + ")";
}

struct Limits
{
    uint32_t min{0};
    std::optional<uint32_t> max;
    bool shared{false};
};
} // namespace abigate
