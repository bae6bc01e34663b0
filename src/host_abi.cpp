#include "abigate/host_abi.hpp"

#include <algorithm>
#include <utility>

namespace abigate
{
namespace
{
constexpr size_t kMaxVersionDigits = 9;

std::optional<uint32_t> parse_version_component(std::string_view text)
{
    if (text.empty() || text.size() > kMaxVersionDigits)
    {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (char c : text)
    {
        if (c < '0' || c > '9')
        {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    return value;
}

HostFunction host_function(std::string name,
                           std::vector<ValueType> params,
                           std::vector<ValueType> results)
{
    return HostFunction{std::move(name), FunctionSignature{std::move(params), std::move(results)}};
}
} // namespace

std::string HostAbi::namespace_name() const
{
    return prefix + "_" + std::to_string(version.major) + "." + std::to_string(version.minor);
}

const HostFunction* HostAbi::find_function(std::string_view name) const
{
    auto it = std::find_if(functions.begin(), functions.end(), [&](const HostFunction& function) {
        return function.name == name;
    });
    if (it == functions.end())
    {
        return nullptr;
    }
    return &(*it);
}

std::optional<AbiVersion> parse_abi_namespace(std::string_view module_name, std::string_view prefix)
{
    if (module_name.size() <= prefix.size() + 1 || module_name.substr(0, prefix.size()) != prefix ||
        module_name[prefix.size()] != '_')
    {
        return std::nullopt;
    }

    auto version_text = module_name.substr(prefix.size() + 1);
    auto dot = version_text.find('.');
    if (dot == std::string_view::npos)
    {
        return std::nullopt;
    }

    auto major = parse_version_component(version_text.substr(0, dot));
    auto minor = parse_version_component(version_text.substr(dot + 1));
    if (!major || !minor)
    {
        return std::nullopt;
    }
    return AbiVersion{*major, *minor};
}

bool is_compatible(const AbiVersion& host, const AbiVersion& module)
{
    return host.major == module.major && module.minor <= host.minor;
}

HostAbi default_host_abi()
{
    constexpr auto i32 = ValueType::I32;
    constexpr auto i64 = ValueType::I64;

    HostAbi abi;
    abi.prefix = "spacetime";
    abi.version = AbiVersion{10, 0};
    abi.functions = {
        // Logging and tracing.
        host_function("_console_log", {i32, i32, i32, i32, i32, i32, i32, i32}, {}),
        host_function("_span_start", {i32, i32}, {i32}),
        host_function("_span_end", {i32}, {i32}),

        // Table access. Fallible calls return an errno-style status.
        host_function("_get_table_id", {i32, i32, i32}, {i32}),
        host_function("_create_index", {i32, i32, i32, i32, i32, i32}, {i32}),
        host_function("_iter_by_col_eq", {i32, i32, i32, i32, i32}, {i32}),
        host_function("_insert", {i32, i32, i32}, {i32}),
        host_function("_delete_by_col_eq", {i32, i32, i32, i32, i32}, {i32}),
        host_function("_delete_by_rel", {i32, i32, i32, i32}, {i32}),
        host_function("_iter_start", {i32, i32}, {i32}),
        host_function("_iter_start_filtered", {i32, i32, i32, i32}, {i32}),
        host_function("_iter_next", {i32, i32}, {i32}),
        host_function("_iter_drop", {i32}, {i32}),

        // Reducer scheduling.
        host_function("_schedule_reducer", {i32, i32, i32, i32, i64, i32}, {}),
        host_function("_cancel_reducer", {i64}, {}),

        // Host-owned buffers.
        host_function("_buffer_len", {i32}, {i32}),
        host_function("_buffer_consume", {i32, i32, i32}, {i32}),
        host_function("_buffer_alloc", {i32, i32}, {i32}),
    };
    return abi;
}

} // namespace abigate
