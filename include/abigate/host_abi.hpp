#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "abigate/types.hpp"

namespace abigate
{
struct AbiVersion
{
    uint32_t major{0};
    uint32_t minor{0};

    bool operator==(const AbiVersion&) const = default;
};

struct HostFunction
{
    std::string name;
    std::optional<FunctionSignature> signature; // nullopt accepts any signature
};

/**
 * HostAbi
 *
 * The sanctioned host interface a reducer module may import from. Imports
 * live under the namespace "<prefix>_<major>.<minor>"; a module built against
 * an older minor version of the same major is still compatible.
 */
struct HostAbi
{
    std::string prefix;
    AbiVersion version;
    std::vector<HostFunction> functions;

    [[nodiscard]] std::string namespace_name() const;

    [[nodiscard]] const HostFunction* find_function(std::string_view name) const;
};

// Parses "<prefix>_<major>.<minor>" strictly: decimal digits only, no sign,
// no whitespace. Returns nullopt if the namespace does not have that shape.
std::optional<AbiVersion> parse_abi_namespace(std::string_view module_name, std::string_view prefix);

bool is_compatible(const AbiVersion& host, const AbiVersion& module);

/// The host interface this tool release validates against.
HostAbi default_host_abi();

} // namespace abigate
