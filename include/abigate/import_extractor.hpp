#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "abigate/import_descriptor.hpp"

namespace abigate
{
// Enumerates the import section of a binary module in declaration order.
// Purely structural: nothing is instantiated or executed. Throws
// MalformedModule if the bytes are not a well-formed module.
std::vector<ImportDescriptor> extract_imports(std::span<const uint8_t> bytes);
} // namespace abigate
