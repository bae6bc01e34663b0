#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace abigate
{
// Raised when the byte sequence is not a structurally valid module. This is a
// toolchain problem, reported separately from import policy violations.
class MalformedModule final : public std::runtime_error
{
public:
    MalformedModule(const std::string& message, size_t offset)
        : std::runtime_error(message + " (at byte offset " + std::to_string(offset) + ")")
        , offset_(offset)
    {
    }

    [[nodiscard]] size_t offset() const noexcept { return offset_; }

private:
    size_t offset_;
};
} // namespace abigate
