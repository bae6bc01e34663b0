#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "abigate/errors.hpp"

namespace abigate
{
class BinaryReader
{
public:
    explicit BinaryReader(std::span<const uint8_t> data, size_t base_offset = 0) noexcept
        : data_(data)
        , base_offset_(base_offset)
    {
    }

    [[nodiscard]] bool eof() const noexcept { return offset_ >= data_.size(); }

    // Offset relative to the start of the whole module, used in diagnostics.
    [[nodiscard]] size_t absolute_offset() const noexcept { return base_offset_ + offset_; }

    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - offset_; }

    uint8_t read_u8()
    {
        ensure_available(1);
        return data_[offset_++];
    }

    uint32_t read_u32()
    {
        ensure_available(4);
        uint32_t value = data_[offset_] | (data_[offset_ + 1] << 8U) | (data_[offset_ + 2] << 16U) |
                         (static_cast<uint32_t>(data_[offset_ + 3]) << 24U);
        offset_ += 4;
        return value;
    }

    uint32_t read_varuint32() { return read_leb_unsigned(32); }

    std::span<const uint8_t> read_bytes(size_t count)
    {
        ensure_available(count);
        auto bytes = data_.subspan(offset_, count);
        offset_ += count;
        return bytes;
    }

    // Returns a reader over the next `count` bytes and moves past them.
    BinaryReader subreader(size_t count)
    {
        const auto start = absolute_offset();
        return BinaryReader(read_bytes(count), start);
    }

    // Length-prefixed name; content is not validated here.
    std::string read_name()
    {
        auto length = read_varuint32();
        auto bytes = read_bytes(length);
        return std::string(bytes.begin(), bytes.end());
    }

    [[noreturn]] void fail(const std::string& message) const
    {
        throw MalformedModule(message, absolute_offset());
    }

private:
    uint32_t read_leb_unsigned(unsigned max_bits)
    {
        const auto start = absolute_offset();
        uint64_t result = 0;
        unsigned shift = 0;
        while (true)
        {
            uint8_t byte = read_u8();
            result |= static_cast<uint64_t>(byte & 0x7FU) << shift;
            shift += 7;
            if ((byte & 0x80U) == 0)
            {
                break;
            }
            if (shift >= max_bits)
            {
                throw MalformedModule("LEB128 overflow", start);
            }
        }
        if (max_bits < 64 && (result >> max_bits) != 0)
        {
            throw MalformedModule("LEB128 value exceeds " + std::to_string(max_bits) + " bits", start);
        }
        return static_cast<uint32_t>(result);
    }

    void ensure_available(size_t count)
    {
        if (count > data_.size() - offset_)
        {
            throw MalformedModule("unexpected end of data", absolute_offset());
        }
    }

    std::span<const uint8_t> data_;
    size_t base_offset_{0};
    size_t offset_{0};
};
} // namespace abigate
