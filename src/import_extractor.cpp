#include "abigate/import_extractor.hpp"

#include <array>
#include <memory>
#include <span>
#include <string>
#include <utility>

#include "abigate/binary_reader.hpp"

namespace abigate
{
namespace
{
constexpr uint32_t kWasmMagic = 0x6D736100; // "\0asm"
constexpr uint32_t kWasmVersion = 0x00000001;

constexpr uint8_t kCustomSectionId = 0;
constexpr uint8_t kTypeSectionId = 1;
constexpr uint8_t kImportSectionId = 2;
constexpr uint8_t kMaxSectionId = 12;

// Position of each known section id in the canonical section order. The data
// count section (12) sits between element (9) and code (10).
constexpr std::array<uint8_t, kMaxSectionId + 1> kSectionRank = {
    0,  // custom
    1,  // type
    2,  // import
    3,  // function
    4,  // table
    5,  // memory
    6,  // global
    7,  // export
    8,  // start
    9,  // element
    11, // code
    12, // data
    10, // data count
};

// Rejects overlong encodings, surrogates, code points above U+10FFFF and
// truncated sequences.
bool is_valid_utf8(const std::string& text)
{
    size_t i = 0;
    const auto size = text.size();
    while (i < size)
    {
        const auto lead = static_cast<uint8_t>(text[i]);
        if (lead < 0x80)
        {
            ++i;
            continue;
        }

        size_t length = 0;
        uint32_t code_point = 0;
        uint32_t min_code_point = 0;
        if ((lead & 0xE0U) == 0xC0U)
        {
            length = 2;
            code_point = lead & 0x1FU;
            min_code_point = 0x80;
        }
        else if ((lead & 0xF0U) == 0xE0U)
        {
            length = 3;
            code_point = lead & 0x0FU;
            min_code_point = 0x800;
        }
        else if ((lead & 0xF8U) == 0xF0U)
        {
            length = 4;
            code_point = lead & 0x07U;
            min_code_point = 0x10000;
        }
        else
        {
            return false;
        }

        if (size - i < length)
        {
            return false;
        }
        for (size_t j = 1; j < length; ++j)
        {
            const auto continuation = static_cast<uint8_t>(text[i + j]);
            if ((continuation & 0xC0U) != 0x80U)
            {
                return false;
            }
            code_point = (code_point << 6U) | (continuation & 0x3FU);
        }

        if (code_point < min_code_point || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF))
        {
            return false;
        }
        i += length;
    }
    return true;
}

struct Section
{
    uint8_t id{0};
    BinaryReader payload;
};

class ImportParser
{
public:
    explicit ImportParser(std::span<const uint8_t> data)
        : reader_(data)
    {
    }

    std::vector<ImportDescriptor> parse()
    {
        parse_header();
        uint8_t last_rank = 0;
        while (!reader_.eof())
        {
            auto section = read_section();
            if (section.id == kCustomSectionId)
            {
                parse_custom_section(section.payload);
                continue;
            }

            const auto rank = kSectionRank[section.id];
            if (rank <= last_rank)
            {
                reader_.fail("section " + std::to_string(section.id) + " is duplicated or out of order");
            }
            last_rank = rank;

            switch (section.id)
            {
            case kTypeSectionId:
                parse_type_section(section.payload);
                break;
            case kImportSectionId:
                parse_import_section(section.payload);
                break;
            default:
                // Not needed for import validation; framing was checked by read_section.
                break;
            }
        }
        return std::move(imports_);
    }

private:
    void parse_header()
    {
        if (reader_.remaining() < 8)
        {
            reader_.fail("module is too short to hold a header");
        }

        auto magic = reader_.read_u32();
        if (magic != kWasmMagic)
        {
            throw MalformedModule("invalid WASM magic number", 0);
        }

        auto version = reader_.read_u32();
        if (version != kWasmVersion)
        {
            throw MalformedModule("unsupported WASM version " + std::to_string(version), 4);
        }
    }

    Section read_section()
    {
        const auto id_offset = reader_.absolute_offset();
        auto id = reader_.read_u8();
        if (id > kMaxSectionId)
        {
            throw MalformedModule("invalid section id " + std::to_string(id), id_offset);
        }
        auto size = reader_.read_varuint32();
        if (size > reader_.remaining())
        {
            reader_.fail("section " + std::to_string(id) + " size " + std::to_string(size) +
                         " exceeds module bounds");
        }
        return Section{id, reader_.subreader(size)};
    }

    void parse_custom_section(BinaryReader& section_reader)
    {
        read_name(section_reader, "custom section name");
    }

    void parse_type_section(BinaryReader& section_reader)
    {
        auto count = section_reader.read_varuint32();
        for (uint32_t i = 0; i < count; ++i)
        {
            auto form = section_reader.read_u8();
            if (form != 0x60)
            {
                section_reader.fail("expected function type form 0x60");
            }
            FunctionSignature type;
            read_value_types(section_reader, type.params);
            read_value_types(section_reader, type.results);
            types_.push_back(std::make_shared<const FunctionSignature>(std::move(type)));
        }
        expect_consumed(section_reader, "type");
    }

    void read_value_types(BinaryReader& reader, std::vector<ValueType>& out)
    {
        auto count = reader.read_varuint32();
        if (count > reader.remaining())
        {
            reader.fail("value type count exceeds section bounds");
        }
        out.reserve(count);
        for (uint32_t i = 0; i < count; ++i)
        {
            out.push_back(read_value_type(reader));
        }
    }

    ValueType read_value_type(BinaryReader& reader)
    {
        auto byte = reader.read_u8();
        if (!is_value_type(byte))
        {
            reader.fail("invalid value type " + std::to_string(byte));
        }
        return static_cast<ValueType>(byte);
    }

    Limits read_limits(BinaryReader& reader, bool allow_shared)
    {
        Limits limits;
        auto flags = reader.read_u8();
        if (flags > (allow_shared ? 0x03U : 0x01U))
        {
            reader.fail("unsupported limits flags " + std::to_string(flags));
        }
        limits.shared = (flags & 0x2U) != 0;
        limits.min = reader.read_varuint32();
        if ((flags & 0x1U) != 0)
        {
            limits.max = reader.read_varuint32();
        }
        return limits;
    }

    void parse_import_section(BinaryReader& section_reader)
    {
        auto count = section_reader.read_varuint32();
        // Each entry needs at least four bytes, so a larger count cannot be honest.
        if (count > section_reader.remaining() / 4)
        {
            section_reader.fail("import count " + std::to_string(count) + " exceeds section bounds");
        }
        imports_.reserve(count);
        for (uint32_t i = 0; i < count; ++i)
        {
            ImportDescriptor import;
            import.module_name = read_name(section_reader, "import module name");
            import.name = read_name(section_reader, "import field name");

            auto kind = section_reader.read_u8();
            switch (kind)
            {
            case 0x00:
                import.kind = ImportKind::Function;
                import.type_index = section_reader.read_varuint32();
                if (import.type_index >= types_.size())
                {
                    section_reader.fail("import type index " + std::to_string(import.type_index) +
                                        " out of range");
                }
                import.signature = types_[import.type_index];
                break;
            case 0x01:
            {
                import.kind = ImportKind::Table;
                auto element_type = section_reader.read_u8();
                if (element_type != 0x70 && element_type != 0x6F)
                {
                    section_reader.fail("invalid table element type " + std::to_string(element_type));
                }
                import.table_type.element_type = static_cast<ValueType>(element_type);
                import.table_type.limits = read_limits(section_reader, false);
                break;
            }
            case 0x02:
                import.kind = ImportKind::Memory;
                import.memory_type.limits = read_limits(section_reader, true);
                break;
            case 0x03:
            {
                import.kind = ImportKind::Global;
                import.global_type.value_type = read_value_type(section_reader);
                auto mutability = section_reader.read_u8();
                if (mutability > 1)
                {
                    section_reader.fail("invalid global mutability " + std::to_string(mutability));
                }
                import.global_type.is_mutable = mutability == 1;
                break;
            }
            default:
                section_reader.fail("invalid import kind " + std::to_string(kind));
            }
            imports_.push_back(std::move(import));
        }
        expect_consumed(section_reader, "import");
    }

    std::string read_name(BinaryReader& reader, const char* what)
    {
        const auto start = reader.absolute_offset();
        auto name = reader.read_name();
        if (!is_valid_utf8(name))
        {
            throw MalformedModule(std::string(what) + " is not valid UTF-8", start);
        }
        return name;
    }

    void expect_consumed(const BinaryReader& section_reader, const char* section_name)
    {
        if (!section_reader.eof())
        {
            section_reader.fail(std::string(section_name) + " section size mismatch: " +
                                std::to_string(section_reader.remaining()) + " trailing byte(s)");
        }
    }

    BinaryReader reader_;
    std::vector<std::shared_ptr<const FunctionSignature>> types_;
    std::vector<ImportDescriptor> imports_;
};
} // namespace

std::vector<ImportDescriptor> extract_imports(std::span<const uint8_t> bytes)
{
    ImportParser parser(bytes);
    return parser.parse();
}

} // namespace abigate
