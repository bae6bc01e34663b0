#include "abigate/build_pipeline.hpp"
#include "abigate/import_extractor.hpp"
#include "abigate/policy_engine.hpp"

#include "test_support.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace abigate_test
{
namespace
{
using abigate::ImportKind;
using abigate::ValueType;

std::vector<uint8_t> header_only()
{
    return WasmBuilder{}.build();
}

void zero_imports()
{
    auto imports = abigate::extract_imports(header_only());
    require(imports.empty(), "header-only module has no imports");
}

void declaration_order_and_kinds()
{
    WasmBuilder builder;
    auto log = builder.add_type({ValueType::I32, ValueType::I32}, {});
    auto now = builder.add_type({}, {ValueType::I64});
    builder.import_function("spacetime_10.0", "_console_log", log)
        .import_memory("env", "memory", 1, 16)
        .import_global("env", "stack_pointer", ValueType::I32, true)
        .import_table("env", "table", 4)
        .import_function("spacetime_10.0", "now", now);

    auto imports = abigate::extract_imports(builder.build());
    require_eq(size_t{5}, imports.size(), "five imports extracted");

    require_eq(std::string("_console_log"), imports[0].name, "first import name");
    require(imports[0].kind == ImportKind::Function, "first import is a function");
    require(imports[0].signature != nullptr, "function signature resolved");
    require_eq(size_t{2}, imports[0].signature->params.size(), "two params");
    require_eq(std::string("func (i32, i32) -> ()"), abigate::describe_import_type(imports[0]), "rendered type");

    require(imports[1].kind == ImportKind::Memory, "second import is memory");
    require_eq(uint32_t{1}, imports[1].memory_type.limits.min, "memory min");
    require(imports[1].memory_type.limits.max == 16U, "memory max");

    require(imports[2].kind == ImportKind::Global, "third import is a global");
    require(imports[2].global_type.is_mutable, "global is mutable");

    require(imports[3].kind == ImportKind::Table, "fourth import is a table");
    require_eq(uint32_t{4}, imports[3].table_type.limits.min, "table min");

    require_eq(std::string("now"), imports[4].name, "last import name");
    require_eq(uint32_t{1}, imports[4].type_index, "last import type index");
    require(imports[4].signature->results == std::vector<ValueType>{ValueType::I64}, "now returns i64");
}

// Small import entries may all name one very large type.
void large_type_shared_by_many_imports()
{
    constexpr size_t kParams = 20000;
    constexpr size_t kImports = 5000;

    WasmBuilder builder;
    auto wide = builder.add_type(std::vector<ValueType>(kParams, ValueType::I32), {});
    for (size_t i = 0; i < kImports; ++i)
    {
        builder.import_function("env", "f", wide);
    }

    auto imports = abigate::extract_imports(builder.build());
    require_eq(kImports, imports.size(), "every import extracted");
    const auto* shared = imports.front().signature.get();
    require(shared != nullptr && shared->params.size() == kParams, "signature resolved");
    for (const auto& import : imports)
    {
        require(import.signature.get() == shared, "imports of one type share its signature");
    }
    require_eq(long{kImports}, imports.front().signature.use_count(), "no hidden signature copies");

    auto outcome = abigate::validate_module(builder.build(), abigate::default_policy_engine());
    require_eq(kImports, outcome.failures.size(), "each import reported");
    require(outcome.failures.back().result.descriptor.signature.get() != nullptr &&
                outcome.failures.back().result.descriptor.signature->params.size() == kParams,
            "reported descriptor keeps its signature");

    require_eq(std::string("func (type 0: 20000 params, 0 results)"), abigate::describe_import_type(imports.front()),
               "long signature summarised");
}

void repeated_name_different_kinds()
{
    WasmBuilder builder;
    auto type = builder.add_type({}, {});
    builder.import_function("env", "thing", type).import_global("env", "thing", ValueType::I32, false);

    auto imports = abigate::extract_imports(builder.build());
    require_eq(size_t{2}, imports.size(), "both entries kept");
    require(imports[0].kind == ImportKind::Function, "first is function");
    require(imports[1].kind == ImportKind::Global, "second is global");
}

void skips_custom_and_unrelated_sections()
{
    WasmBuilder builder;
    auto type = builder.add_type({}, {});
    builder.import_function("spacetime_10.0", "_iter_drop", type)
        .add_section(0x03, {0x01, 0x00}) // function
        .add_section(0x07, {0x00})       // export
        .add_custom_section("name", {0x01, 0x02, 0x03})
        .add_section(0x0A, {0x01, 0x02, 0x00, 0x0B}); // code

    auto imports = abigate::extract_imports(builder.build());
    require_eq(size_t{1}, imports.size(), "one import among other sections");
}

void custom_section_before_type()
{
    auto bytes = header_only();
    std::vector<uint8_t> custom;
    WasmBuilder::append_name(custom, "producers");
    WasmBuilder::append_section(bytes, 0x00, custom);

    WasmBuilder imports_only;
    auto type = imports_only.add_type({}, {});
    imports_only.import_function("wbg", "__wbindgen_throw", type);
    auto tail = imports_only.build();
    bytes.insert(bytes.end(), tail.begin() + 8, tail.end());

    auto imports = abigate::extract_imports(bytes);
    require_eq(size_t{1}, imports.size(), "custom section does not hide imports");
}

void rejects_bad_header()
{
    require_malformed([] { abigate::extract_imports(std::vector<uint8_t>{}); }, "empty input");
    require_malformed([] { abigate::extract_imports(std::vector<uint8_t>{0x00, 0x61, 0x73}); }, "short header");
    require_malformed(
        [] {
            abigate::extract_imports(std::vector<uint8_t>{0x7F, 0x45, 0x4C, 0x46, 0x01, 0x00, 0x00, 0x00});
        },
        "ELF magic");
    require_malformed(
        [] {
            abigate::extract_imports(std::vector<uint8_t>{0x00, 0x61, 0x73, 0x6D, 0x02, 0x00, 0x00, 0x00});
        },
        "version 2");
}

void rejects_invalid_section_id()
{
    auto bytes = header_only();
    WasmBuilder::append_section(bytes, 13, {0x00});
    require_malformed([&] { abigate::extract_imports(bytes); }, "section id 13");
}

void rejects_section_overrun()
{
    auto bytes = header_only();
    bytes.insert(bytes.end(), {0x01, 0x10, 0x00});
    require_malformed([&] { abigate::extract_imports(bytes); }, "section larger than module");
}

void rejects_trailing_import_bytes()
{
    WasmBuilder builder;
    auto type = builder.add_type({}, {});
    builder.import_function("spacetime_10.0", "_iter_drop", type);
    auto bytes = builder.build();

    // Grow the import section payload by one junk byte.
    WasmBuilder types_only;
    types_only.add_type({}, {});
    const auto import_section = types_only.build().size();
    bytes[import_section + 1] += 1;
    bytes.push_back(0x00);

    require_malformed([&] { abigate::extract_imports(bytes); }, "import section length mismatch");
}

void rejects_overstated_import_count()
{
    auto bytes = header_only();
    std::vector<uint8_t> payload;
    WasmBuilder::append_leb(payload, 1000);
    WasmBuilder::append_name(payload, "env");
    WasmBuilder::append_name(payload, "f");
    payload.insert(payload.end(), {0x02, 0x00, 0x01});
    WasmBuilder::append_section(bytes, 0x02, payload);
    require_malformed([&] { abigate::extract_imports(bytes); }, "count larger than entries");
}

void rejects_section_order_violations()
{
    WasmBuilder duplicated;
    auto type = duplicated.add_type({}, {});
    duplicated.import_function("env", "a", type);
    auto bytes = duplicated.build();
    std::vector<uint8_t> empty_imports = {0x00};
    WasmBuilder::append_section(bytes, 0x02, empty_imports);
    require_malformed([&] { abigate::extract_imports(bytes); }, "duplicate import section");

    auto reordered = header_only();
    WasmBuilder::append_section(reordered, 0x03, {0x00});
    WasmBuilder::append_section(reordered, 0x02, {0x00});
    require_malformed([&] { abigate::extract_imports(reordered); }, "import section after function section");
}

void rejects_bad_import_entries()
{
    auto with_entry = [](const std::vector<uint8_t>& tail) {
        auto bytes = header_only();
        WasmBuilder::append_section(bytes, 0x01, {0x01, 0x60, 0x00, 0x00});
        std::vector<uint8_t> payload = {0x01};
        WasmBuilder::append_name(payload, "env");
        WasmBuilder::append_name(payload, "x");
        payload.insert(payload.end(), tail.begin(), tail.end());
        WasmBuilder::append_section(bytes, 0x02, payload);
        return bytes;
    };

    require_malformed([&] { abigate::extract_imports(with_entry({0x04, 0x00})); }, "import kind 4");
    require_malformed([&] { abigate::extract_imports(with_entry({0x00, 0x01})); }, "type index out of range");
    require_malformed([&] { abigate::extract_imports(with_entry({0x03, 0x40, 0x00})); }, "bad global type");
    require_malformed([&] { abigate::extract_imports(with_entry({0x03, 0x7F, 0x02})); }, "bad mutability");
    require_malformed([&] { abigate::extract_imports(with_entry({0x01, 0x40, 0x00, 0x00})); }, "bad table type");
    require_malformed([&] { abigate::extract_imports(with_entry({0x02, 0x08, 0x00})); }, "bad limits flags");
    require_malformed([&] { abigate::extract_imports(with_entry({0x00, 0x80, 0x80, 0x80, 0x80, 0x80, 0x00})); },
                      "over-long LEB128");

    auto valid = abigate::extract_imports(with_entry({0x00, 0x00}));
    require_eq(size_t{1}, valid.size(), "control entry parses");
}

void rejects_invalid_utf8_names()
{
    for (const std::string name : {std::string("\xC0\xAF"), std::string("\xED\xA0\x80"), std::string("abc\xE2\x82")})
    {
        WasmBuilder builder;
        auto type = builder.add_type({}, {});
        builder.import_function(name, "f", type);
        require_malformed([&] { abigate::extract_imports(builder.build()); }, "invalid UTF-8 namespace");
    }

    WasmBuilder accented;
    auto type = accented.add_type({}, {});
    accented.import_function("m\xC3\xB3" "dulo", "\xE2\x9C\x93", type);
    require_eq(size_t{1}, abigate::extract_imports(accented.build()).size(), "valid multi-byte names accepted");
}

void truncation_inside_imports_is_malformed()
{
    WasmBuilder builder;
    auto type = builder.add_type({ValueType::I32}, {ValueType::I32});
    builder.import_function("spacetime_10.0", "_buffer_len", type).import_function("wbg", "__wbindgen_describe", type);
    const auto bytes = builder.build();

    WasmBuilder types_only;
    types_only.add_type({ValueType::I32}, {ValueType::I32});
    const auto boundary = types_only.build().size();

    for (size_t length = 0; length < bytes.size(); ++length)
    {
        std::vector<uint8_t> prefix(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(length));
        if (length == 8 || length == boundary)
        {
            // Section boundaries: a complete module without the import section.
            require(abigate::extract_imports(prefix).empty(), "boundary prefix has no imports");
            continue;
        }
        require_malformed([&] { abigate::extract_imports(prefix); },
                          "prefix of " + std::to_string(length) + " bytes");
    }
}

void mutated_bytes_never_escape()
{
    auto original = make_bindgen_module("spacetime_10.0", "now");
    uint32_t state = 0x2545F491U;
    auto next = [&state] {
        state ^= state << 13U;
        state ^= state >> 17U;
        state ^= state << 5U;
        return state;
    };

    for (int round = 0; round < 2000; ++round)
    {
        auto bytes = original;
        const auto flips = 1 + next() % 4;
        for (uint32_t i = 0; i < flips; ++i)
        {
            bytes[8 + next() % (bytes.size() - 8)] = static_cast<uint8_t>(next());
        }

        bool first_malformed = false;
        size_t first_count = 0;
        try
        {
            first_count = abigate::extract_imports(bytes).size();
        }
        catch (const abigate::MalformedModule&)
        {
            first_malformed = true;
        }

        bool second_malformed = false;
        size_t second_count = 0;
        try
        {
            second_count = abigate::extract_imports(bytes).size();
        }
        catch (const abigate::MalformedModule&)
        {
            second_malformed = true;
        }

        require(first_malformed == second_malformed && first_count == second_count,
                "extraction is deterministic for round " + std::to_string(round));
    }
}

void malformed_reports_offset()
{
    auto bytes = header_only();
    WasmBuilder::append_section(bytes, 13, {0x00});
    try
    {
        abigate::extract_imports(bytes);
    }
    catch (const abigate::MalformedModule& ex)
    {
        require_eq(size_t{8}, ex.offset(), "offset of the bad section id");
        require(contains(ex.what(), "invalid section id 13"), "message names the section id");
        return;
    }
    throw TestFailure("expected MalformedModule");
}
} // namespace

Suite extractor_suite()
{
    return {"extractor",
            {
                {"zero_imports", zero_imports},
                {"declaration_order_and_kinds", declaration_order_and_kinds},
                {"large_type_shared_by_many_imports", large_type_shared_by_many_imports},
                {"repeated_name_different_kinds", repeated_name_different_kinds},
                {"skips_custom_and_unrelated_sections", skips_custom_and_unrelated_sections},
                {"custom_section_before_type", custom_section_before_type},
                {"rejects_bad_header", rejects_bad_header},
                {"rejects_invalid_section_id", rejects_invalid_section_id},
                {"rejects_section_overrun", rejects_section_overrun},
                {"rejects_trailing_import_bytes", rejects_trailing_import_bytes},
                {"rejects_overstated_import_count", rejects_overstated_import_count},
                {"rejects_section_order_violations", rejects_section_order_violations},
                {"rejects_bad_import_entries", rejects_bad_import_entries},
                {"rejects_invalid_utf8_names", rejects_invalid_utf8_names},
                {"truncation_inside_imports_is_malformed", truncation_inside_imports_is_malformed},
                {"mutated_bytes_never_escape", mutated_bytes_never_escape},
                {"malformed_reports_offset", malformed_reports_offset},
            }};
}

} // namespace abigate_test
