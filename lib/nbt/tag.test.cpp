/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <nbt/common/test.hpp>
#include <nbt/tag.hpp>

using namespace nbt;

suite tag_suite = [] {
    "tag"_test = [] {
        "codes"_test = [] {
            for (uint8_t code = 0; code <= max_tag_code; ++code) {
                const auto typ = tag_type_from_code(code);
                expect(typ.has_value()) << static_cast<int>(code);
                if (typ)
                    test_same(code, static_cast<uint8_t>(*typ));
            }
            expect(!tag_type_from_code(12));
            expect(!tag_type_from_code(0xFF));
        };
        "classification"_test = [] {
            test_same(tag_class::end, classify(tag_type::end));
            test_same(tag_class::composite, classify(tag_type::list));
            test_same(tag_class::composite, classify(tag_type::compound));
            for (const auto typ: { tag_type::byte, tag_type::short_, tag_type::int_, tag_type::long_, tag_type::float_,
                    tag_type::double_, tag_type::byte_array, tag_type::string, tag_type::int_array }) {
                expect(is_simple(typ)) << tag_name(typ);
            }
            expect(!is_simple(tag_type::end));
            expect(!is_simple(tag_type::list));
            expect(!is_simple(tag_type::compound));
        };
        "names"_test = [] {
            test_same(std::string_view { "TAG_End" }, tag_name(tag_type::end));
            test_same(std::string_view { "TAG_Byte_Array" }, tag_name(tag_type::byte_array));
            test_same(std::string_view { "TAG_Int_Array" }, tag_name(tag_type::int_array));
            test_same(std::string { "TAG_Compound" }, fmt::format("{}", tag_type::compound));
            test_same(std::string { "(unknown tag type 0x0c)" }, fmt::format("{}", static_cast<tag_type>(12)));
        };
    };
};
