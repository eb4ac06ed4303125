/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <sstream>
#include <nbt/common/test.hpp>
#include <nbt/json.hpp>
#include <nbt/reader.hpp>

using namespace nbt;

suite json_suite = [] {
    "json"_test = [] {
        "hello world"_test = [] {
            const auto bytes = uint8_vector::from_hex("0A000B68656C6C6F20776F726C640800046E616D65000942616E616E72616D6100");
            const auto root = reader::parse(bytes);
            const auto j = json::to_json(root);
            test_same(std::string_view { "hello world" }, std::string_view { j.at("name").as_string() });
            test_same(std::string_view { "TAG_Compound" }, std::string_view { j.at("type").as_string() });
            test_same(std::string_view { "Bananrama" }, std::string_view { j.at("value").at("name").as_string() });
            std::ostringstream os {};
            json::save_pretty(os, j);
            test_same(std::string {
                "{\n"
                "  \"name\": \"hello world\",\n"
                "  \"type\": \"TAG_Compound\",\n"
                "  \"value\": {\n"
                "    \"name\": \"Bananrama\"\n"
                "  }\n"
                "}"
            }, os.str());
        };
        "numbers and arrays"_test = [] {
            compound c {};
            c.emplace("b", int8_t { -1 });
            c.emplace("l", int64_t { 1LL << 40 });
            c.emplace("f", 0.5F);
            c.emplace("ba", byte_array { 0xFF, 0x01 });
            c.emplace("ia", int_array { -7 });
            c.emplace("empty", list {});
            const auto j = json::to_json(value { std::move(c) });
            const auto &obj = j.as_object();
            test_same(int64_t { -1 }, obj.at("b").to_number<int64_t>());
            test_same(int64_t { 1LL << 40 }, obj.at("l").to_number<int64_t>());
            test_same(0.5, obj.at("f").to_number<double>());
            test_same(std::string { "[-1,1]" }, json::serialize(obj.at("ba")));
            test_same(std::string { "[-7]" }, json::serialize(obj.at("ia")));
            test_same(std::string { "[]" }, json::serialize(obj.at("empty")));
        };
        "depth cap"_test = [] {
            compound inner {};
            inner.emplace("x", int32_t { 1 });
            compound outer {};
            outer.emplace("c", std::move(inner));
            outer.emplace("l", list { std::vector<list> { list { std::vector<int16_t> { 1 } } } });
            const value v { std::move(outer) };
            test_same(std::string { R"({"c":{"x":1},"l":[[1]]})" }, json::serialize(json::to_json(v)));
            test_same(std::string { R"({"c":"...","l":"..."})" }, json::serialize(json::to_json(v, 1)));
            test_same(std::string { R"("...")" }, json::serialize(json::to_json(v, 0)));
        };
        "save_pretty empty"_test = [] {
            std::ostringstream os {};
            json::save_pretty(os, json::array {});
            os << ' ';
            json::save_pretty(os, json::object {});
            test_same(std::string { "[] {}" }, os.str());
        };
    };
};
