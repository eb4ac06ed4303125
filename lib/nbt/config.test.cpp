/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <filesystem>
#include <fstream>
#include <nbt/common/test.hpp>
#include <nbt/config.hpp>

using namespace nbt;

suite config_suite = [] {
    "config"_test = [] {
        "defaults"_test = [] {
            const config_json cfg { json::object {} };
            expect(cfg.reader() == reader_config {});
            const auto fo = cfg.format();
            test_same(format_options {}.max_depth, fo.max_depth);
            test_same(format_options {}.max_seq_to_expand, fo.max_seq_to_expand);
        };
        "values"_test = [] {
            const config_json cfg { json::object { { "require_eof", true }, { "max_depth", 3 }, { "max_items", 10 } } };
            const auto rc = cfg.reader();
            expect(rc.require_eof);
            expect(!rc.fill_partial_reads);
            test_same(size_t { 3 }, cfg.format().max_depth);
            test_same(size_t { 10 }, cfg.format().max_seq_to_expand);
            expect(cfg.json().contains("require_eof"));
        };
        "unknown element"_test = [] {
            expect(throws<error>([] { config_json cfg { json::object { { "max_dept", 3 } } }; }));
        };
        "type mismatch"_test = [] {
            const config_json c1 { json::object { { "require_eof", 1 } } };
            expect(throws<error>([&] { c1.reader(); }));
            const config_json c2 { json::object { { "max_items", -1 } } };
            expect(throws<error>([&] { c2.format(); }));
            const config_json c3 { json::object { { "max_depth", "deep" } } };
            expect(throws<error>([&] { c3.format(); }));
        };
        "file"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "nbt-config-test.json").string();
            {
                std::ofstream os { path, std::ios::binary };
                os << R"({ "fill_partial_reads": true, "max_items": 4 })";
            }
            const config_file cfg { path };
            expect(cfg.reader().fill_partial_reads);
            test_same(size_t { 4 }, cfg.format().max_seq_to_expand);
            {
                std::ofstream os { path, std::ios::binary };
                os << "[1, 2]";
            }
            expect(throws<error>([&] { config_file bad { path }; }));
            std::filesystem::remove(path);
        };
    };
};
