/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <array>
#include <filesystem>
#include <fstream>
#include <nbt/common/test.hpp>
#include <nbt/stream.hpp>

using namespace nbt;

suite stream_suite = [] {
    "stream"_test = [] {
        "buffer"_test = [] {
            const auto data = uint8_vector::from_hex("0102030405");
            buffer_read_stream s { data };
            std::array<uint8_t, 3> buf {};
            test_same(size_t { 3 }, s.try_read(buf));
            expect(buf == std::array<uint8_t, 3> { 1, 2, 3 });
            test_same(size_t { 2 }, s.try_read(buf));
            test_same(uint8_t { 5 }, buf[1]);
            test_same(size_t { 0 }, s.try_read(buf));
            test_same(size_t { 5 }, s.consumed());
            test_same(size_t { 0 }, s.remaining());
        };
        "read_all"_test = [] {
            uint8_vector data {};
            for (size_t i = 0; i < 0x18000; ++i)
                data << static_cast<uint8_t>(i * 7);
            buffer_read_stream s { data };
            expect(read_all(s) == data);
        };
        "file"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "nbt-stream-test.bin").string();
            {
                std::ofstream os { path, std::ios::binary };
                os << "hello, file";
            }
            {
                file_read_stream s { path };
                test_same(path, s.path());
                std::array<uint8_t, 5> buf {};
                test_same(size_t { 5 }, s.try_read(buf));
                test_same(std::string_view { "hello" }, buffer { buf.data(), buf.size() }.string_view());
            }
            test_same(std::string { "hello, file" }, file::read(path).str());
            std::filesystem::remove(path);
        };
        "missing file"_test = [] {
            expect(throws<error_sys>([] { file_read_stream s { "./this-file-does-not-exist.nbt" }; }));
        };
    };
};
