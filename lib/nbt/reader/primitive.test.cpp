/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <algorithm>
#include <cmath>
#include <limits>
#include <nbt/common/test.hpp>
#include <nbt/reader/primitive.hpp>

using namespace nbt;
using namespace nbt::reader;

namespace {
    // splits every request into reads of at most max_read bytes
    struct chunked_stream: read_stream {
        chunked_stream(const buffer data, const size_t max_read): _data { data }, _max_read { max_read }
        {
        }

        size_t try_read(const std::span<uint8_t> buf) override
        {
            ++num_reads;
            return _data.try_read(buf.subspan(0, std::min(buf.size(), _max_read)));
        }

        size_t num_reads = 0;
    private:
        buffer_read_stream _data;
        size_t _max_read;
    };

    struct broken_stream: read_stream {
        size_t try_read(const std::span<uint8_t> buf) override
        {
            return buf.size() + 1;
        }
    };
}

suite reader_primitive_suite = [] {
    "reader::primitive"_test = [] {
        "signed"_test = [] {
            const auto bytes = uint8_vector::from_hex("000100000200FFFFDE");
            buffer_read_stream s { bytes };
            cursor c { s };
            test_same(int16_t { 0x01 }, c.read_number<int16_t>());
            test_same(int32_t { 0x200 }, c.read_number<int32_t>());
            test_same(int16_t { -1 }, c.read_number<int16_t>());
            test_same(uint64_t { 8 }, c.offset());
            expect(throws<unexpected_eof_error>([&] { c.read_number<int16_t>(); }));
        };
        "unsigned"_test = [] {
            const auto bytes = uint8_vector::from_hex("0304FDFE");
            buffer_read_stream s { bytes };
            cursor c { s };
            test_same(uint16_t { 0x304 }, c.read_number<uint16_t>());
            test_same(uint16_t { 0xFDFE }, c.read_number<uint16_t>());
        };
        "wide integers"_test = [] {
            const auto bytes = uint8_vector::from_hex("80000000000000007FFFFFFF80");
            buffer_read_stream s { bytes };
            cursor c { s };
            test_same(std::numeric_limits<int64_t>::min(), c.read_number<int64_t>());
            test_same(std::numeric_limits<int32_t>::max(), c.read_number<int32_t>());
            test_same(int8_t { -128 }, c.read_number<int8_t>());
        };
        "floating point"_test = [] {
            const auto bytes = uint8_vector::from_hex("3FC00000C0490FDB400921FB54442D187FF0000000000000");
            buffer_read_stream s { bytes };
            cursor c { s };
            test_same(1.5F, c.read_number<float>());
            test_same(-3.14159265F, c.read_number<float>());
            test_same(3.141592653589793, c.read_number<double>());
            const auto inf = c.read_number<double>();
            expect(std::isinf(inf) && inf > 0);
        };
        "fixed-width fields survive partial reads"_test = [] {
            const auto bytes = uint8_vector::from_hex("0102030405060708");
            chunked_stream s { bytes, 3 };
            cursor c { s };
            test_same(int64_t { 0x0102030405060708LL }, c.read_number<int64_t>());
            test_same(size_t { 3 }, s.num_reads);
        };
        "tag types"_test = [] {
            const auto bytes = uint8_vector::from_hex("000A0B0C");
            buffer_read_stream s { bytes };
            cursor c { s };
            test_same(tag_type::end, c.read_tag_type());
            test_same(tag_type::compound, c.read_tag_type());
            test_same(tag_type::int_array, c.read_tag_type());
            expect(throws<unknown_tag_type_error>([&] { c.read_tag_type(); }));
        };
        "string"_test = [] {
            const auto bytes = uint8_vector::from_hex("000568656C6C6F0000");
            buffer_read_stream s { bytes };
            cursor c { s };
            test_same(std::string { "hello" }, c.read_string());
            test_same(std::string {}, c.read_string());
            test_same(uint64_t { 9 }, c.offset());
        };
        "string length is unsigned"_test = [] {
            uint8_vector bytes = uint8_vector::from_hex("8000");
            bytes.resize(bytes.size() + 0x8000, 'a');
            buffer_read_stream s { bytes };
            cursor c { s };
            test_same(size_t { 0x8000 }, c.read_string().size());
        };
        "string payload short read"_test = [] {
            const auto bytes = uint8_vector::from_hex("000568656C6C6F");
            {
                chunked_stream s { bytes, 2 };
                cursor c { s };
                expect(throws<unexpected_eof_error>([&] { c.read_string(); }));
            }
            {
                chunked_stream s { bytes, 2 };
                cursor c { s, reader_config { .fill_partial_reads=true } };
                test_same(std::string { "hello" }, c.read_string());
            }
        };
        "invalid utf-8"_test = [] {
            const auto bytes = uint8_vector::from_hex("000361C328");
            buffer_read_stream s { bytes };
            cursor c { s };
            expect(throws<invalid_encoding_error>([&] { c.read_string(); }));
        };
        "byte array"_test = [] {
            const auto bytes = uint8_vector::from_hex("00000004DEADBEEF00000000");
            buffer_read_stream s { bytes };
            cursor c { s };
            expect(c.read_byte_array() == byte_array { 0xDE, 0xAD, 0xBE, 0xEF });
            expect(c.read_byte_array().empty());
        };
        "large byte array"_test = [] {
            static constexpr size_t size = cursor::max_chunk_size * 2 + 17;
            uint8_vector bytes = uint8_vector::from_hex("00020011");
            for (size_t i = 0; i < size; ++i)
                bytes << static_cast<uint8_t>(i);
            buffer_read_stream s { bytes };
            cursor c { s };
            const auto ba = c.read_byte_array();
            test_same(size, ba.size());
            test_same(uint8_t { 16 }, ba.back());
        };
        "int array"_test = [] {
            const auto bytes = uint8_vector::from_hex("00000003FFFFFFFF000000007FFFFFFF");
            buffer_read_stream s { bytes };
            cursor c { s };
            expect(c.read_int_array() == int_array { -1, 0, std::numeric_limits<int32_t>::max() });
        };
        "int array truncated"_test = [] {
            const auto bytes = uint8_vector::from_hex("00000003FFFFFFFF0000");
            buffer_read_stream s { bytes };
            cursor c { s };
            expect(throws<unexpected_eof_error>([&] { c.read_int_array(); }));
        };
        "simple values"_test = [] {
            const auto bytes = uint8_vector::from_hex("FE" "0003616263" "00000001" "00000007");
            buffer_read_stream s { bytes };
            cursor c { s };
            test_same(value { int8_t { -2 } }, c.read_simple(tag_type::byte));
            test_same(value { std::string { "abc" } }, c.read_simple(tag_type::string));
            test_same(value { int_array { 7 } }, c.read_simple(tag_type::int_array));
            expect(throws<invalid_tag_type_error>([&] { c.read_simple(tag_type::compound); }));
            expect(throws<invalid_tag_type_error>([&] { c.read_simple(tag_type::end); }));
        };
        "simple lists"_test = [] {
            const auto bytes = uint8_vector::from_hex("0001FFFF" "3F800000");
            buffer_read_stream s { bytes };
            cursor c { s };
            expect(c.read_simple_list(tag_type::short_, 2).as<int16_t>() == std::vector<int16_t> { 1, -1 });
            expect(c.read_simple_list(tag_type::float_, 1).as<float>() == std::vector<float> { 1.0F });
            expect(c.read_simple_list(tag_type::long_, 0).as<int64_t>().empty());
            expect(throws<invalid_tag_type_error>([&] { c.read_simple_list(tag_type::list, 1); }));
        };
        "eof"_test = [] {
            const auto bytes = uint8_vector::from_hex("01");
            buffer_read_stream s { bytes };
            cursor c { s };
            expect(!c.at_eof());
            expect(c.at_eof());
        };
        "source overreports"_test = [] {
            broken_stream s {};
            cursor c { s };
            expect(throws<transport_error>([&] { c.read_number<int32_t>(); }));
        };
    };
};
