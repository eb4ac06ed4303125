/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <algorithm>
#include <utfcpp/utf8.h>
#include <nbt/reader/primitive.hpp>

namespace nbt::reader {
    size_t cursor::_try_read(const std::span<uint8_t> buf)
    {
        size_t sz = 0;
        try {
            sz = _src.try_read(buf);
        } catch (const read_error &) {
            throw;
        } catch (const std::exception &ex) {
            throw transport_error { _offset, ex };
        }
        if (sz > buf.size()) [[unlikely]]
            throw transport_error { _offset, error(fmt::format("the byte source returned {} bytes for a {}-byte request", sz, buf.size())) };
        _offset += sz;
        return sz;
    }

    void cursor::read_exact(const std::span<uint8_t> buf)
    {
        size_t got = 0;
        while (got < buf.size()) {
            const auto sz = _try_read(buf.subspan(got, std::min(buf.size() - got, max_chunk_size)));
            if (!sz) [[unlikely]]
                throw unexpected_eof_error { _offset, buf.size(), got };
            got += sz;
        }
    }

    void cursor::read_payload(const std::span<uint8_t> buf)
    {
        if (_cfg.fill_partial_reads) {
            read_exact(buf);
            return;
        }
        for (size_t got = 0; got < buf.size(); ) {
            const auto chunk = buf.subspan(got, std::min(buf.size() - got, max_chunk_size));
            const auto sz = _try_read(chunk);
            if (sz != chunk.size()) [[unlikely]]
                throw unexpected_eof_error { _offset, buf.size(), got + sz };
            got += sz;
        }
    }

    tag_type cursor::read_tag_type()
    {
        const auto code = read_tag_code();
        if (const auto typ = tag_type_from_code(code); typ) [[likely]]
            return *typ;
        throw unknown_tag_type_error { _offset, code };
    }

    std::string cursor::read_string()
    {
        const auto len = read_number<uint16_t>();
        std::string res(len, '\0');
        read_payload(std::span { reinterpret_cast<uint8_t *>(res.data()), res.size() });
        if (const auto it = utf8::find_invalid(res.begin(), res.end()); it != res.end()) [[unlikely]]
            throw invalid_encoding_error { _offset, static_cast<uint64_t>(it - res.begin()) };
        return res;
    }

    byte_array cursor::read_byte_array()
    {
        const auto len = read_number<uint32_t>();
        // grows only with the data actually delivered so that a bogus length cannot exhaust memory
        byte_array res {};
        while (res.size() < len) {
            const auto prev_size = res.size();
            res.resize(prev_size + std::min(static_cast<size_t>(len) - prev_size, max_chunk_size));
            read_payload(std::span { res.data() + prev_size, res.size() - prev_size });
        }
        return res;
    }

    int_array cursor::read_int_array()
    {
        static constexpr size_t chunk_items = max_chunk_size / sizeof(int32_t);
        const auto len = read_number<uint32_t>();
        int_array res {};
        std::array<uint8_t, chunk_items * sizeof(int32_t)> chunk;
        while (res.size() < len) {
            const auto num_items = std::min(static_cast<size_t>(len) - res.size(), chunk_items);
            read_exact(std::span { chunk.data(), num_items * sizeof(int32_t) });
            for (size_t i = 0; i < num_items; ++i)
                res.emplace_back(buffer { chunk.data() + i * sizeof(int32_t), sizeof(int32_t) }.to_host<int32_t>());
        }
        return res;
    }

    value cursor::read_simple(const tag_type typ)
    {
        switch (typ) {
            case tag_type::byte: return read_number<int8_t>();
            case tag_type::short_: return read_number<int16_t>();
            case tag_type::int_: return read_number<int32_t>();
            case tag_type::long_: return read_number<int64_t>();
            case tag_type::float_: return read_number<float>();
            case tag_type::double_: return read_number<double>();
            case tag_type::byte_array: return read_byte_array();
            case tag_type::string: return read_string();
            case tag_type::int_array: return read_int_array();
            default: throw invalid_tag_type_error { _offset, fmt::format("{} is not a simple tag type", typ) };
        }
    }

    template<typename T, typename F>
    static list read_items(const uint32_t count, const F &read_one)
    {
        std::vector<T> items {};
        items.reserve(std::min(static_cast<size_t>(count), size_t { 0x1000 }));
        for (uint32_t i = 0; i < count; ++i)
            items.emplace_back(read_one());
        return list { std::move(items) };
    }

    list cursor::read_simple_list(const tag_type typ, const uint32_t count)
    {
        switch (typ) {
            case tag_type::byte: return read_items<int8_t>(count, [&] { return read_number<int8_t>(); });
            case tag_type::short_: return read_items<int16_t>(count, [&] { return read_number<int16_t>(); });
            case tag_type::int_: return read_items<int32_t>(count, [&] { return read_number<int32_t>(); });
            case tag_type::long_: return read_items<int64_t>(count, [&] { return read_number<int64_t>(); });
            case tag_type::float_: return read_items<float>(count, [&] { return read_number<float>(); });
            case tag_type::double_: return read_items<double>(count, [&] { return read_number<double>(); });
            case tag_type::byte_array: return read_items<byte_array>(count, [&] { return read_byte_array(); });
            case tag_type::string: return read_items<std::string>(count, [&] { return read_string(); });
            case tag_type::int_array: return read_items<int_array>(count, [&] { return read_int_array(); });
            default: throw invalid_tag_type_error { _offset, fmt::format("{} is not a simple list element type", typ) };
        }
    }

    bool cursor::at_eof()
    {
        std::array<uint8_t, 1> probe;
        return _try_read(probe) == 0;
    }
}
