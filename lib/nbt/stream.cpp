/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <algorithm>
#include <cstring>
#include <nbt/common/error.hpp>
#include <nbt/common/format.hpp>
#include <nbt/stream.hpp>

namespace nbt {
    size_t buffer_read_stream::try_read(const std::span<uint8_t> buf)
    {
        const auto sz = std::min(buf.size(), _data.size() - _pos);
        if (sz) {
            memcpy(buf.data(), _data.data() + _pos, sz);
            _pos += sz;
        }
        return sz;
    }

    file_read_stream::file_read_stream(const std::string &path):
        _path { path },
        _f { std::fopen(path.c_str(), "rb") }
    {
        if (!_f) [[unlikely]]
            throw error_sys(fmt::format("failed to open a file for reading: {}", _path));
    }

    file_read_stream::~file_read_stream()
    {
        if (_f)
            std::fclose(_f);
    }

    size_t file_read_stream::try_read(const std::span<uint8_t> buf)
    {
        const auto sz = std::fread(buf.data(), 1, buf.size(), _f);
        if (sz != buf.size() && std::ferror(_f)) [[unlikely]]
            throw error_sys(fmt::format("failed to read from {}", _path));
        return sz;
    }

    uint8_vector read_all(read_stream &s)
    {
        static constexpr size_t chunk_size = 0x10000;
        uint8_vector res {};
        for (;;) {
            const auto prev_size = res.size();
            res.resize(prev_size + chunk_size);
            const auto sz = s.try_read(std::span { res.data() + prev_size, chunk_size });
            res.resize(prev_size + sz);
            if (!sz)
                break;
        }
        return res;
    }
}
