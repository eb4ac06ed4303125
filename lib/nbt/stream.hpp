/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef NBT_TURBO_STREAM_HPP
#define NBT_TURBO_STREAM_HPP

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <nbt/common/bytes.hpp>

namespace nbt {
    // A sequential byte supplier. try_read returns the number of bytes written into buf:
    // zero means the end of input and fewer than buf.size() bytes is allowed.
    // Transport failures are reported by throwing.
    struct read_stream {
        virtual ~read_stream() =default;
        virtual size_t try_read(std::span<uint8_t> buf) =0;
    };

    struct buffer_read_stream: read_stream {
        explicit buffer_read_stream(const buffer data):
            _data { data }
        {
        }

        size_t try_read(std::span<uint8_t> buf) override;

        size_t consumed() const noexcept
        {
            return _pos;
        }

        size_t remaining() const noexcept
        {
            return _data.size() - _pos;
        }
    private:
        buffer _data;
        size_t _pos = 0;
    };

    struct file_read_stream: read_stream {
        explicit file_read_stream(const std::string &path);
        file_read_stream(const file_read_stream &) =delete;
        ~file_read_stream() override;
        size_t try_read(std::span<uint8_t> buf) override;

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
        std::FILE *_f = nullptr;
    };

    extern uint8_vector read_all(read_stream &s);
}

namespace nbt::file {
    inline uint8_vector read(const std::string &path)
    {
        file_read_stream s { path };
        return read_all(s);
    }
}

#endif // !NBT_TURBO_STREAM_HPP
