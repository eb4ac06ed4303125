/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef NBT_TURBO_READER_PRIMITIVE_HPP
#define NBT_TURBO_READER_PRIMITIVE_HPP

#include <array>
#include <bit>
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <nbt/reader/config.hpp>
#include <nbt/reader/error.hpp>
#include <nbt/stream.hpp>
#include <nbt/tag.hpp>
#include <nbt/value.hpp>

namespace nbt::reader {
    // Tracks the number of consumed bytes and turns source behavior into read_errors.
    struct cursor {
        // upper bound on a single request to the source
        static constexpr size_t max_chunk_size = 0x10000;

        explicit cursor(read_stream &src, const reader_config &cfg={}):
            _src { src }, _cfg { cfg }
        {
        }

        uint64_t offset() const noexcept
        {
            return _offset;
        }

        const reader_config &config() const noexcept
        {
            return _cfg;
        }

        // Fills buf completely, issuing as many reads as needed.
        void read_exact(std::span<uint8_t> buf);

        // Reads a length-prefixed payload. Without fill_partial_reads, a short read is an error.
        void read_payload(std::span<uint8_t> buf);

        template<typename T>
        T read_number()
        {
            static_assert(std::is_arithmetic_v<T>);
            std::array<uint8_t, sizeof(T)> bytes;
            read_exact(bytes);
            if constexpr (std::is_floating_point_v<T>) {
                using U = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
                return std::bit_cast<T>(buffer { bytes.data(), bytes.size() }.to_host<U>());
            } else {
                return buffer { bytes.data(), bytes.size() }.to_host<T>();
            }
        }

        uint8_t read_tag_code()
        {
            return read_number<uint8_t>();
        }

        tag_type read_tag_type();
        std::string read_string();
        byte_array read_byte_array();
        int_array read_int_array();

        // Decodes the payload of any simple tag type.
        value read_simple(tag_type typ);

        // Reads count payloads of a simple tag type into a list.
        list read_simple_list(tag_type typ, uint32_t count);

        // True when the source has no more bytes.
        bool at_eof();
    private:
        read_stream &_src;
        reader_config _cfg;
        uint64_t _offset = 0;

        size_t _try_read(std::span<uint8_t> buf);
    };
}

#endif // !NBT_TURBO_READER_PRIMITIVE_HPP
