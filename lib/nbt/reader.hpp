/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef NBT_TURBO_READER_HPP
#define NBT_TURBO_READER_HPP

#include <cstdint>
#include <nbt/common/bytes.hpp>
#include <nbt/reader/config.hpp>
#include <nbt/reader/error.hpp>
#include <nbt/stream.hpp>
#include <nbt/value.hpp>

namespace nbt::reader {
    // Decodes exactly one document: the root tag, the root name and the root payload.
    // Nested compounds and lists are parsed with an explicit heap stack,
    // so the nesting depth is limited only by available memory.
    // Throws a read_error subclass on any failure; no partial result is returned.
    extern root_value parse(read_stream &s, const reader_config &cfg, uint64_t &bytes_consumed);
    extern root_value parse(read_stream &s, const reader_config &cfg={});
    extern root_value parse(buffer data, const reader_config &cfg={});
}

#endif // !NBT_TURBO_READER_HPP
