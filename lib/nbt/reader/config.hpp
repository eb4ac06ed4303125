/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef NBT_TURBO_READER_CONFIG_HPP
#define NBT_TURBO_READER_CONFIG_HPP

namespace nbt {
    struct reader_config {
        // when false, a String or Byte_Array payload read that returns fewer bytes than requested
        // is an unexpected end of input
        bool fill_partial_reads = false;
        // when true, any byte following the root value is an error
        bool require_eof = false;

        bool operator==(const reader_config &) const =default;
    };
}

#endif // !NBT_TURBO_READER_CONFIG_HPP
