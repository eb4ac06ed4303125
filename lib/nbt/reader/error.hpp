/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef NBT_TURBO_READER_ERROR_HPP
#define NBT_TURBO_READER_ERROR_HPP

#include <cstdint>
#include <exception>
#include <string_view>
#include <nbt/common/error.hpp>
#include <nbt/common/format.hpp>

namespace nbt::reader {
    enum class error_kind: uint8_t {
        unexpected_eof,
        unknown_tag_type,
        invalid_tag_type,
        transport_failure,
        invalid_encoding,
        trailing_data
    };

    // All decoding failures are fatal for the document. offset is the number of bytes consumed
    // from the stream when the failure was detected.
    struct read_error: error {
        read_error(const error_kind kind, const uint64_t offset, const std::string_view msg):
            error { fmt::format("{} at offset {}", msg, offset) },
            _kind { kind }, _offset { offset }
        {
        }

        error_kind kind() const noexcept
        {
            return _kind;
        }

        uint64_t offset() const noexcept
        {
            return _offset;
        }
    private:
        error_kind _kind;
        uint64_t _offset;
    };

    struct unexpected_eof_error: read_error {
        unexpected_eof_error(const uint64_t offset, const uint64_t requested, const uint64_t available):
            read_error { error_kind::unexpected_eof, offset,
                fmt::format("unexpected end of input: requested {} bytes but only {} are available", requested, available) }
        {
        }
    };

    struct unknown_tag_type_error: read_error {
        unknown_tag_type_error(const uint64_t offset, const uint8_t code):
            read_error { error_kind::unknown_tag_type, offset, fmt::format("unknown tag type 0x{:02x}", code) },
            _code { code }
        {
        }

        uint8_t code() const noexcept
        {
            return _code;
        }
    private:
        uint8_t _code;
    };

    struct invalid_tag_type_error: read_error {
        invalid_tag_type_error(const uint64_t offset, const std::string_view reason):
            read_error { error_kind::invalid_tag_type, offset, fmt::format("invalid tag type: {}", reason) }
        {
        }
    };

    struct transport_error: read_error {
        transport_error(const uint64_t offset, const std::exception &ex):
            read_error { error_kind::transport_failure, offset, fmt::format("byte source failure: {}", ex.what()) }
        {
        }
    };

    struct invalid_encoding_error: read_error {
        invalid_encoding_error(const uint64_t offset, const uint64_t invalid_pos):
            read_error { error_kind::invalid_encoding, offset,
                fmt::format("string is not valid UTF-8: invalid sequence at byte {}", invalid_pos) }
        {
        }
    };

    struct trailing_data_error: read_error {
        explicit trailing_data_error(const uint64_t offset):
            read_error { error_kind::trailing_data, offset, "unexpected data after the end of the document" }
        {
        }
    };
}

namespace fmt {
    template<>
    struct formatter<nbt::reader::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using nbt::reader::error_kind;
            switch (v) {
                case error_kind::unexpected_eof: return fmt::format_to(ctx.out(), "unexpected_eof");
                case error_kind::unknown_tag_type: return fmt::format_to(ctx.out(), "unknown_tag_type");
                case error_kind::invalid_tag_type: return fmt::format_to(ctx.out(), "invalid_tag_type");
                case error_kind::transport_failure: return fmt::format_to(ctx.out(), "transport_failure");
                case error_kind::invalid_encoding: return fmt::format_to(ctx.out(), "invalid_encoding");
                case error_kind::trailing_data: return fmt::format_to(ctx.out(), "trailing_data");
                default: return fmt::format_to(ctx.out(), "error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !NBT_TURBO_READER_ERROR_HPP
