/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef NBT_TURBO_TAG_HPP
#define NBT_TURBO_TAG_HPP

#include <cstdint>
#include <optional>
#include <string_view>
#include <nbt/common/format.hpp>

namespace nbt {
    enum class tag_type: uint8_t {
        end = 0,
        byte = 1,
        short_ = 2,
        int_ = 3,
        long_ = 4,
        float_ = 5,
        double_ = 6,
        byte_array = 7,
        string = 8,
        list = 9,
        compound = 10,
        int_array = 11
    };

    static constexpr uint8_t max_tag_code = static_cast<uint8_t>(tag_type::int_array);

    // end is never a value: it terminates compounds and marks the element type of empty lists
    enum class tag_class: uint8_t {
        end,
        simple,
        composite
    };

    constexpr std::optional<tag_type> tag_type_from_code(const uint8_t code) noexcept
    {
        if (code <= max_tag_code) [[likely]]
            return static_cast<tag_type>(code);
        return {};
    }

    constexpr tag_class classify(const tag_type typ) noexcept
    {
        switch (typ) {
            case tag_type::end:
                return tag_class::end;
            case tag_type::list:
            case tag_type::compound:
                return tag_class::composite;
            default:
                return tag_class::simple;
        }
    }

    constexpr bool is_simple(const tag_type typ) noexcept
    {
        return classify(typ) == tag_class::simple;
    }

    constexpr std::string_view tag_name(const tag_type typ) noexcept
    {
        switch (typ) {
            case tag_type::end: return "TAG_End";
            case tag_type::byte: return "TAG_Byte";
            case tag_type::short_: return "TAG_Short";
            case tag_type::int_: return "TAG_Int";
            case tag_type::long_: return "TAG_Long";
            case tag_type::float_: return "TAG_Float";
            case tag_type::double_: return "TAG_Double";
            case tag_type::byte_array: return "TAG_Byte_Array";
            case tag_type::string: return "TAG_String";
            case tag_type::list: return "TAG_List";
            case tag_type::compound: return "TAG_Compound";
            case tag_type::int_array: return "TAG_Int_Array";
            default: return "TAG_Unknown";
        }
    }
}

namespace fmt {
    template<>
    struct formatter<nbt::tag_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (nbt::tag_type_from_code(static_cast<uint8_t>(v))) [[likely]]
                return fmt::format_to(ctx.out(), "{}", nbt::tag_name(v));
            return fmt::format_to(ctx.out(), "(unknown tag type 0x{:02x})", static_cast<int>(v));
        }
    };

    template<>
    struct formatter<nbt::tag_class>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            switch (v) {
                case nbt::tag_class::end: return fmt::format_to(ctx.out(), "end");
                case nbt::tag_class::simple: return fmt::format_to(ctx.out(), "simple");
                case nbt::tag_class::composite: return fmt::format_to(ctx.out(), "composite");
                default: return fmt::format_to(ctx.out(), "tag_class: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !NBT_TURBO_TAG_HPP
