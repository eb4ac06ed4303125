/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef NBT_TURBO_VALUE_HPP
#define NBT_TURBO_VALUE_HPP

#include <array>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include <nbt/common/bytes.hpp>
#include <nbt/common/variant.hpp>
#include <nbt/tag.hpp>

namespace nbt {
    struct value;
    struct list;

    using byte_array = std::vector<uint8_t>;
    using int_array = std::vector<int32_t>;
    // Keys are unique. Iteration order is the key order and carries no meaning for the format.
    using compound = std::map<std::string, value>;

    // A zero-length list whose declared element type is TAG_End.
    struct list_empty {
        bool operator==(const list_empty &) const noexcept =default;
    };

    // The alternative with index i holds elements of the tag type with code i.
    using list_base = std::variant<list_empty,
        std::vector<int8_t>, std::vector<int16_t>, std::vector<int32_t>, std::vector<int64_t>,
        std::vector<float>, std::vector<double>, std::vector<byte_array>, std::vector<std::string>,
        std::vector<list>, std::vector<compound>, std::vector<int_array>>;

    struct list: list_base {
        using base_type = list_base;
        using base_type::base_type;

        list() =default;
        list(const list &o);
        list(list &&) =default;
        list &operator=(const list &o);
        list &operator=(list &&) =default;
        ~list();

        const base_type &base() const noexcept
        {
            return *this;
        }

        base_type &base() noexcept
        {
            return *this;
        }

        tag_type element_type() const noexcept
        {
            return static_cast<tag_type>(index());
        }

        bool is_empty_marker() const noexcept
        {
            return std::holds_alternative<list_empty>(base());
        }

        size_t size() const noexcept;

        template<typename T>
        const std::vector<T> &as() const
        {
            if (const auto *v = std::get_if<std::vector<T>>(static_cast<const base_type *>(this)); v) [[likely]]
                return *v;
            throw error(fmt::format("expected a list of {} but got a list of {}",
                static_cast<tag_type>(nbt::variant::index_of<std::vector<T>, base_type>()), element_type()));
        }

        template<typename T>
        std::vector<T> &as()
        {
            return const_cast<std::vector<T> &>(static_cast<const list &>(*this).as<T>());
        }

        bool operator==(const list &o) const;
    private:
        friend value;

        bool _nested() const noexcept;
        void _release(std::vector<value> &pending);
    };

    // The alternative with index i holds the tag type with code i + 1.
    using value_base = std::variant<int8_t, int16_t, int32_t, int64_t, float, double,
        byte_array, std::string, list, compound, int_array>;

    // Copies, comparisons and destruction of values and lists never recurse through nested
    // compounds and lists on the native stack, so they work on trees of any depth.
    // Members that touch compound or list contents are defined in value.cpp, where value is complete.
    struct value: value_base {
        using base_type = value_base;
        using base_type::base_type;

        value() =default;
        value(const value &o);
        value(value &&) =default;
        value &operator=(const value &o);
        value &operator=(value &&) =default;
        ~value();

        const base_type &base() const noexcept
        {
            return *this;
        }

        base_type &base() noexcept
        {
            return *this;
        }

        tag_type type() const noexcept
        {
            return static_cast<tag_type>(index() + 1);
        }

        template<typename T>
        bool is() const noexcept
        {
            return std::holds_alternative<T>(base());
        }

        template<typename T>
        const T &as() const
        {
            if (const auto *v = std::get_if<T>(static_cast<const base_type *>(this)); v) [[likely]]
                return *v;
            throw error(fmt::format("expected {} but got {}",
                static_cast<tag_type>(nbt::variant::index_of<T, base_type>() + 1), type()));
        }

        template<typename T>
        T &as()
        {
            return const_cast<T &>(static_cast<const value &>(*this).as<T>());
        }

        const value &at(const std::string &key) const
        {
            const auto &c = as<compound>();
            if (const auto it = c.find(key); it != c.end()) [[likely]]
                return it->second;
            throw error(fmt::format("compound does not have a key '{}'", key));
        }

        bool operator==(const value &o) const;
    private:
        friend list;

        static void _drain(std::vector<value> &pending);
        bool _nested() const noexcept;
        void _release(std::vector<value> &pending);
    };

    struct root_value {
        std::string name {};
        nbt::value value {};

        bool operator==(const root_value &o) const =default;
    };

    struct tree_stats {
        std::array<uint64_t, max_tag_code + 1> counts {};
        size_t max_depth = 0;

        uint64_t count(const tag_type typ) const
        {
            return counts.at(static_cast<size_t>(typ));
        }

        uint64_t total() const noexcept
        {
            uint64_t res = 0;
            for (const auto c: counts)
                res += c;
            return res;
        }
    };

    // Counts every value and list element by its tag type. The root value has depth 1.
    extern tree_stats stats(const value &v);

    struct format_options {
        size_t max_depth = 64;
        size_t max_seq_to_expand = std::numeric_limits<size_t>::max();
    };

    template<typename OUT_IT>
    OUT_IT format_to(OUT_IT out_it, const list &l, size_t depth, const format_options &opts);

    template<typename OUT_IT>
    OUT_IT format_to(OUT_IT out_it, const compound &c, const size_t depth, const format_options &opts)
    {
        if (depth >= opts.max_depth)
            return fmt::format_to(out_it, "{{...}}");
        out_it = fmt::format_to(out_it, "{{");
        if (!c.empty()) {
            out_it = fmt::format_to(out_it, "\n");
            size_t i = 0;
            for (const auto &[k, v]: c) {
                if (i++ >= opts.max_seq_to_expand) {
                    out_it = fmt::format_to(out_it, "{:{}}    ...\n", "", depth * 4);
                    break;
                }
                out_it = fmt::format_to(out_it, "{:{}}    '{}': ", "", depth * 4, k);
                out_it = format_to(out_it, v, depth + 1, opts);
                out_it = fmt::format_to(out_it, "\n");
            }
            out_it = fmt::format_to(out_it, "{:{}}", "", depth * 4);
        }
        return fmt::format_to(out_it, "}}");
    }

    template<typename OUT_IT, typename T>
    OUT_IT format_seq(OUT_IT out_it, const std::vector<T> &items, const std::string_view prefix, const std::string_view suffix, const format_options &opts)
    {
        out_it = fmt::format_to(out_it, "[{}", prefix);
        for (size_t i = 0; i < items.size(); ++i) {
            if (i >= opts.max_seq_to_expand) {
                out_it = fmt::format_to(out_it, ", ...");
                break;
            }
            if (i > 0)
                out_it = fmt::format_to(out_it, ", ");
            if constexpr (std::is_same_v<T, std::string>)
                out_it = fmt::format_to(out_it, "'{}'", items[i]);
            else if constexpr (std::is_same_v<T, int8_t>)
                out_it = fmt::format_to(out_it, "{}{}", static_cast<int>(items[i]), suffix);
            else if constexpr (std::is_same_v<T, uint8_t>)
                out_it = fmt::format_to(out_it, "{}{}", static_cast<int>(static_cast<int8_t>(items[i])), suffix);
            else
                out_it = fmt::format_to(out_it, "{}{}", items[i], suffix);
        }
        return fmt::format_to(out_it, "]");
    }

    template<typename OUT_IT, typename T>
    OUT_IT format_nested_seq(OUT_IT out_it, const std::vector<T> &items, const size_t depth, const format_options &opts)
    {
        if (depth >= opts.max_depth)
            return fmt::format_to(out_it, "[...]");
        out_it = fmt::format_to(out_it, "[");
        if (!items.empty()) {
            out_it = fmt::format_to(out_it, "\n");
            for (size_t i = 0; i < items.size(); ++i) {
                if (i >= opts.max_seq_to_expand) {
                    out_it = fmt::format_to(out_it, "{:{}}    ...\n", "", depth * 4);
                    break;
                }
                out_it = fmt::format_to(out_it, "{:{}}    #{}: ", "", depth * 4, i);
                if constexpr (std::is_same_v<T, byte_array>)
                    out_it = format_seq(out_it, items[i], "B; ", "b", opts);
                else if constexpr (std::is_same_v<T, int_array>)
                    out_it = format_seq(out_it, items[i], "I; ", "", opts);
                else
                    out_it = format_to(out_it, items[i], depth + 1, opts);
                out_it = fmt::format_to(out_it, "\n");
            }
            out_it = fmt::format_to(out_it, "{:{}}", "", depth * 4);
        }
        return fmt::format_to(out_it, "]");
    }

    template<typename OUT_IT>
    OUT_IT format_to(OUT_IT out_it, const list &l, const size_t depth, const format_options &opts)
    {
        switch (l.element_type()) {
            case tag_type::end: return fmt::format_to(out_it, "[]");
            case tag_type::byte: return format_seq(out_it, l.as<int8_t>(), "", "b", opts);
            case tag_type::short_: return format_seq(out_it, l.as<int16_t>(), "", "s", opts);
            case tag_type::int_: return format_seq(out_it, l.as<int32_t>(), "", "", opts);
            case tag_type::long_: return format_seq(out_it, l.as<int64_t>(), "", "L", opts);
            case tag_type::float_: return format_seq(out_it, l.as<float>(), "", "f", opts);
            case tag_type::double_: return format_seq(out_it, l.as<double>(), "", "d", opts);
            case tag_type::string: return format_seq(out_it, l.as<std::string>(), "", "", opts);
            case tag_type::byte_array: return format_nested_seq(out_it, l.as<byte_array>(), depth, opts);
            case tag_type::list: return format_nested_seq(out_it, l.as<list>(), depth, opts);
            case tag_type::compound: return format_nested_seq(out_it, l.as<compound>(), depth, opts);
            case tag_type::int_array: return format_nested_seq(out_it, l.as<int_array>(), depth, opts);
            default: throw error(fmt::format("unsupported list element type: {}", l.element_type()));
        }
    }

    template<typename OUT_IT>
    OUT_IT format_to(OUT_IT out_it, const value &v, const size_t depth, const format_options &opts)
    {
        switch (v.type()) {
            case tag_type::byte: return fmt::format_to(out_it, "{}b", static_cast<int>(v.as<int8_t>()));
            case tag_type::short_: return fmt::format_to(out_it, "{}s", v.as<int16_t>());
            case tag_type::int_: return fmt::format_to(out_it, "{}", v.as<int32_t>());
            case tag_type::long_: return fmt::format_to(out_it, "{}L", v.as<int64_t>());
            case tag_type::float_: return fmt::format_to(out_it, "{}f", v.as<float>());
            case tag_type::double_: return fmt::format_to(out_it, "{}d", v.as<double>());
            case tag_type::byte_array: return format_seq(out_it, v.as<byte_array>(), "B; ", "b", opts);
            case tag_type::string: return fmt::format_to(out_it, "'{}'", v.as<std::string>());
            case tag_type::list: return format_to(out_it, v.as<list>(), depth, opts);
            case tag_type::compound: return format_to(out_it, v.as<compound>(), depth, opts);
            case tag_type::int_array: return format_seq(out_it, v.as<int_array>(), "I; ", "", opts);
            default: throw error(fmt::format("unsupported value type: {}", v.type()));
        }
    }

    template<typename OUT_IT>
    OUT_IT format_to(OUT_IT out_it, const root_value &rv, const format_options &opts)
    {
        out_it = fmt::format_to(out_it, "'{}': ", rv.name);
        return format_to(out_it, rv.value, 0, opts);
    }
}

namespace fmt {
    template<>
    struct formatter<nbt::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const nbt::value &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return nbt::format_to(ctx.out(), v, 0, nbt::format_options {});
        }
    };

    template<>
    struct formatter<nbt::list>: formatter<int> {
        template<typename FormatContext>
        auto format(const nbt::list &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return nbt::format_to(ctx.out(), v, 0, nbt::format_options {});
        }
    };

    template<>
    struct formatter<nbt::compound>: formatter<int> {
        template<typename FormatContext>
        auto format(const nbt::compound &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return nbt::format_to(ctx.out(), v, 0, nbt::format_options {});
        }
    };

    template<>
    struct formatter<nbt::root_value>: formatter<int> {
        template<typename FormatContext>
        auto format(const nbt::root_value &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return nbt::format_to(ctx.out(), v, nbt::format_options {});
        }
    };
}

#endif // !NBT_TURBO_VALUE_HPP
