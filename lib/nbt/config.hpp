/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef NBT_TURBO_CONFIG_HPP
#define NBT_TURBO_CONFIG_HPP

#include <string>
#include <string_view>
#include <nbt/json.hpp>
#include <nbt/reader/config.hpp>
#include <nbt/value.hpp>

namespace nbt {
    // Recognized elements: fill_partial_reads, require_eof (booleans) and max_depth, max_items (unsigned integers).
    // Unknown elements are rejected.
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }

        [[nodiscard]] reader_config reader() const;
        [[nodiscard]] format_options format() const;
    protected:
        static void validate(const json::object &j);
    private:
        virtual const json::object &_json_impl() const =0;
    };

    struct config_json: config {
        explicit config_json(json::object &&j);
    private:
        const json::object _json;

        const json::object &_json_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        json::object _parsed;

        const json::object &_json_impl() const override
        {
            return _parsed;
        }
    };
}

#endif // !NBT_TURBO_CONFIG_HPP
