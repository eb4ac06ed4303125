/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <array>
#include <algorithm>
#include <nbt/config.hpp>
#include <nbt/logger.hpp>

namespace nbt {
    static constexpr std::array<std::string_view, 4> known_elements {
        "fill_partial_reads", "require_eof", "max_depth", "max_items"
    };

    static const json::value *find_element(const json::object &j, const std::string_view name)
    {
        if (const auto it = j.find(name); it != j.end())
            return &it->value();
        return nullptr;
    }

    static bool get_bool(const json::object &j, const std::string_view name, const bool default_val)
    {
        const auto *v = find_element(j, name);
        if (!v)
            return default_val;
        if (!v->is_bool()) [[unlikely]]
            throw error(fmt::format("configuration element {} must be a boolean", name));
        return v->get_bool();
    }

    static size_t get_size(const json::object &j, const std::string_view name, const size_t default_val)
    {
        const auto *v = find_element(j, name);
        if (!v)
            return default_val;
        if (v->is_uint64())
            return v->get_uint64();
        if (v->is_int64() && v->get_int64() >= 0)
            return static_cast<size_t>(v->get_int64());
        throw error(fmt::format("configuration element {} must be a non-negative integer", name));
    }

    void config::validate(const json::object &j)
    {
        for (const auto &kv: j) {
            const std::string_view key { kv.key().data(), kv.key().size() };
            if (std::find(known_elements.begin(), known_elements.end(), key) == known_elements.end()) [[unlikely]]
                throw error(fmt::format("unknown configuration element: {}", key));
        }
    }

    reader_config config::reader() const
    {
        const auto &j = json();
        return reader_config {
            get_bool(j, "fill_partial_reads", false),
            get_bool(j, "require_eof", false)
        };
    }

    format_options config::format() const
    {
        const auto &j = json();
        const format_options defaults {};
        return format_options {
            get_size(j, "max_depth", defaults.max_depth),
            get_size(j, "max_items", defaults.max_seq_to_expand)
        };
    }

    config_json::config_json(json::object &&j):
        _json { std::move(j) }
    {
        validate(_json);
    }

    config_file::config_file(const std::string &path)
    {
        auto jv = json::load(path);
        if (!jv.is_object()) [[unlikely]]
            throw error(fmt::format("configuration file {} must contain a JSON object", path));
        _parsed = std::move(jv.as_object());
        validate(_parsed);
        logger::debug("loaded configuration from {}", path);
    }
}
