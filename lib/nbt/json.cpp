/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <nbt/json.hpp>

namespace nbt::json {
    void save_pretty(std::ostream &os, const json::value &jv, std::string *indent)
    {
        static constexpr size_t indent_step = 2;
        std::string indent_ {};
        if (!indent)
            indent = &indent_;
        switch (jv.kind()) {
            case json::kind::object: {
                const auto &obj = jv.get_object();
                if (obj.empty()) {
                    os << "{}";
                    break;
                }
                os << "{\n";
                indent->append(indent_step, ' ');
                for (auto it = obj.begin(), last = std::prev(obj.end()); it != obj.end(); ++it) {
                    os << *indent << json::serialize(json::string { it->key() }) << ": ";
                    save_pretty(os, it->value(), indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "}";
                break;
            }
            case json::kind::array: {
                const auto &arr = jv.get_array();
                if (arr.empty()) {
                    os << "[]";
                    break;
                }
                os << "[\n";
                indent->append(indent_step, ' ');
                for (auto it = arr.begin(), last = std::prev(arr.end()); it != arr.end(); ++it) {
                    os << *indent;
                    save_pretty(os, *it, indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "]";
                break;
            }
            case json::kind::string:
                os << json::serialize(jv.get_string());
                break;
            case json::kind::uint64:
                os << jv.get_uint64();
                break;
            case json::kind::int64:
                os << jv.get_int64();
                break;
            case json::kind::double_:
                os << json::serialize(jv);
                break;
            case json::kind::bool_:
                if (jv.get_bool())
                    os << "true";
                else
                    os << "false";
                break;
            case json::kind::null:
                os << "null";
                break;
        }
    }

    template<typename T>
    static json::array seq_to_json(const std::vector<T> &items)
    {
        json::array res {};
        res.reserve(items.size());
        for (const auto &v: items) {
            if constexpr (std::is_same_v<T, std::string>)
                res.emplace_back(json::string { v });
            else if constexpr (std::is_same_v<T, float>)
                res.emplace_back(static_cast<double>(v));
            else if constexpr (std::is_same_v<T, uint8_t>)
                res.emplace_back(static_cast<int8_t>(v));
            else
                res.emplace_back(v);
        }
        return res;
    }

    static json::value list_to_json(const nbt::list &l, size_t depth, size_t max_depth);
    static json::value value_to_json(const nbt::value &v, size_t depth, size_t max_depth);

    static json::value compound_to_json(const compound &c, const size_t depth, const size_t max_depth)
    {
        if (depth >= max_depth)
            return json::string { "..." };
        json::object res {};
        for (const auto &[k, v]: c)
            res.emplace(k, value_to_json(v, depth + 1, max_depth));
        return res;
    }

    template<typename T>
    static json::value nested_seq_to_json(const std::vector<T> &items, const size_t depth, const size_t max_depth)
    {
        if (depth >= max_depth)
            return json::string { "..." };
        json::array res {};
        res.reserve(items.size());
        for (const auto &v: items) {
            if constexpr (std::is_same_v<T, nbt::list>)
                res.emplace_back(list_to_json(v, depth + 1, max_depth));
            else if constexpr (std::is_same_v<T, compound>)
                res.emplace_back(compound_to_json(v, depth + 1, max_depth));
            else
                res.emplace_back(seq_to_json(v));
        }
        return res;
    }

    json::value list_to_json(const nbt::list &l, const size_t depth, const size_t max_depth)
    {
        return std::visit([&](const auto &items) -> json::value {
            using T = std::decay_t<decltype(items)>;
            if constexpr (std::is_same_v<T, list_empty>)
                return json::array {};
            else if constexpr (std::is_same_v<T, std::vector<nbt::list>> || std::is_same_v<T, std::vector<compound>>
                    || std::is_same_v<T, std::vector<byte_array>> || std::is_same_v<T, std::vector<int_array>>)
                return nested_seq_to_json(items, depth, max_depth);
            else
                return seq_to_json(items);
        }, l.base());
    }

    json::value value_to_json(const nbt::value &v, const size_t depth, const size_t max_depth)
    {
        return std::visit([&](const auto &val) -> json::value {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, nbt::list>)
                return list_to_json(val, depth, max_depth);
            else if constexpr (std::is_same_v<T, compound>)
                return compound_to_json(val, depth, max_depth);
            else if constexpr (std::is_same_v<T, byte_array> || std::is_same_v<T, int_array>)
                return seq_to_json(val);
            else if constexpr (std::is_same_v<T, std::string>)
                return json::string { val };
            else if constexpr (std::is_same_v<T, float>)
                return static_cast<double>(val);
            else
                return val;
        }, v.base());
    }

    json::value to_json(const nbt::value &v, const size_t max_depth)
    {
        return value_to_json(v, 0, max_depth);
    }

    json::value to_json(const nbt::list &l, const size_t max_depth)
    {
        return list_to_json(l, 0, max_depth);
    }

    json::object to_json(const root_value &rv, const size_t max_depth)
    {
        json::object res {};
        res.emplace("name", json::string { rv.name });
        res.emplace("type", json::string { std::string { tag_name(rv.value.type()) } });
        res.emplace("value", to_json(rv.value, max_depth));
        return res;
    }
}
