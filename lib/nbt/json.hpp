/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef NBT_TURBO_JSON_HPP
#define NBT_TURBO_JSON_HPP

#include <ostream>
#include <string>
#include <boost/json.hpp>
#include <nbt/common/bytes.hpp>
#include <nbt/stream.hpp>
#include <nbt/value.hpp>

namespace nbt::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf.string_view(), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    extern void save_pretty(std::ostream &os, const json::value &jv, std::string *indent=nullptr);

    // Nesting below max_depth is rendered as the string "...", which also bounds
    // the recursion of the rendering and of the returned json::value's destructor.
    extern json::value to_json(const nbt::value &v, size_t max_depth=64);
    extern json::value to_json(const nbt::list &l, size_t max_depth=64);
    extern json::object to_json(const root_value &rv, size_t max_depth=64);
}

#endif // !NBT_TURBO_JSON_HPP
