/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <iterator>
#include <nbt/cli.hpp>
#include <nbt/json.hpp>
#include <nbt/reader.hpp>

namespace nbt::cli::dump {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "dump";
            cmd.desc = "decode an uncompressed NBT document and print its tree";
            cmd.args.expect({ "<path>" });
            cmd.opts.try_emplace("json", "print the tree as JSON");
            cmd.opts.try_emplace("max-depth", "nesting levels to expand; overrides the config", std::optional<std::string> {}, validate_uint);
            cmd.opts.try_emplace("max-items", "items of a sequence or compound to print; overrides the config", std::optional<std::string> {}, validate_uint);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto cfg = load_config(opts);
            auto fmt_opts = cfg->format();
            if (const auto it = opts.find("max-depth"); it != opts.end() && it->second)
                fmt_opts.max_depth = std::stoull(*it->second);
            if (const auto it = opts.find("max-items"); it != opts.end() && it->second)
                fmt_opts.max_seq_to_expand = std::stoull(*it->second);
            file_read_stream s { args.at(0) };
            const auto root = reader::parse(s, cfg->reader());
            if (opts.contains("json")) {
                json::save_pretty(std::cout, json::to_json(root, fmt_opts.max_depth));
                std::cout << '\n';
            } else {
                std::string out {};
                nbt::format_to(std::back_inserter(out), root, fmt_opts);
                std::cout << out << '\n';
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
