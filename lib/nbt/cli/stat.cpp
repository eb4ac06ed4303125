/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <nbt/cli.hpp>
#include <nbt/reader.hpp>

namespace nbt::cli::stat {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "stat";
            cmd.desc = "decode an uncompressed NBT document and print per-tag-type counts";
            cmd.args.expect({ "<path>" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto cfg = load_config(opts);
            file_read_stream s { args.at(0) };
            uint64_t bytes_consumed = 0;
            const auto root = reader::parse(s, cfg->reader(), bytes_consumed);
            const auto st = stats(root.value);
            std::cout << fmt::format("root name: '{}'\n", root.name);
            std::cout << fmt::format("root type: {}\n", root.value.type());
            std::cout << fmt::format("bytes consumed: {}\n", bytes_consumed);
            std::cout << fmt::format("max depth: {}\n", st.max_depth);
            std::cout << fmt::format("total values: {}\n", st.total());
            for (uint8_t code = 1; code <= max_tag_code; ++code) {
                const auto typ = static_cast<tag_type>(code);
                if (const auto cnt = st.count(typ); cnt)
                    std::cout << fmt::format("{:>16}: {}\n", tag_name(typ), cnt);
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
