/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <filesystem>
#include <fstream>
#include <nbt/common/test.hpp>
#include <nbt/cli.hpp>

using namespace nbt;
using namespace nbt::cli;

namespace {
    struct echo_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "echo";
            cmd.desc = "records its arguments";
            cmd.args.expect({ "<first>", "[second]" });
            cmd.opts.try_emplace("count", "a counter", "1", validate_uint);
            cmd.opts.try_emplace("flag", "a flag");
        }

        void run(const arguments &args, const options &opts) const override
        {
            last_reader = load_config(opts)->reader();
            last_args = args;
            last_opts = opts;
        }

        mutable arguments last_args {};
        mutable options last_opts {};
        mutable reader_config last_reader {};
    };

    int run_cmd(const std::initializer_list<const char *> args, const command::command_list &cmds=command::registry())
    {
        std::vector<const char *> argv { "nbt" };
        argv.insert(argv.end(), args.begin(), args.end());
        return cli::run(static_cast<int>(argv.size()), argv.data(), cmds);
    }
}

suite cli_suite = [] {
    "cli"_test = [] {
        "argument expectations"_test = [] {
            argument_config ac {};
            ac.expect({ "<path>", "[extra]" });
            test_same(size_t { 1 }, *ac.min);
            test_same(size_t { 2 }, *ac.max);
            ac.expect({ "<path>", "[extra...]" });
            test_same(std::numeric_limits<size_t>::max(), *ac.max);
        };
        "validate_uint"_test = [] {
            expect(!validate_uint("17"));
            expect(static_cast<bool>(validate_uint("-1")));
            expect(static_cast<bool>(validate_uint("")));
            expect(static_cast<bool>(validate_uint(std::optional<std::string> {})));
            expect(static_cast<bool>(validate_uint("1234567890123456789")));
        };
        "parse"_test = [] {
            const echo_cmd cmd {};
            config cfg {};
            cmd.configure(cfg);
            const auto pr = cmd.parse(cfg, { "a", "--flag", "b" });
            expect(pr.args == arguments { "a", "b" });
            expect(pr.opts.contains("flag"));
            test_same(std::string { "1" }, pr.opts.at("count").value());
            const auto pr2 = cmd.parse(cfg, { "a", "--count=5" });
            test_same(std::string { "5" }, pr2.opts.at("count").value());
            expect(throws<error>([&] { cmd.parse(cfg, { "a", "--count=x" }); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "a", "--unknown" }); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "a", "--flag", "--flag" }); }));
            expect(throws<error>([&] { cmd.parse(cfg, {}); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "a", "b", "c" }); }));
        };
        "run"_test = [] {
            const auto echo = std::make_shared<echo_cmd>();
            const command::command_list cmds { echo };
            test_same(0, run_cmd({ "echo", "x", "--count=2" }, cmds));
            expect(echo->last_args == arguments { "x" });
            test_same(1, run_cmd({ "echo" }, cmds));
            test_same(1, run_cmd({ "unknown" }, cmds));
            test_same(1, run_cmd({}, cmds));
            test_same(1, run_cmd({ "echo", "x", "--config=./no-such-config.json" }, cmds));
        };
        "dump and stat"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "nbt-cli-test.nbt").string();
            {
                const auto bytes = uint8_vector::from_hex("0A000B68656C6C6F20776F726C640800046E616D65000942616E616E72616D6100");
                std::ofstream os { path, std::ios::binary };
                os.write(reinterpret_cast<const char *>(bytes.data()), bytes.size());
            }
            test_same(0, run_cmd({ "dump", path.c_str() }));
            test_same(0, run_cmd({ "dump", path.c_str(), "--json", "--max-depth=1" }));
            test_same(0, run_cmd({ "stat", path.c_str() }));
            test_same(1, run_cmd({ "dump", path.c_str(), "--max-items=many" }));
            test_same(1, run_cmd({ "stat", "./no-such-file.nbt" }));
            {
                std::ofstream os { path, std::ios::binary };
                os << "\x0A";
            }
            test_same(1, run_cmd({ "dump", path.c_str() }));
            std::filesystem::remove(path);
        };
    };
};
