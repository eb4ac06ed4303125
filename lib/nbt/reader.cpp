/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <optional>
#include <variant>
#include <vector>
#include <nbt/logger.hpp>
#include <nbt/reader.hpp>
#include <nbt/reader/primitive.hpp>

namespace nbt::reader {
    namespace {
        struct need_more {};
        struct finished {};
        struct descend;
        using step_result = std::variant<need_more, descend, finished>;

        struct compound_reader {
            compound items {};
            // set when a composite entry is being descended into, consumed by resume
            std::optional<std::string> pending_name {};

            step_result step(cursor &c);
            void resume(value &&child);
            value finalize();
        };

        // A list of lists or a list of compounds. Elements are composites, except for
        // inner lists of simple types, which are decoded directly by the dispatcher.
        template<typename T>
        struct sequence_reader {
            static constexpr tag_type element_type = std::is_same_v<T, list> ? tag_type::list : tag_type::compound;

            uint32_t remaining = 0;
            std::vector<T> items {};

            step_result step(cursor &c);
            void resume(value &&child);
            value finalize();
        };

        using composite = std::variant<compound_reader, sequence_reader<list>, sequence_reader<compound>>;

        struct descend {
            composite child;
        };

        using start_result = std::variant<value, composite>;

        start_result start_read(const tag_type typ, cursor &c)
        {
            switch (classify(typ)) {
                case tag_class::simple:
                    return c.read_simple(typ);
                case tag_class::composite:
                    break;
                default:
                    throw invalid_tag_type_error { c.offset(), fmt::format("{} cannot be used as a value", typ) };
            }
            if (typ == tag_type::compound)
                return composite { compound_reader {} };
            const auto inner_code = c.read_tag_code();
            const auto count = c.read_number<uint32_t>();
            const auto inner_type = tag_type_from_code(inner_code);
            if (!inner_type) [[unlikely]]
                throw unknown_tag_type_error { c.offset(), inner_code };
            switch (classify(*inner_type)) {
                case tag_class::end:
                    if (count) [[unlikely]]
                        throw invalid_tag_type_error { c.offset(), fmt::format("a list of {} must be empty but declares {} elements", *inner_type, count) };
                    return value { list {} };
                case tag_class::simple:
                    return value { c.read_simple_list(*inner_type, count) };
                default:
                    if (*inner_type == tag_type::list)
                        return composite { sequence_reader<list> { count } };
                    return composite { sequence_reader<compound> { count } };
            }
        }

        step_result compound_reader::step(cursor &c)
        {
            const auto typ = c.read_tag_type();
            if (typ == tag_type::end)
                return finished {};
            auto name = c.read_string();
            auto start = start_read(typ, c);
            if (auto *v = std::get_if<value>(&start); v) {
                // the later of duplicate keys wins
                items.insert_or_assign(std::move(name), std::move(*v));
                return need_more {};
            }
            pending_name.emplace(std::move(name));
            return descend { std::move(std::get<composite>(start)) };
        }

        void compound_reader::resume(value &&child)
        {
            if (!pending_name) [[unlikely]]
                throw error("a compound received a child value without a pending name");
            items.insert_or_assign(std::move(*pending_name), std::move(child));
            pending_name.reset();
        }

        value compound_reader::finalize()
        {
            return value { std::move(items) };
        }

        template<typename T>
        step_result sequence_reader<T>::step(cursor &c)
        {
            if (!remaining)
                return finished {};
            --remaining;
            auto start = start_read(element_type, c);
            if (auto *v = std::get_if<value>(&start); v) {
                items.emplace_back(std::move(v->template as<T>()));
                return need_more {};
            }
            return descend { std::move(std::get<composite>(start)) };
        }

        template<typename T>
        void sequence_reader<T>::resume(value &&child)
        {
            items.emplace_back(std::move(child.template as<T>()));
        }

        template<typename T>
        value sequence_reader<T>::finalize()
        {
            return value { list { std::move(items) } };
        }

        value read_composite(composite &&start, cursor &c)
        {
            std::vector<composite> stack {};
            stack.emplace_back(std::move(start));
            for (;;) {
                auto res = std::visit([&](auto &top) { return top.step(c); }, stack.back());
                if (std::holds_alternative<need_more>(res))
                    continue;
                if (auto *d = std::get_if<descend>(&res); d) {
                    stack.emplace_back(std::move(d->child));
                    if (logger::tracing_enabled())
                        logger::trace("descended into a composite at offset {}, stack depth: {}", c.offset(), stack.size());
                    continue;
                }
                auto val = std::visit([](auto &top) { return top.finalize(); }, stack.back());
                stack.pop_back();
                if (logger::tracing_enabled())
                    logger::trace("finished a {} at offset {}, stack depth: {}", val.type(), c.offset(), stack.size());
                if (stack.empty())
                    return val;
                std::visit([&](auto &top) { top.resume(std::move(val)); }, stack.back());
            }
        }
    }

    root_value parse(read_stream &s, const reader_config &cfg, uint64_t &bytes_consumed)
    {
        cursor c { s, cfg };
        const auto typ = c.read_tag_type();
        root_value res { c.read_string() };
        auto start = start_read(typ, c);
        if (auto *v = std::get_if<value>(&start); v)
            res.value = std::move(*v);
        else
            res.value = read_composite(std::move(std::get<composite>(start)), c);
        if (cfg.require_eof && !c.at_eof()) [[unlikely]]
            throw trailing_data_error { c.offset() - 1 };
        bytes_consumed = c.offset();
        logger::debug("parsed a document '{}' with a root {} from {} bytes", res.name, res.value.type(), bytes_consumed);
        return res;
    }

    root_value parse(read_stream &s, const reader_config &cfg)
    {
        uint64_t bytes_consumed = 0;
        return parse(s, cfg, bytes_consumed);
    }

    root_value parse(const buffer data, const reader_config &cfg)
    {
        buffer_read_stream s { data };
        return parse(s, cfg);
    }
}
