/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */

#include <algorithm>
#include <utility>
#include <nbt/value.hpp>

namespace nbt {
    list::~list()
    {
        if (_nested()) [[unlikely]] {
            std::vector<value> pending {};
            _release(pending);
            value::_drain(pending);
        }
    }

    size_t list::size() const noexcept
    {
        return std::visit([](const auto &v) -> size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, list_empty>)
                return 0;
            else
                return v.size();
        }, base());
    }

    bool list::_nested() const noexcept
    {
        if (const auto *ll = std::get_if<std::vector<list>>(&base()); ll)
            return !ll->empty();
        if (const auto *lc = std::get_if<std::vector<compound>>(&base()); lc)
            return !lc->empty();
        return false;
    }

    void list::_release(std::vector<value> &pending)
    {
        if (auto *ll = std::get_if<std::vector<list>>(&base()); ll) {
            for (auto &l: *ll)
                pending.emplace_back(std::move(l));
            ll->clear();
        } else if (auto *lc = std::get_if<std::vector<compound>>(&base()); lc) {
            for (auto &c: *lc)
                pending.emplace_back(std::move(c));
            lc->clear();
        }
    }

    value::~value()
    {
        if (_nested()) [[unlikely]] {
            std::vector<value> pending {};
            _release(pending);
            _drain(pending);
        }
    }

    void value::_drain(std::vector<value> &pending)
    {
        // a released value holds only empty containers, so its destructor does not descend
        while (!pending.empty()) {
            auto v = std::move(pending.back());
            pending.pop_back();
            v._release(pending);
        }
    }

    bool value::_nested() const noexcept
    {
        if (const auto *c = std::get_if<compound>(&base()); c)
            return !c->empty();
        if (const auto *l = std::get_if<list>(&base()); l)
            return l->_nested();
        return false;
    }

    void value::_release(std::vector<value> &pending)
    {
        if (auto *c = std::get_if<compound>(&base()); c) {
            for (auto &[k, v]: *c)
                pending.emplace_back(std::move(v));
            c->clear();
        } else if (auto *l = std::get_if<list>(&base()); l) {
            l->_release(pending);
        }
    }

    using copy_item = std::variant<std::pair<const value *, value *>, std::pair<const list *, list *>,
        std::pair<const compound *, compound *>>;

    // Destinations are created before they are queued and are never moved afterwards:
    // compound nodes are stable and nested list vectors are sized once.
    static void copy_tree(std::vector<copy_item> &todo)
    {
        while (!todo.empty()) {
            const auto item = todo.back();
            todo.pop_back();
            std::visit([&](const auto &p) {
                const auto src = p.first;
                const auto dst = p.second;
                using T = std::decay_t<decltype(*dst)>;
                if constexpr (std::is_same_v<T, compound>) {
                    for (const auto &[k, v]: *src) {
                        auto &slot = dst->emplace(k, value {}).first->second;
                        todo.emplace_back(std::pair<const value *, value *> { &v, &slot });
                    }
                } else if constexpr (std::is_same_v<T, list>) {
                    if (const auto *ll = std::get_if<std::vector<list>>(&src->base()); ll) {
                        auto &items = dst->base().template emplace<std::vector<list>>(ll->size());
                        for (size_t i = 0; i < items.size(); ++i)
                            todo.emplace_back(std::pair<const list *, list *> { &(*ll)[i], &items[i] });
                    } else if (const auto *lc = std::get_if<std::vector<compound>>(&src->base()); lc) {
                        auto &items = dst->base().template emplace<std::vector<compound>>(lc->size());
                        for (size_t i = 0; i < items.size(); ++i)
                            todo.emplace_back(std::pair<const compound *, compound *> { &(*lc)[i], &items[i] });
                    } else {
                        dst->base() = src->base();
                    }
                } else {
                    if (const auto *c = std::get_if<compound>(&src->base()); c) {
                        auto &dc = dst->base().template emplace<compound>();
                        todo.emplace_back(std::pair<const compound *, compound *> { c, &dc });
                    } else if (const auto *l = std::get_if<list>(&src->base()); l) {
                        auto &dl = dst->base().template emplace<list>();
                        todo.emplace_back(std::pair<const list *, list *> { l, &dl });
                    } else {
                        dst->base() = src->base();
                    }
                }
            }, item);
        }
    }

    using compare_item = std::variant<std::pair<const value *, const value *>, std::pair<const list *, const list *>,
        std::pair<const compound *, const compound *>>;

    template<typename T>
    static bool queue_elements(const list &x, const list &y, std::vector<compare_item> &todo)
    {
        const auto &xs = std::get<std::vector<T>>(x.base());
        const auto &ys = std::get<std::vector<T>>(y.base());
        if (xs.size() != ys.size())
            return false;
        for (size_t i = 0; i < xs.size(); ++i)
            todo.emplace_back(std::pair<const T *, const T *> { &xs[i], &ys[i] });
        return true;
    }

    static bool equal_trees(std::vector<compare_item> &todo)
    {
        while (!todo.empty()) {
            const auto item = todo.back();
            todo.pop_back();
            const bool same = std::visit([&](const auto &p) {
                const auto &x = *p.first;
                const auto &y = *p.second;
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, compound>) {
                    if (x.size() != y.size())
                        return false;
                    for (auto xi = x.begin(), yi = y.begin(); xi != x.end(); ++xi, ++yi) {
                        if (xi->first != yi->first)
                            return false;
                        todo.emplace_back(std::pair<const value *, const value *> { &xi->second, &yi->second });
                    }
                    return true;
                } else if constexpr (std::is_same_v<T, list>) {
                    if (x.index() != y.index())
                        return false;
                    switch (x.element_type()) {
                        case tag_type::list: return queue_elements<list>(x, y, todo);
                        case tag_type::compound: return queue_elements<compound>(x, y, todo);
                        default: return x.base() == y.base();
                    }
                } else {
                    if (x.index() != y.index())
                        return false;
                    if (const auto *c = std::get_if<compound>(&x.base()); c) {
                        todo.emplace_back(std::pair<const compound *, const compound *> { c, &std::get<compound>(y.base()) });
                        return true;
                    }
                    if (const auto *l = std::get_if<list>(&x.base()); l) {
                        todo.emplace_back(std::pair<const list *, const list *> { l, &std::get<list>(y.base()) });
                        return true;
                    }
                    return x.base() == y.base();
                }
            }, item);
            if (!same)
                return false;
        }
        return true;
    }

    list::list(const list &o): list_base {}
    {
        std::vector<copy_item> todo {};
        todo.emplace_back(std::pair<const list *, list *> { &o, this });
        copy_tree(todo);
    }

    list &list::operator=(const list &o)
    {
        if (this != &o)
            *this = list { o };
        return *this;
    }

    bool list::operator==(const list &o) const
    {
        std::vector<compare_item> todo {};
        todo.emplace_back(std::pair<const list *, const list *> { this, &o });
        return equal_trees(todo);
    }

    value::value(const value &o): value_base {}
    {
        std::vector<copy_item> todo {};
        todo.emplace_back(std::pair<const value *, value *> { &o, this });
        copy_tree(todo);
    }

    value &value::operator=(const value &o)
    {
        if (this != &o)
            *this = value { o };
        return *this;
    }

    bool value::operator==(const value &o) const
    {
        std::vector<compare_item> todo {};
        todo.emplace_back(std::pair<const value *, const value *> { this, &o });
        return equal_trees(todo);
    }

    tree_stats stats(const value &root)
    {
        using item_ptr = std::variant<const list *, const compound *>;
        struct item {
            item_ptr ptr;
            size_t depth;
        };
        tree_stats res {};
        std::vector<item> todo {};
        const auto add_value = [&](const value &v, const size_t depth) {
            ++res.counts[static_cast<size_t>(v.type())];
            res.max_depth = std::max(res.max_depth, depth);
            if (const auto *c = std::get_if<compound>(&v.base()); c)
                todo.push_back(item { c, depth });
            else if (const auto *l = std::get_if<list>(&v.base()); l)
                todo.push_back(item { l, depth });
        };
        add_value(root, 1);
        while (!todo.empty()) {
            const auto [ptr, depth] = todo.back();
            todo.pop_back();
            if (const auto *c = std::get_if<const compound *>(&ptr); c) {
                for (const auto &[k, v]: **c)
                    add_value(v, depth + 1);
            } else {
                const auto &l = *std::get<const list *>(ptr);
                const auto sz = l.size();
                if (!sz)
                    continue;
                res.counts[static_cast<size_t>(l.element_type())] += sz;
                res.max_depth = std::max(res.max_depth, depth + 1);
                if (const auto *ll = std::get_if<std::vector<list>>(&l.base()); ll) {
                    for (const auto &el: *ll)
                        todo.push_back(item { &el, depth + 1 });
                } else if (const auto *lc = std::get_if<std::vector<compound>>(&l.base()); lc) {
                    for (const auto &el: *lc)
                        todo.push_back(item { &el, depth + 1 });
                }
            }
        }
        return res;
    }
}
