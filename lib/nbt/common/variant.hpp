/* This file is part of NBT Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef NBT_TURBO_COMMON_VARIANT_HPP
#define NBT_TURBO_COMMON_VARIANT_HPP

#include <variant>
#include <cstddef>
#include <type_traits>

namespace nbt::variant {
    template<typename T, typename V, size_t I=0>
    constexpr size_t index_of() noexcept
    {
        static_assert(I < std::variant_size_v<V>, "the type is not an alternative of the variant");
        if constexpr (std::is_same_v<std::variant_alternative_t<I, V>, T>)
            return I;
        else
            return index_of<T, V, I + 1>();
    }
}

#endif // !NBT_TURBO_COMMON_VARIANT_HPP
