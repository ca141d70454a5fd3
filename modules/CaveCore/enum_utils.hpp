#pragma once
/// @file enum_utils.hpp
/// @brief 枚举工具 (基于 magic_enum)

#include <magic_enum/magic_enum.hpp>
#include <optional>
#include <string_view>

namespace cave::core {

/// @brief 枚举转字符串
template <typename E>
[[nodiscard]] constexpr std::string_view enum_name(E value) noexcept {
    return magic_enum::enum_name(value);
}

/// @brief 字符串转枚举 (区分大小写)
template <typename E>
[[nodiscard]] constexpr std::optional<E> enum_cast(std::string_view name) noexcept {
    return magic_enum::enum_cast<E>(name);
}

/// @brief 字符串转枚举 (忽略大小写，"plan" 可匹配 PLAN)
template <typename E>
[[nodiscard]] constexpr std::optional<E> enum_cast_icase(std::string_view name) noexcept {
    return magic_enum::enum_cast<E>(name, magic_enum::case_insensitive);
}

/// @brief 检查值是否为有效枚举
template <typename E>
[[nodiscard]] constexpr bool enum_contains(E value) noexcept {
    return magic_enum::enum_contains(value);
}

/// @brief 获取所有枚举值
template <typename E>
[[nodiscard]] constexpr auto enum_values() noexcept {
    return magic_enum::enum_values<E>();
}

}  // namespace cave::core
