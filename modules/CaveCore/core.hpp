#pragma once
/// @file core.hpp
/// @brief CaveCore 内部实现

// ============================================================================
// DLL 导出宏
// ============================================================================
#if defined(_WIN32)
  #ifdef CAVECORE_EXPORTS
    #define CAVECORE_API __declspec(dllexport)
  #else
    #define CAVECORE_API __declspec(dllimport)
  #endif
#else
  #define CAVECORE_API __attribute__((visibility("default")))
#endif

#include <Eigen/Core>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cave::core {

// ============================================================================
// 类型别名
// ============================================================================
using Vec2d = Eigen::Vector2d;
using Vec3d = Eigen::Vector3d;
using MatXd = Eigen::MatrixXd;

// ============================================================================
// 错误处理
// ============================================================================
enum class ErrorCode : uint32_t {
    kSuccess = 0,
    kFileNotFound,
    kParseError,
    kInvalidArgument,
    kValidationError,    // 测段数据非法 (距离 <= 0, 未知起点, 重名测站)
    kConnectivityError,  // 存在无法从原点到达的测站
    kViewError,          // 未知视图类型
    kUnsupportedFormat,
    kWriteError,
};

struct Error {
    ErrorCode   code = ErrorCode::kSuccess;
    std::string message;
    [[nodiscard]] bool ok() const noexcept { return code == ErrorCode::kSuccess; }
};

/// @brief 错误码名称 (用于日志与命令行输出)
[[nodiscard]] CAVECORE_API std::string_view error_code_name(ErrorCode code) noexcept;

// ============================================================================
// C++17 兼容的 Expected 实现
// ============================================================================
template <typename E>
struct Unexpected {
    E error;
    explicit Unexpected(E e) : error(std::move(e)) {}
};

template <typename E>
Unexpected<std::decay_t<E>> unexpected(E&& e) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(e));
}

template <typename T, typename E>
class Expected {
    std::variant<T, E> data_;

public:
    Expected(T value) : data_(std::move(value)) {}
    Expected(Unexpected<E> err) : data_(std::move(err.error)) {}

    [[nodiscard]] bool has_value() const noexcept { return std::holds_alternative<T>(data_); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    [[nodiscard]] E& error() & { return std::get<E>(data_); }
    [[nodiscard]] const E& error() const& { return std::get<E>(data_); }
    [[nodiscard]] E&& error() && { return std::get<E>(std::move(data_)); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
};

// void 特化：用于只返回成功/失败的函数
template <typename E>
class Expected<void, E> {
    std::optional<E> error_;

public:
    Expected() = default;
    Expected(Unexpected<E> err) : error_(std::move(err.error)) {}

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] E& error() & { return *error_; }
    [[nodiscard]] const E& error() const& { return *error_; }
};

template <typename T>
using Result = Expected<T, Error>;

// ============================================================================
// 版本
// ============================================================================
[[nodiscard]] CAVECORE_API std::string_view version() noexcept;

}  // namespace cave::core
