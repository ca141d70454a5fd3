#pragma once
/// @file log.hpp
/// @brief CaveMap 日志系统 (基于 spdlog)

#include "core.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <optional>
#include <sstream>

namespace cave::core {

// ============================================================================
// 日志级别
// ============================================================================
enum class LogLevel : uint8_t {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarn,
    kError,
    kCritical,
    kOff,
};

/// @brief 解析日志级别名称 ("trace", "debug", "info", "warn", "error", "critical", "off")
[[nodiscard]] CAVECORE_API std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept;

// ============================================================================
// 日志类
// ============================================================================
class CAVECORE_API Log {
public:
    /// @brief 初始化日志系统 (重复调用会替换已有 logger)
    /// @param name 日志器名称
    /// @param level 日志级别
    /// @param pattern 日志格式 (spdlog pattern)
    static void init(
        std::string_view name = "cavemap",
        LogLevel level = LogLevel::kInfo,
        std::string_view pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    static void set_level(LogLevel level);

    [[nodiscard]] static LogLevel level();

    /// @brief 获取 spdlog logger (高级用法)
    [[nodiscard]] static std::shared_ptr<spdlog::logger>& logger();

    template <typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->trace(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->debug(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->info(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->warn(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->error(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// 日志捕获 (RAII)，析构时自动移除 sink
// ============================================================================
class CAVECORE_API LogCapture {
public:
    LogCapture();
    ~LogCapture();

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    /// @brief 已捕获的全部文本 (每条日志只含消息与级别)
    [[nodiscard]] std::string text() const;

    /// @brief 捕获文本中是否包含子串
    [[nodiscard]] bool contains(std::string_view needle) const;

private:
    std::shared_ptr<std::ostringstream> stream_;
    spdlog::sink_ptr sink_;
};

// ============================================================================
// 便捷宏
// ============================================================================
#define CAVE_TRACE(...)    ::cave::core::Log::trace(__VA_ARGS__)
#define CAVE_DEBUG(...)    ::cave::core::Log::debug(__VA_ARGS__)
#define CAVE_INFO(...)     ::cave::core::Log::info(__VA_ARGS__)
#define CAVE_WARN(...)     ::cave::core::Log::warn(__VA_ARGS__)
#define CAVE_ERROR(...)    ::cave::core::Log::error(__VA_ARGS__)
#define CAVE_CRITICAL(...) ::cave::core::Log::critical(__VA_ARGS__)

}  // namespace cave::core
