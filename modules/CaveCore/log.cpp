/// @file log.cpp
#include "log.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>

namespace cave::core {

std::shared_ptr<spdlog::logger> Log::logger_ = nullptr;

namespace {

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kTrace:    return spdlog::level::trace;
        case LogLevel::kDebug:    return spdlog::level::debug;
        case LogLevel::kInfo:     return spdlog::level::info;
        case LogLevel::kWarn:     return spdlog::level::warn;
        case LogLevel::kError:    return spdlog::level::err;
        case LogLevel::kCritical: return spdlog::level::critical;
        case LogLevel::kOff:      return spdlog::level::off;
        default:                  return spdlog::level::info;
    }
}

LogLevel from_spdlog_level(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::kTrace;
        case spdlog::level::debug:    return LogLevel::kDebug;
        case spdlog::level::info:     return LogLevel::kInfo;
        case spdlog::level::warn:     return LogLevel::kWarn;
        case spdlog::level::err:      return LogLevel::kError;
        case spdlog::level::critical: return LogLevel::kCritical;
        case spdlog::level::off:      return LogLevel::kOff;
        default:                      return LogLevel::kInfo;
    }
}

}  // namespace

std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept {
    if (name == "trace")    return LogLevel::kTrace;
    if (name == "debug")    return LogLevel::kDebug;
    if (name == "info")     return LogLevel::kInfo;
    if (name == "warn" || name == "warning") return LogLevel::kWarn;
    if (name == "error")    return LogLevel::kError;
    if (name == "critical") return LogLevel::kCritical;
    if (name == "off")      return LogLevel::kOff;
    return std::nullopt;
}

void Log::init(std::string_view name, LogLevel level, std::string_view pattern) {
    const std::string logger_name(name);
    // 同名 logger 已注册时 spdlog 会抛异常，先移除
    spdlog::drop(logger_name);
    logger_ = spdlog::stdout_color_mt(logger_name);
    logger_->set_level(to_spdlog_level(level));
    logger_->set_pattern(std::string(pattern));
}

void Log::set_level(LogLevel level) {
    logger()->set_level(to_spdlog_level(level));
}

LogLevel Log::level() {
    return from_spdlog_level(logger()->level());
}

std::shared_ptr<spdlog::logger>& Log::logger() {
    if (!logger_) {
        // 懒初始化
        init();
    }
    return logger_;
}

// ============================================================================
// LogCapture
// ============================================================================

LogCapture::LogCapture()
    : stream_(std::make_shared<std::ostringstream>()) {
    sink_ = std::make_shared<spdlog::sinks::ostream_sink_mt>(*stream_);
    sink_->set_pattern("[%l] %v");
    Log::logger()->sinks().push_back(sink_);
}

LogCapture::~LogCapture() {
    auto& sinks = Log::logger()->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
}

std::string LogCapture::text() const {
    return stream_->str();
}

bool LogCapture::contains(std::string_view needle) const {
    return stream_->str().find(needle) != std::string::npos;
}

}  // namespace cave::core
