#pragma once
/// @file io.hpp
/// @brief CaveIO 内部实现

#if defined(_WIN32)
  #ifdef CAVEIO_EXPORTS
    #define CAVEIO_API __declspec(dllexport)
  #else
    #define CAVEIO_API __declspec(dllimport)
  #endif
#else
  #define CAVEIO_API __attribute__((visibility("default")))
#endif

#include "CaveCore.hpp"
#include "CaveSurvey.hpp"
#include <opencv2/core.hpp>
#include <filesystem>
#include <istream>
#include <optional>
#include <string_view>
#include <vector>

namespace cave::io {

// ============================================================================
// 测段表格 (CSV)
// ============================================================================

/// @brief 解析一个读数单元格
/// 空 -> Absent；单个小数 -> Single；"a/b" -> Paired (只取前两段)
/// @return 无法解析时返回 nullopt
[[nodiscard]] CAVEIO_API std::optional<survey::Reading> parse_reading(std::string_view text);

/// @brief 从流中读取测段表
/// 首行为表头，列顺序任意：from, name, note, distance, azimuth, inclination, left, right, up, down
/// from / name / distance 三列必须存在，其余缺失列按空值处理
/// @param source 出错时用于提示的来源名称
/// @return kParseError: 缺少必需列，或某单元格无法解析 (报告行号与列名)
[[nodiscard]] CAVEIO_API core::Result<std::vector<survey::Shot>> parse_shots_csv(
    std::istream& is, std::string_view source = "<stream>");

/// @brief 读取测段 CSV 文件
/// @return kFileNotFound / kParseError
[[nodiscard]] CAVEIO_API core::Result<std::vector<survey::Shot>> read_shots_csv(
    const std::filesystem::path& path);

// ============================================================================
// 图像输出
// ============================================================================

/// @brief 写出栅格图像 (格式由后缀决定，通常为 .png)
/// @return kWriteError
[[nodiscard]] CAVEIO_API core::Result<void> write_image(
    const std::filesystem::path& path, const cv::Mat& image);

}  // namespace cave::io
