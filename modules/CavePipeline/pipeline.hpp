#pragma once
/// @file pipeline.hpp
/// @brief CavePipeline: 读取 -> 构建测量网 -> 解算 -> 各视图输出

#if defined(_WIN32)
  #ifdef CAVEPIPELINE_EXPORTS
    #define CAVEPIPELINE_API __declspec(dllexport)
  #else
    #define CAVEPIPELINE_API __declspec(dllimport)
  #endif
#else
  #define CAVEPIPELINE_API __attribute__((visibility("default")))
#endif

#include "CaveCore.hpp"
#include "CaveSurvey.hpp"
#include "CaveView.hpp"
#include "CaveIO.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cave::pipeline {

// ============================================================================
// 流水线配置
// ============================================================================
struct PipelineConfig {
    std::vector<std::filesystem::path> inputs;   // 只处理第一个
    std::vector<std::string> views;              // 视图名称，见 view::parse_view_kind
    survey::NetworkConfig network;
    std::filesystem::path output_dir;            // 为空时使用输入文件所在目录
    bool write_outputs = true;                   // false: 只投影，不写文件
    bool binary_ply = false;
    view::RenderOptions render;
};

// ============================================================================
// 流水线结果
// ============================================================================
struct ViewOutput {
    std::string requested;                       // 请求的视图名
    std::optional<view::Projection> projection;
    std::optional<std::filesystem::path> file;
    std::optional<core::Error> error;            // 单个视图失败不影响其他视图

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

struct PipelineResult {
    survey::LinePlot plot;
    std::vector<ViewOutput> views;
    std::vector<survey::ToleranceWarning> warnings;

    [[nodiscard]] CAVEPIPELINE_API size_t failed_views() const noexcept;
};

// ============================================================================
// 流水线函数
// ============================================================================

/// @brief 从已读取的测段运行 (构建 + 解算 + 视图)
/// @return 构建或解算失败时返回对应错误
[[nodiscard]] CAVEPIPELINE_API core::Result<PipelineResult> run(
    std::vector<survey::Shot> shots, const PipelineConfig& config);

/// @brief 运行完整流水线，输入为 config.inputs 的第一个文件
[[nodiscard]] CAVEPIPELINE_API core::Result<PipelineResult> run(const PipelineConfig& config);

}  // namespace cave::pipeline
