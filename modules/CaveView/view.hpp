#pragma once
/// @file view.hpp
/// @brief 视图投影：从解算结果中选取视图所需的坐标轴

#if defined(_WIN32)
  #ifdef CAVEVIEW_EXPORTS
    #define CAVEVIEW_API __declspec(dllexport)
  #else
    #define CAVEVIEW_API __declspec(dllimport)
  #endif
#else
  #define CAVEVIEW_API __attribute__((visibility("default")))
#endif

#include "CaveCore.hpp"
#include "CaveSurvey.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cave::view {

// ============================================================================
// 视图类型
// ============================================================================
enum class ViewKind : uint8_t {
    FULL_3D = 0,        // (x, y, z)
    PLAN,               // 平面图 (x, y)，去掉垂直轴
    PROFILE,            // 剖面图 (y, z)，去掉东西轴
    FLATTENED_PROFILE,  // 展开剖面 (w, z)
};

/// @brief 视图维度 (2 或 3)
[[nodiscard]] constexpr int view_dimension(ViewKind kind) noexcept {
    return kind == ViewKind::FULL_3D ? 3 : 2;
}

/// @brief 解析视图名称 (忽略大小写)
/// 支持 full_3d / plan / profile / flattened_profile，以及别名 3d / flat / flat_profile
/// @return kViewError: 未知名称
[[nodiscard]] CAVEVIEW_API core::Result<ViewKind> parse_view_kind(std::string_view name);

/// @brief 视图名称 (小写，用于文件名)
[[nodiscard]] CAVEVIEW_API std::string view_kind_name(ViewKind kind);

// ============================================================================
// 投影结果
// ============================================================================
struct Projection {
    ViewKind kind = ViewKind::FULL_3D;
    std::string title;
    core::MatXd points;                                // N x dim，行顺序与 labels 一致
    std::vector<std::string> labels;
    std::vector<std::pair<Eigen::Index, Eigen::Index>> segments;  // points 行下标对

    [[nodiscard]] Eigen::Index dimension() const noexcept { return points.cols(); }
    [[nodiscard]] size_t size() const noexcept { return labels.size(); }
    [[nodiscard]] bool empty() const noexcept { return labels.empty(); }

    /// @brief 包围盒 {min, max}，空投影返回零向量
    [[nodiscard]] CAVEVIEW_API std::pair<Eigen::VectorXd, Eigen::VectorXd> bounds() const;
};

/// @brief 把线图投影到指定视图
/// @note 不做旋转：剖面图固定沿南北方向
/// @return kViewError: 非法 ViewKind
[[nodiscard]] CAVEVIEW_API core::Result<Projection> project(
    const survey::LinePlot& plot, ViewKind kind);

/// @brief 按名称投影，名称非法时返回 kViewError
[[nodiscard]] CAVEVIEW_API core::Result<Projection> project(
    const survey::LinePlot& plot, std::string_view view_name);

}  // namespace cave::view
