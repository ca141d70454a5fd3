#pragma once
/// @file render.hpp
/// @brief 二维视图栅格渲染 (基于 OpenCV)

#include "view.hpp"
#include <opencv2/core.hpp>

namespace cave::view {

struct RenderOptions {
    int width = 1200;
    int height = 900;
    int margin = 48;              // 像素
    bool draw_labels = true;
    bool draw_title = true;
    double font_scale = 0.45;
    int marker_size = 9;
};

/// 世界坐标 -> 像素坐标 (等比例，纵轴向上)
class CAVEVIEW_API ViewTransform {
public:
    ViewTransform(const Projection& projection, const RenderOptions& options);

    [[nodiscard]] cv::Point2d to_pixel(double u, double v) const noexcept;
    [[nodiscard]] double scale() const noexcept { return scale_; }

private:
    double scale_ = 1.0;
    double min_u_ = 0.0;
    double min_v_ = 0.0;
    double offset_u_ = 0.0;   // 居中偏移
    double offset_v_ = 0.0;
    int height_ = 0;
    int margin_ = 0;
};

/// @brief 渲染二维投影 (平面图/剖面图/展开剖面)
/// @return kViewError: 三维投影；kInvalidArgument: 画布尺寸非法
[[nodiscard]] CAVEVIEW_API core::Result<cv::Mat> render(
    const Projection& projection, const RenderOptions& options = {});

}  // namespace cave::view
