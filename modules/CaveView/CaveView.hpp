#pragma once
/// @file CaveView.hpp
/// @brief CaveView 公开接口

#include "view.hpp"
#include "render.hpp"

// 对外暴露：
// - 视图类型: ViewKind, parse_view_kind(), view_kind_name()
// - 投影: project() -> Projection
// - 渲染: render() -> cv::Mat, RenderOptions, ViewTransform
