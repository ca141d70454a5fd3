/// @file render.cpp
#include "render.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace cave::view {

namespace {

const cv::Scalar kBackground(255, 255, 255);
const cv::Scalar kLegColor(0, 0, 0);
const cv::Scalar kStationColor(180, 119, 31);   // BGR
const cv::Scalar kLabelColor(60, 60, 60);

// 跨度小于此值的轴按零跨度处理
constexpr double kMinSpan = 1e-9;

}  // namespace

ViewTransform::ViewTransform(const Projection& projection, const RenderOptions& options)
    : height_(options.height), margin_(options.margin) {
    const auto [lo, hi] = projection.bounds();
    if (lo.size() < 2) return;

    min_u_ = lo(0);
    min_v_ = lo(1);
    const double span_u = hi(0) - lo(0);
    const double span_v = hi(1) - lo(1);
    const double avail_u = options.width - 2.0 * options.margin;
    const double avail_v = options.height - 2.0 * options.margin;

    if (span_u > kMinSpan && span_v > kMinSpan) {
        scale_ = std::min(avail_u / span_u, avail_v / span_v);
    } else if (span_u > kMinSpan) {
        scale_ = avail_u / span_u;
    } else if (span_v > kMinSpan) {
        scale_ = avail_v / span_v;
    }

    offset_u_ = (avail_u - span_u * scale_) / 2.0;
    offset_v_ = (avail_v - span_v * scale_) / 2.0;
}

cv::Point2d ViewTransform::to_pixel(double u, double v) const noexcept {
    const double x = margin_ + offset_u_ + (u - min_u_) * scale_;
    const double y = height_ - (margin_ + offset_v_ + (v - min_v_) * scale_);
    return {x, y};
}

core::Result<cv::Mat> render(const Projection& projection, const RenderOptions& options) {
    if (projection.dimension() != 2) {
        return core::unexpected(core::Error{core::ErrorCode::kViewError,
            "Cannot rasterize a " + std::to_string(projection.dimension()) + "D projection"});
    }
    if (options.width <= 2 * options.margin || options.height <= 2 * options.margin) {
        return core::unexpected(core::Error{core::ErrorCode::kInvalidArgument,
            "Canvas too small for margin " + std::to_string(options.margin)});
    }

    cv::Mat image(options.height, options.width, CV_8UC3, kBackground);
    const ViewTransform transform(projection, options);

    std::vector<cv::Point> pixels;
    pixels.reserve(projection.size());
    for (Eigen::Index i = 0; i < projection.points.rows(); ++i) {
        const cv::Point2d p = transform.to_pixel(projection.points(i, 0), projection.points(i, 1));
        pixels.emplace_back(cvRound(p.x), cvRound(p.y));
    }

    for (const auto& [a, b] : projection.segments) {
        cv::line(image, pixels[static_cast<size_t>(a)], pixels[static_cast<size_t>(b)],
                 kLegColor, 1, cv::LINE_AA);
    }

    for (size_t i = 0; i < pixels.size(); ++i) {
        cv::drawMarker(image, pixels[i], kStationColor, cv::MARKER_TRIANGLE_UP,
                       options.marker_size, 1, cv::LINE_AA);
        if (options.draw_labels) {
            cv::putText(image, projection.labels[i], pixels[i] + cv::Point(4, -4),
                        cv::FONT_HERSHEY_SIMPLEX, options.font_scale, kLabelColor, 1, cv::LINE_AA);
        }
    }

    if (options.draw_title && !projection.title.empty()) {
        const std::string title = projection.title + " - " + view_kind_name(projection.kind);
        cv::putText(image, title, cv::Point(options.margin / 2, options.margin / 2 + 8),
                    cv::FONT_HERSHEY_SIMPLEX, options.font_scale * 1.5, kLegColor, 1, cv::LINE_AA);
    }

    CAVE_DEBUG("Rendered {} view {}x{} (scale {:.3f} px/unit)",
               view_kind_name(projection.kind), options.width, options.height, transform.scale());
    return image;
}

}  // namespace cave::view
