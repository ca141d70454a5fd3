/// @file view.cpp
#include "view.hpp"
#include <algorithm>
#include <cctype>

namespace cave::view {

namespace {

[[nodiscard]] core::Error view_error(const std::string& msg) {
    return {core::ErrorCode::kViewError, msg};
}

[[nodiscard]] std::string to_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

/// @brief 按视图选取坐标轴
[[nodiscard]] Eigen::VectorXd select_axes(const survey::Station& station, ViewKind kind) {
    switch (kind) {
        case ViewKind::FULL_3D:
            return station.position;
        case ViewKind::PLAN:
            return station.position.head<2>();
        case ViewKind::PROFILE:
            return station.position.tail<2>();
        case ViewKind::FLATTENED_PROFILE:
            return station.flat_position;
    }
    return {};
}

}  // namespace

core::Result<ViewKind> parse_view_kind(std::string_view name) {
    if (auto kind = core::enum_cast_icase<ViewKind>(name)) {
        return *kind;
    }
    const std::string lower = to_lower(name);
    if (lower == "3d") return ViewKind::FULL_3D;
    if (lower == "flat" || lower == "flat_profile") return ViewKind::FLATTENED_PROFILE;
    return core::unexpected(view_error("Invalid view: " + std::string(name)));
}

std::string view_kind_name(ViewKind kind) {
    return to_lower(core::enum_name(kind));
}

std::pair<Eigen::VectorXd, Eigen::VectorXd> Projection::bounds() const {
    if (points.rows() == 0) {
        return {Eigen::VectorXd::Zero(dimension()), Eigen::VectorXd::Zero(dimension())};
    }
    return {points.colwise().minCoeff().transpose(), points.colwise().maxCoeff().transpose()};
}

core::Result<Projection> project(const survey::LinePlot& plot, ViewKind kind) {
    if (!core::enum_contains(kind)) {
        return core::unexpected(view_error(
            "Invalid view kind: " + std::to_string(static_cast<int>(kind))));
    }

    const auto n = static_cast<Eigen::Index>(plot.stations.size());
    Projection proj;
    proj.kind = kind;
    proj.title = plot.title;
    proj.points.resize(n, view_dimension(kind));
    proj.labels.reserve(plot.stations.size());

    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& station = plot.stations[static_cast<size_t>(i)];
        proj.points.row(i) = select_axes(station, kind).transpose();
        proj.labels.push_back(station.name);
    }

    proj.segments.reserve(plot.legs.size());
    for (const auto& leg : plot.legs) {
        proj.segments.emplace_back(
            static_cast<Eigen::Index>(plot.station_index.at(leg.from)),
            static_cast<Eigen::Index>(plot.station_index.at(leg.to)));
    }

    CAVE_DEBUG("Projected {} stations, {} segments to {} view",
               proj.size(), proj.segments.size(), view_kind_name(kind));
    return proj;
}

core::Result<Projection> project(const survey::LinePlot& plot, std::string_view view_name) {
    auto kind = parse_view_kind(view_name);
    if (!kind.has_value()) {
        return core::unexpected(std::move(kind.error()));
    }
    return project(plot, *kind);
}

}  // namespace cave::view
