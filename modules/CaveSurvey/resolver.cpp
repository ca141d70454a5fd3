/// @file resolver.cpp
#include "resolver.hpp"
#include "angles.hpp"
#include <cmath>
#include <deque>

namespace cave::survey {

namespace {

constexpr double kDegToRad = EIGEN_PI / 180.0;

[[nodiscard]] core::Error connectivity_error(const std::string& msg) {
    return {core::ErrorCode::kConnectivityError, msg};
}

/// @brief 角度归算，Absent 在 add_shot 中已被拒绝
[[nodiscard]] core::Result<Leg> reduce_shot(const Shot& shot) {
    const auto azimuth = reduce_azimuth(shot.azimuth);
    const auto inclination = reduce_inclination(shot.inclination);
    if (!azimuth || !inclination) {
        return core::unexpected(core::Error{core::ErrorCode::kValidationError,
                                            "Shot " + shot.label() + " has no azimuth/inclination"});
    }

    Leg leg;
    leg.from = shot.from;
    leg.to = shot.name;
    leg.distance = shot.distance;
    leg.azimuth = *azimuth;
    leg.inclination = *inclination;
    leg.left = shot.left;
    leg.right = shot.right;
    leg.up = shot.up;
    leg.down = shot.down;
    leg.note = shot.note;
    return leg;
}

}  // namespace

const Station* LinePlot::find_station(const std::string& name) const {
    auto it = station_index.find(name);
    return it == station_index.end() ? nullptr : &stations[it->second];
}

double LinePlot::total_length() const noexcept {
    double total = 0.0;
    for (const auto& leg : legs) total += leg.distance;
    return total;
}

std::pair<core::Vec3d, core::Vec3d> LinePlot::bounding_box() const {
    if (empty()) return {core::Vec3d::Zero(), core::Vec3d::Zero()};
    core::Vec3d min_pt = stations[0].position, max_pt = stations[0].position;
    for (size_t i = 1; i < stations.size(); ++i) {
        min_pt = min_pt.cwiseMin(stations[i].position);
        max_pt = max_pt.cwiseMax(stations[i].position);
    }
    return {min_pt, max_pt};
}

core::Vec3d forward_position(
    const core::Vec3d& prev, double distance, double azimuth, double inclination) noexcept {
    const double a = azimuth * kDegToRad;
    const double i = inclination * kDegToRad;
    const double horizontal = distance * std::cos(i);
    return prev + core::Vec3d(horizontal * std::sin(a),
                              horizontal * std::cos(a),
                              distance * std::sin(i));
}

core::Vec2d flat_position(const core::Vec2d& prev, double distance, double inclination) noexcept {
    const double i = inclination * kDegToRad;
    return prev + core::Vec2d(distance * std::cos(i), distance * std::sin(i));
}

core::Result<LinePlot> resolve(const SurveyNetwork& network) {
    const auto& shots = network.shots();
    if (shots.empty()) {
        return core::unexpected(core::Error{core::ErrorCode::kInvalidArgument,
                                            "Survey network has no shots"});
    }

    // 1. 角度归算
    std::vector<Leg> legs;
    legs.reserve(shots.size());
    for (const auto& shot : shots) {
        auto leg = reduce_shot(shot);
        if (!leg.has_value()) return core::unexpected(std::move(leg.error()));
        legs.push_back(std::move(leg.value()));
    }

    // 出边表: 测站名 -> 从该测站出发的测段 (保持输入顺序)
    std::unordered_map<std::string, std::vector<size_t>> outgoing;
    for (size_t i = 0; i < legs.size(); ++i) {
        outgoing[legs[i].from].push_back(i);
    }

    // 2. 固定原点
    LinePlot plot;
    plot.title = network.config().title;
    plot.distance_units = network.config().distance_units;
    plot.origin_name = shots.front().from;
    plot.warnings = network.warnings();
    plot.stations.reserve(shots.size() + 1);
    plot.legs.reserve(shots.size());

    Station origin;
    origin.name = plot.origin_name;
    plot.station_index.emplace(origin.name, 0);
    plot.stations.push_back(std::move(origin));

    // 3. 工作队列传播；测站名唯一，每条测段最多入队一次
    std::deque<size_t> queue;
    const auto enqueue_from = [&](const std::string& name) {
        auto it = outgoing.find(name);
        if (it == outgoing.end()) return;
        queue.insert(queue.end(), it->second.begin(), it->second.end());
    };
    enqueue_from(plot.origin_name);

    while (!queue.empty()) {
        const size_t idx = queue.front();
        queue.pop_front();
        Leg& leg = legs[idx];

        const Station& prev = plot.stations[plot.station_index.at(leg.from)];
        Station station;
        station.name = leg.to;
        station.from = leg.from;
        station.position = forward_position(prev.position, leg.distance, leg.azimuth, leg.inclination);
        station.flat_position = flat_position(prev.flat_position, leg.distance, leg.inclination);
        CAVE_DEBUG("Resolved {} at ({:.3f}, {:.3f}, {:.3f})", station.name,
                   station.position.x(), station.position.y(), station.position.z());

        plot.station_index.emplace(station.name, plot.stations.size());
        plot.stations.push_back(std::move(station));
        plot.legs.push_back(std::move(leg));
        enqueue_from(plot.stations.back().name);
    }

    if (plot.legs.size() != legs.size()) {
        std::string unreachable;
        size_t count = 0;
        for (const auto& shot : shots) {
            if (plot.station_index.count(shot.name)) continue;
            if (count++ > 0) unreachable += ", ";
            unreachable += shot.name;
        }
        return core::unexpected(connectivity_error(fmt::format(
            "{} station(s) do not connect to origin '{}': {}",
            count, plot.origin_name, unreachable)));
    }

    CAVE_INFO("Resolved {} stations from origin '{}', total length {:.2f} {}",
              plot.stations.size(), plot.origin_name, plot.total_length(), plot.distance_units);
    return plot;
}

}  // namespace cave::survey
