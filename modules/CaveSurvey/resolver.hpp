#pragma once
/// @file resolver.hpp
/// @brief 测站坐标解算：从原点沿测段向外传播

#include "survey.hpp"
#include <utility>

namespace cave::survey {

struct Station {
    std::string name;
    core::Vec3d position = core::Vec3d::Zero();       // x 东, y 北, z 上
    core::Vec2d flat_position = core::Vec2d::Zero();  // 展开剖面 (累计水平距离, z)
    std::string from;                                 // 前一测站，原点为空
};

/// 解算后的测段，方位角/倾角已归算为单值 (度)
struct Leg {
    std::string from;
    std::string to;
    double      distance = 0.0;
    double      azimuth = 0.0;
    double      inclination = 0.0;
    Reading     left;
    Reading     right;
    Reading     up;
    Reading     down;
    std::string note;
};

/// @brief 解算完成的线图 (只读)
/// stations 按解算顺序排列，stations[0] 为原点，legs[i] 终点为 stations[i + 1]
struct LinePlot {
    std::string title;
    std::string distance_units;
    std::string origin_name;
    std::vector<Station> stations;
    std::vector<Leg> legs;
    std::unordered_map<std::string, size_t> station_index;
    std::vector<ToleranceWarning> warnings;

    [[nodiscard]] size_t size() const noexcept { return stations.size(); }
    [[nodiscard]] bool empty() const noexcept { return stations.empty(); }

    [[nodiscard]] CAVESURVEY_API const Station* find_station(const std::string& name) const;

    /// 所有测段长度之和
    [[nodiscard]] CAVESURVEY_API double total_length() const noexcept;

    [[nodiscard]] CAVESURVEY_API std::pair<core::Vec3d, core::Vec3d> bounding_box() const;
};

/// @brief 前向坐标公式 (角度单位: 度)
[[nodiscard]] CAVESURVEY_API core::Vec3d forward_position(
    const core::Vec3d& prev, double distance, double azimuth, double inclination) noexcept;

/// @brief 展开剖面坐标公式，忽略方位角
[[nodiscard]] CAVESURVEY_API core::Vec2d flat_position(
    const core::Vec2d& prev, double distance, double inclination) noexcept;

/// @brief 解算测量网中所有测站坐标
/// @return kInvalidArgument: 空测量网
///         kConnectivityError: 存在无法从原点到达的测站 (不返回部分结果)
[[nodiscard]] CAVESURVEY_API core::Result<LinePlot> resolve(const SurveyNetwork& network);

}  // namespace cave::survey
