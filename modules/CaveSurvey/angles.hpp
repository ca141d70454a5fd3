#pragma once
/// @file angles.hpp
/// @brief 角度归算：前后视校验与平均

#include "survey.hpp"
#include <optional>

namespace cave::survey {

/// @brief 归一化到 [0, 360)
[[nodiscard]] CAVESURVEY_API double normalize_degrees(double degrees) noexcept;

/// @brief 两个方向之间的最小夹角，范围 [0, 180]
[[nodiscard]] CAVESURVEY_API double angular_difference(double a, double b) noexcept;

/// @brief 两个方向的圆周平均，范围 [0, 360)
/// @note 两方向正好相反时合向量为零，返回 a
[[nodiscard]] CAVESURVEY_API double circular_mean(double a, double b) noexcept;

// ----------------------------------------------------------------------------
// 后视约定
//   方位角: 期望后视 = (前视 + 180) mod 360
//   倾角:   期望后视 = -前视，平均值 = (前视 - 后视) / 2
// 校验与平均使用同一约定
// ----------------------------------------------------------------------------

/// @brief 方位角后视与期望后视的偏差 (度)
[[nodiscard]] CAVESURVEY_API double azimuth_backsight_error(double fore, double back) noexcept;

/// @brief 倾角后视与期望后视的偏差 (度)
[[nodiscard]] CAVESURVEY_API double inclination_backsight_error(double fore, double back) noexcept;

/// @brief 方位角归算为单值；Absent 返回 nullopt
[[nodiscard]] CAVESURVEY_API std::optional<double> reduce_azimuth(const Reading& reading) noexcept;

/// @brief 倾角归算为单值；Absent 返回 nullopt
[[nodiscard]] CAVESURVEY_API std::optional<double> reduce_inclination(const Reading& reading) noexcept;

}  // namespace cave::survey
