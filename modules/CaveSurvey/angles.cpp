/// @file angles.cpp
#include "angles.hpp"
#include <cmath>

namespace cave::survey {

namespace {

constexpr double kDegToRad = EIGEN_PI / 180.0;
constexpr double kRadToDeg = 180.0 / EIGEN_PI;

// 合向量长度低于此值视为两方向相反
constexpr double kDegenerateNorm = 1e-12;

}  // namespace

double normalize_degrees(double degrees) noexcept {
    double r = std::fmod(degrees, 360.0);
    if (r < 0.0) r += 360.0;
    // -1e-17 + 360 在 double 中等于 360
    if (r >= 360.0) r -= 360.0;
    return r;
}

double angular_difference(double a, double b) noexcept {
    const double d = normalize_degrees(a - b);
    return d > 180.0 ? 360.0 - d : d;
}

double circular_mean(double a, double b) noexcept {
    const double s = std::sin(a * kDegToRad) + std::sin(b * kDegToRad);
    const double c = std::cos(a * kDegToRad) + std::cos(b * kDegToRad);
    if (std::hypot(s, c) < kDegenerateNorm) {
        return normalize_degrees(a);
    }
    return normalize_degrees(std::atan2(s, c) * kRadToDeg);
}

double azimuth_backsight_error(double fore, double back) noexcept {
    const double expected_back = normalize_degrees(fore + 180.0);
    return angular_difference(back, expected_back);
}

double inclination_backsight_error(double fore, double back) noexcept {
    const double expected_back = -fore;
    return std::abs(back - expected_back);
}

std::optional<double> reduce_azimuth(const Reading& reading) noexcept {
    if (const auto* single = std::get_if<Single>(&reading)) {
        return single->value;
    }
    if (const auto* paired = std::get_if<Paired>(&reading)) {
        return circular_mean(paired->fore, normalize_degrees(paired->back + 180.0));
    }
    return std::nullopt;
}

std::optional<double> reduce_inclination(const Reading& reading) noexcept {
    if (const auto* single = std::get_if<Single>(&reading)) {
        return single->value;
    }
    if (const auto* paired = std::get_if<Paired>(&reading)) {
        return (paired->fore - paired->back) / 2.0;
    }
    return std::nullopt;
}

}  // namespace cave::survey
