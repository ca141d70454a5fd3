#pragma once
/// @file CaveSurvey.hpp
/// @brief CaveSurvey 公开接口

#include "survey.hpp"
#include "angles.hpp"
#include "resolver.hpp"

// 对外暴露：
// - 读数与测段: Reading (Absent / Single / Paired), Shot
// - 测量网构建: SurveyNetwork, NetworkConfig, ToleranceWarning
// - 角度归算: circular_mean(), reduce_azimuth(), reduce_inclination(), ...
// - 坐标解算: resolve() -> LinePlot (Station, Leg)
