#pragma once
/// @file CaveCore.hpp
/// @brief CaveCore 公开接口 - 只暴露必要的 API

#include "core.hpp"
#include "log.hpp"
#include "enum_utils.hpp"

// 对外暴露：
// - 基础类型别名 (Vec2d, Vec3d, ...)
// - 错误处理 (Error, Result<T>)
// - 日志系统 (Log, CAVE_INFO, ...)
// - 枚举工具 (enum_name, enum_cast, ...)
// - version()
