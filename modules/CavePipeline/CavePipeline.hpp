#pragma once
/// @file CavePipeline.hpp
/// @brief CavePipeline 公开接口

#include "pipeline.hpp"

// 对外暴露：
// - PipelineConfig, PipelineResult, ViewOutput
// - run()
