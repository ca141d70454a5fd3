#pragma once
/// @file CaveIO.hpp
/// @brief CaveIO 公开接口

#include "io.hpp"
#include "ply.hpp"

// 对外暴露：
// - 测段表: parse_reading(), parse_shots_csv(), read_shots_csv()
// - PLY 线图: PlyFile::write_line_plot(), PlyFile::read_header()
// - 图像: write_image()
