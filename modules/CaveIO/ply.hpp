#pragma once
/// @file ply.hpp
/// @brief PLY 线图导出 (vertex + edge)

#include "CaveCore.hpp"
#include "CaveView.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace cave::io {

enum class PlyFormat : uint8_t {
    Ascii = 0,
    BinaryLittleEndian,
    BinaryBigEndian,
};

struct PlyElement {
    std::string name;
    size_t count = 0;
    std::vector<std::string> properties;   // 属性名，按声明顺序

    [[nodiscard]] bool has_property(std::string_view prop_name) const;
};

struct PlyHeader {
    PlyFormat format = PlyFormat::Ascii;
    std::vector<PlyElement> elements;
    std::vector<std::string> comments;

    [[nodiscard]] const PlyElement* find_element(std::string_view name) const;
    [[nodiscard]] size_t vertex_count() const;
    [[nodiscard]] size_t edge_count() const;
    [[nodiscard]] bool is_binary() const { return format != PlyFormat::Ascii; }
};

class PlyFile {
public:
    PlyFile() = default;

    [[nodiscard]] static core::Result<PlyHeader> read_header(const std::filesystem::path& path);

    /// @brief 写出线图：测站为 vertex (float x y z)，测段为 edge (int vertex1 vertex2)
    /// 二维投影的 z 写 0；测站名写入 "comment station <index> <name>"
    [[nodiscard]] static core::Result<void> write_line_plot(
        const std::filesystem::path& path,
        const view::Projection& projection,
        bool binary = false);
};

using Ply = PlyFile;

}  // namespace cave::io
