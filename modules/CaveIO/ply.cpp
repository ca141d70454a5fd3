/// @file ply.cpp
/// @brief PLY 线图读写实现

#include "ply.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace cave::io
{
	namespace
	{
		[[nodiscard]] core::Error file_error(const std::filesystem::path& path, const std::string& msg)
		{
			return {core::ErrorCode::kFileNotFound, msg + ": " + path.string()};
		}

		[[nodiscard]] core::Error parse_error(const std::string& msg)
		{
			return {core::ErrorCode::kParseError, msg};
		}

		[[nodiscard]] core::Error write_error(const std::filesystem::path& path, const std::string& msg)
		{
			return {core::ErrorCode::kWriteError, msg + ": " + path.string()};
		}

		// ============================================================================
		// Header 写入
		// ============================================================================

		void write_line_plot_header(std::ostream& os, const view::Projection& projection, bool binary)
		{
			os << "ply\n";
			os << "format " << (binary ? "binary_little_endian" : "ascii") << " 1.0\n";
			if (!projection.title.empty())
			{
				os << "comment title " << projection.title << "\n";
			}
			os << "comment view " << view::view_kind_name(projection.kind) << "\n";
			for (size_t i = 0; i < projection.labels.size(); ++i)
			{
				os << "comment station " << i << " " << projection.labels[i] << "\n";
			}
			os << "element vertex " << projection.size() << "\n";
			os << "property float x\n";
			os << "property float y\n";
			os << "property float z\n";
			os << "element edge " << projection.segments.size() << "\n";
			os << "property int vertex1\n";
			os << "property int vertex2\n";
			os << "end_header\n";
		}

		/// @brief 取第 i 个测站的 xyz，二维投影 z 置 0
		[[nodiscard]] std::array<float, 3> vertex_xyz(const view::Projection& projection, Eigen::Index i)
		{
			std::array<float, 3> xyz{0.0f, 0.0f, 0.0f};
			for (Eigen::Index c = 0; c < projection.dimension() && c < 3; ++c)
			{
				xyz[static_cast<size_t>(c)] = static_cast<float>(projection.points(i, c));
			}
			return xyz;
		}
	} // namespace

	bool PlyElement::has_property(std::string_view prop_name) const
	{
		for (const auto& prop : properties)
		{
			if (prop == prop_name) return true;
		}
		return false;
	}

	const PlyElement* PlyHeader::find_element(std::string_view name) const
	{
		for (const auto& elem : elements)
		{
			if (elem.name == name) return &elem;
		}
		return nullptr;
	}

	size_t PlyHeader::vertex_count() const
	{
		const auto* elem = find_element("vertex");
		return elem ? elem->count : 0;
	}

	size_t PlyHeader::edge_count() const
	{
		const auto* elem = find_element("edge");
		return elem ? elem->count : 0;
	}

	core::Result<PlyHeader> PlyFile::read_header(const std::filesystem::path& path)
	{
		std::ifstream file(path, std::ios::binary);
		if (!file)
		{
			return core::unexpected(file_error(path, "Cannot open file"));
		}

		std::string line;
		if (!std::getline(file, line) || line.rfind("ply", 0) != 0)
		{
			return core::unexpected(parse_error("Not a PLY file: " + path.string()));
		}

		PlyHeader header;
		PlyElement* current_element = nullptr;
		bool terminated = false;

		while (std::getline(file, line))
		{
			// 移除行尾 \r
			if (!line.empty() && line.back() == '\r') line.pop_back();
			if (line == "end_header")
			{
				terminated = true;
				break;
			}

			std::istringstream iss(line);
			std::string keyword;
			iss >> keyword;

			if (keyword == "format")
			{
				std::string fmt;
				iss >> fmt;
				if (fmt == "ascii") header.format = PlyFormat::Ascii;
				else if (fmt == "binary_little_endian") header.format = PlyFormat::BinaryLittleEndian;
				else if (fmt == "binary_big_endian") header.format = PlyFormat::BinaryBigEndian;
				else return core::unexpected(parse_error("Unknown PLY format: " + fmt));
			}
			else if (keyword == "comment")
			{
				std::string comment;
				std::getline(iss >> std::ws, comment);
				header.comments.push_back(comment);
			}
			else if (keyword == "element")
			{
				PlyElement elem;
				if (!(iss >> elem.name >> elem.count))
				{
					return core::unexpected(parse_error("Malformed element line: " + line));
				}
				header.elements.push_back(std::move(elem));
				current_element = &header.elements.back();
			}
			else if (keyword == "property" && current_element)
			{
				std::string type_str, name;
				iss >> type_str;
				if (type_str == "list")
				{
					std::string count_type, elem_type;
					iss >> count_type >> elem_type;
				}
				iss >> name;
				current_element->properties.push_back(std::move(name));
			}
		}

		if (!terminated)
		{
			return core::unexpected(parse_error("PLY header has no end_header: " + path.string()));
		}
		return header;
	}

	core::Result<void> PlyFile::write_line_plot(
		const std::filesystem::path& path, const view::Projection& projection, bool binary)
	{
		if (projection.empty())
		{
			return core::unexpected(core::Error{core::ErrorCode::kInvalidArgument, "Line plot has no stations"});
		}

		std::ofstream file(path, binary ? (std::ios::binary | std::ios::out) : std::ios::out);
		if (!file)
		{
			return core::unexpected(write_error(path, "Cannot open file for writing"));
		}

		write_line_plot_header(file, projection, binary);

		const auto num_vertices = static_cast<Eigen::Index>(projection.size());
		if (binary)
		{
			constexpr size_t kVertexSize = 3 * sizeof(float);
			constexpr size_t kEdgeSize = 2 * sizeof(int32_t);
			std::vector<char> buffer(static_cast<size_t>(num_vertices) * kVertexSize +
			                         projection.segments.size() * kEdgeSize);
			char* ptr = buffer.data();

			for (Eigen::Index i = 0; i < num_vertices; ++i)
			{
				const auto xyz = vertex_xyz(projection, i);
				std::memcpy(ptr, xyz.data(), kVertexSize);
				ptr += kVertexSize;
			}
			for (const auto& [a, b] : projection.segments)
			{
				const int32_t v[2] = {static_cast<int32_t>(a), static_cast<int32_t>(b)};
				std::memcpy(ptr, v, kEdgeSize);
				ptr += kEdgeSize;
			}

			file.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		}
		else
		{
			file << std::fixed << std::setprecision(6);
			for (Eigen::Index i = 0; i < num_vertices; ++i)
			{
				const auto xyz = vertex_xyz(projection, i);
				file << xyz[0] << ' ' << xyz[1] << ' ' << xyz[2] << '\n';
			}
			for (const auto& [a, b] : projection.segments)
			{
				file << a << ' ' << b << '\n';
			}
		}

		if (!file)
		{
			return core::unexpected(write_error(path, "Failed while writing"));
		}
		CAVE_DEBUG("Wrote {} vertices, {} edges to {}", projection.size(), projection.segments.size(), path.string());
		return {};
	}
} // namespace cave::io
