/// @file io.cpp
#include "io.hpp"
#include <opencv2/imgcodecs.hpp>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unordered_map>

namespace cave::io {

namespace {

// ============================================================================
// 辅助函数
// ============================================================================

[[nodiscard]] core::Error file_not_found_error(const std::filesystem::path& path) {
    return {core::ErrorCode::kFileNotFound, "File not found: " + path.string()};
}

[[nodiscard]] core::Error parse_error(const std::string& msg) {
    return {core::ErrorCode::kParseError, msg};
}

[[nodiscard]] std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

[[nodiscard]] std::string to_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

/// @brief 解析一个小数，要求整个 token 都被消费
[[nodiscard]] std::optional<double> parse_double(std::string_view text) {
    const std::string token(trim(text));
    if (token.empty()) return std::nullopt;
    char* endptr = nullptr;
    const double value = std::strtod(token.c_str(), &endptr);
    if (endptr != token.c_str() + token.size()) return std::nullopt;
    return value;
}

/// @brief 按逗号切分一行，支持双引号包裹与 "" 转义
[[nodiscard]] std::vector<std::string> split_csv_line(std::string_view line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cell.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(std::move(cell));
            cell.clear();
        } else {
            cell.push_back(c);
        }
    }
    cells.push_back(std::move(cell));
    return cells;
}

[[nodiscard]] bool is_blank(std::string_view line) {
    return trim(line).empty();
}

enum class Column : uint8_t {
    kFrom = 0, kName, kNote, kDistance,
    kAzimuth, kInclination, kLeft, kRight, kUp, kDown,
    kCount,
};

constexpr std::array<std::string_view, static_cast<size_t>(Column::kCount)> kColumnNames = {
    "from", "name", "note", "distance",
    "azimuth", "inclination", "left", "right", "up", "down",
};

[[nodiscard]] constexpr size_t col(Column c) noexcept { return static_cast<size_t>(c); }

}  // namespace

// ============================================================================
// 读数解析
// ============================================================================

std::optional<survey::Reading> parse_reading(std::string_view text) {
    const std::string_view cell = trim(text);
    if (cell.empty()) return survey::Reading{survey::Absent{}};

    if (auto single = parse_double(cell)) {
        return survey::Reading{survey::Single{*single}};
    }

    const size_t slash = cell.find('/');
    if (slash == std::string_view::npos) return std::nullopt;

    const std::string_view rest = cell.substr(slash + 1);
    const auto fore = parse_double(cell.substr(0, slash));
    const auto back = parse_double(rest.substr(0, rest.find('/')));
    if (!fore || !back) return std::nullopt;
    return survey::Reading{survey::Paired{*fore, *back}};
}

// ============================================================================
// 测段表
// ============================================================================

core::Result<std::vector<survey::Shot>> parse_shots_csv(std::istream& is, std::string_view source) {
    std::string line;
    if (!std::getline(is, line)) {
        return core::unexpected(parse_error(std::string(source) + ": missing header row"));
    }
    // UTF-8 BOM
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    // 列名 -> 单元格下标
    constexpr size_t kMissing = static_cast<size_t>(-1);
    std::array<size_t, col(Column::kCount)> column_index;
    column_index.fill(kMissing);
    const auto header = split_csv_line(line);
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string label = to_lower(trim(header[i]));
        for (size_t c = 0; c < kColumnNames.size(); ++c) {
            if (label == kColumnNames[c] && column_index[c] == kMissing) column_index[c] = i;
        }
    }
    for (Column required : {Column::kFrom, Column::kName, Column::kDistance}) {
        if (column_index[col(required)] == kMissing) {
            return core::unexpected(parse_error(std::string(source) + ": missing column '" +
                                                std::string(kColumnNames[col(required)]) + "'"));
        }
    }

    std::vector<survey::Shot> shots;
    size_t line_no = 1;
    while (std::getline(is, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_blank(line)) continue;

        const auto cells = split_csv_line(line);
        const auto cell = [&](Column c) -> std::string_view {
            const size_t i = column_index[col(c)];
            return (i == kMissing || i >= cells.size()) ? std::string_view{} : std::string_view(cells[i]);
        };
        const auto field_error = [&](Column c) {
            return parse_error(fmt::format("{}:{}: cannot parse field '{}' from '{}'",
                                           source, line_no, kColumnNames[col(c)], cell(c)));
        };

        survey::Shot shot;
        shot.from = std::string(trim(cell(Column::kFrom)));
        shot.name = std::string(trim(cell(Column::kName)));
        shot.note = std::string(cell(Column::kNote));

        const auto distance = parse_double(cell(Column::kDistance));
        if (!distance) return core::unexpected(field_error(Column::kDistance));
        shot.distance = *distance;

        const std::array<std::pair<Column, survey::Reading*>, 6> readings = {{
            {Column::kAzimuth, &shot.azimuth},
            {Column::kInclination, &shot.inclination},
            {Column::kLeft, &shot.left},
            {Column::kRight, &shot.right},
            {Column::kUp, &shot.up},
            {Column::kDown, &shot.down},
        }};
        for (const auto& [column, target] : readings) {
            auto reading = parse_reading(cell(column));
            if (!reading) return core::unexpected(field_error(column));
            *target = *reading;
        }

        shots.push_back(std::move(shot));
    }

    CAVE_DEBUG("Parsed {} shots from {}", shots.size(), source);
    return shots;
}

core::Result<std::vector<survey::Shot>> read_shots_csv(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return core::unexpected(file_not_found_error(path));
    }
    return parse_shots_csv(file, path.string());
}

// ============================================================================
// 图像输出
// ============================================================================

core::Result<void> write_image(const std::filesystem::path& path, const cv::Mat& image) {
    if (image.empty()) {
        return core::unexpected(core::Error{core::ErrorCode::kInvalidArgument, "Image is empty"});
    }
    bool written = false;
    try {
        written = cv::imwrite(path.string(), image);
    } catch (const cv::Exception& e) {
        return core::unexpected(core::Error{core::ErrorCode::kWriteError,
                                            "Cannot write " + path.string() + ": " + e.what()});
    }
    if (!written) {
        return core::unexpected(core::Error{core::ErrorCode::kWriteError,
                                            "Cannot write " + path.string()});
    }
    return {};
}

}  // namespace cave::io
