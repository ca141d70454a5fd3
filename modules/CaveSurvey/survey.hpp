#pragma once
/// @file survey.hpp
/// @brief 测段 (Shot) 数据结构与测量网构建

#if defined(_WIN32)
  #ifdef CAVESURVEY_EXPORTS
    #define CAVESURVEY_API __declspec(dllexport)
  #else
    #define CAVESURVEY_API __declspec(dllimport)
  #endif
#else
  #define CAVESURVEY_API __attribute__((visibility("default")))
#endif

#include "CaveCore.hpp"
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace cave::survey {

// ============================================================================
// 读数: 空 | 单值 | 前后视成对
// ============================================================================
struct Absent {
    [[nodiscard]] bool operator==(const Absent&) const noexcept { return true; }
};

struct Single {
    double value = 0.0;
    [[nodiscard]] bool operator==(const Single& o) const noexcept { return value == o.value; }
};

/// 前视 / 后视读数 (单位: 度)
struct Paired {
    double fore = 0.0;
    double back = 0.0;
    [[nodiscard]] bool operator==(const Paired& o) const noexcept {
        return fore == o.fore && back == o.back;
    }
};

using Reading = std::variant<Absent, Single, Paired>;

[[nodiscard]] inline bool is_absent(const Reading& r) noexcept { return std::holds_alternative<Absent>(r); }
[[nodiscard]] inline bool is_single(const Reading& r) noexcept { return std::holds_alternative<Single>(r); }
[[nodiscard]] inline bool is_paired(const Reading& r) noexcept { return std::holds_alternative<Paired>(r); }

// ============================================================================
// 测段
// ============================================================================
struct Shot {
    std::string from;          // 参考测站
    std::string name;          // 目标测站
    double      distance = 0.0;
    Reading     azimuth;       // 方位角，正北为 0，顺时针
    Reading     inclination;   // 倾角，向上为正
    Reading     left;
    Reading     right;
    Reading     up;
    Reading     down;
    std::string note;

    /// "from-->name"
    [[nodiscard]] std::string label() const { return from + "-->" + name; }
};

/// 前后视超差告警 (不中断构建)
struct ToleranceWarning {
    std::string shot;    // "from-->name"
    std::string field;   // "azimuth" / "inclination"
    double fore = 0.0;
    double back = 0.0;
    double difference = 0.0;
};

struct NetworkConfig {
    std::string title = "Cave";
    std::string distance_units = "feet";   // 仅用于显示
    double angle_tolerance = 2.0;          // 度
    /// true: 除第一条测段外，from 必须是已出现过的测站
    /// false: 允许乱序输入，连通性留到解算时检查
    bool require_connected_order = true;
};

// ============================================================================
// 测量网
// ============================================================================
class CAVESURVEY_API SurveyNetwork {
public:
    static constexpr size_t kOriginShot = std::numeric_limits<size_t>::max();

    SurveyNetwork() = default;
    explicit SurveyNetwork(NetworkConfig config);

    /// @brief 校验并追加一条测段
    /// @return kValidationError: 距离 <= 0、from 未知、测站重名、缺少方位角/倾角
    [[nodiscard]] core::Result<void> add_shot(Shot shot);

    [[nodiscard]] const std::vector<Shot>& shots() const noexcept { return shots_; }
    [[nodiscard]] size_t size() const noexcept { return shots_.size(); }
    [[nodiscard]] bool empty() const noexcept { return shots_.empty(); }

    /// 原点测站名 (第一条测段的 from)，无测段时为空
    [[nodiscard]] const std::string& origin_name() const noexcept { return origin_name_; }

    [[nodiscard]] bool has_station(const std::string& name) const;

    /// @brief 引入该测站的测段下标；原点返回 kOriginShot
    [[nodiscard]] std::optional<size_t> station_shot(const std::string& name) const;

    [[nodiscard]] size_t station_count() const noexcept { return stations_.size(); }

    [[nodiscard]] const NetworkConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::vector<ToleranceWarning>& warnings() const noexcept { return warnings_; }

private:
    void check_backsights(const Shot& shot);

    NetworkConfig config_;
    std::vector<Shot> shots_;
    std::unordered_map<std::string, size_t> stations_;  // 测站名 -> 引入它的测段
    std::string origin_name_;
    std::vector<ToleranceWarning> warnings_;
};

}  // namespace cave::survey
