/// @file survey.cpp
#include "survey.hpp"
#include "angles.hpp"
#include <cmath>

namespace cave::survey {

namespace {

[[nodiscard]] core::Error validation_error(const std::string& msg) {
    return {core::ErrorCode::kValidationError, msg};
}

}  // namespace

SurveyNetwork::SurveyNetwork(NetworkConfig config)
    : config_(std::move(config)) {}

bool SurveyNetwork::has_station(const std::string& name) const {
    return stations_.count(name) > 0;
}

std::optional<size_t> SurveyNetwork::station_shot(const std::string& name) const {
    auto it = stations_.find(name);
    if (it == stations_.end()) return std::nullopt;
    return it->second;
}

core::Result<void> SurveyNetwork::add_shot(Shot shot) {
    const std::string label = shot.label();

    if (shot.from.empty() || shot.name.empty()) {
        return core::unexpected(validation_error("Shot " + label + " has an empty station name"));
    }
    if (!std::isfinite(shot.distance) || shot.distance <= 0.0) {
        return core::unexpected(validation_error(
            fmt::format("Shot {} has non-positive distance {}", label, shot.distance)));
    }
    if (is_absent(shot.azimuth)) {
        return core::unexpected(validation_error("Shot " + label + " has no azimuth"));
    }
    if (is_absent(shot.inclination)) {
        return core::unexpected(validation_error("Shot " + label + " has no inclination"));
    }

    const bool first = shots_.empty();
    if (!first && config_.require_connected_order && !has_station(shot.from)) {
        return core::unexpected(validation_error(
            "Shot " + label + " starts from unknown station '" + shot.from + "'"));
    }
    if (shot.name == shot.from || has_station(shot.name)) {
        return core::unexpected(validation_error(
            "Shot " + label + " duplicates station '" + shot.name + "'"));
    }

    check_backsights(shot);

    if (first) {
        origin_name_ = shot.from;
        stations_.emplace(origin_name_, kOriginShot);
    }
    stations_.emplace(shot.name, shots_.size());
    CAVE_TRACE("Added shot {} ({} {})", label, shot.distance, config_.distance_units);
    shots_.push_back(std::move(shot));
    return {};
}

void SurveyNetwork::check_backsights(const Shot& shot) {
    const auto report = [&](const char* field, const Paired& p, double difference) {
        if (difference <= config_.angle_tolerance) return;
        ToleranceWarning w{shot.label(), field, p.fore, p.back, difference};
        CAVE_WARN("{} ({}/{}) in shot {} differs by {:.3f}, exceeds tolerance {}",
                  w.field, w.fore, w.back, w.shot, w.difference, config_.angle_tolerance);
        warnings_.push_back(std::move(w));
    };

    if (const auto* azi = std::get_if<Paired>(&shot.azimuth)) {
        report("azimuth", *azi, azimuth_backsight_error(azi->fore, azi->back));
    }
    if (const auto* incl = std::get_if<Paired>(&shot.inclination)) {
        report("inclination", *incl, inclination_backsight_error(incl->fore, incl->back));
    }
}

}  // namespace cave::survey
