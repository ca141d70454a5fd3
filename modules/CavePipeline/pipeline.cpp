/// @file pipeline.cpp
#include "pipeline.hpp"
#include <system_error>

namespace cave::pipeline {

namespace {

[[nodiscard]] std::filesystem::path resolve_output_dir(const PipelineConfig& config) {
    if (!config.output_dir.empty()) return config.output_dir;
    if (!config.inputs.empty() && !config.inputs.front().parent_path().empty()) {
        return config.inputs.front().parent_path();
    }
    return ".";
}

[[nodiscard]] std::string output_stem(const PipelineConfig& config) {
    if (!config.inputs.empty()) return config.inputs.front().stem().string();
    return "survey";
}

/// @brief 写出单个视图：三维导出 PLY，二维渲染 PNG
[[nodiscard]] core::Result<std::filesystem::path> write_view(
    const view::Projection& projection, const PipelineConfig& config,
    const std::filesystem::path& dir, const std::string& stem) {
    const std::string base = stem + "_" + view::view_kind_name(projection.kind);

    if (view::view_dimension(projection.kind) == 3) {
        const auto path = dir / (base + ".ply");
        auto written = io::PlyFile::write_line_plot(path, projection, config.binary_ply);
        if (!written) return core::unexpected(std::move(written.error()));
        return path;
    }

    auto image = view::render(projection, config.render);
    if (!image) return core::unexpected(std::move(image.error()));
    const auto path = dir / (base + ".png");
    auto written = io::write_image(path, *image);
    if (!written) return core::unexpected(std::move(written.error()));
    return path;
}

}  // namespace

size_t PipelineResult::failed_views() const noexcept {
    size_t failed = 0;
    for (const auto& v : views) {
        if (!v.ok()) ++failed;
    }
    return failed;
}

core::Result<PipelineResult> run(std::vector<survey::Shot> shots, const PipelineConfig& config) {
    survey::SurveyNetwork network(config.network);
    for (auto& shot : shots) {
        auto added = network.add_shot(std::move(shot));
        if (!added) return core::unexpected(std::move(added.error()));
    }

    auto plot = survey::resolve(network);
    if (!plot) return core::unexpected(std::move(plot.error()));

    PipelineResult result;
    result.plot = std::move(plot.value());
    result.warnings = network.warnings();

    std::filesystem::path dir;
    const std::string stem = output_stem(config);
    if (config.write_outputs && !config.views.empty()) {
        dir = resolve_output_dir(config);
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return core::unexpected(core::Error{core::ErrorCode::kWriteError,
                "Cannot create output directory " + dir.string() + ": " + ec.message()});
        }
    }

    for (const auto& name : config.views) {
        ViewOutput out;
        out.requested = name;

        auto projection = view::project(result.plot, name);
        if (!projection) {
            CAVE_ERROR("View '{}' failed: {}", name, projection.error().message);
            out.error = std::move(projection.error());
            result.views.push_back(std::move(out));
            continue;
        }

        if (config.write_outputs) {
            auto file = write_view(*projection, config, dir, stem);
            if (file) {
                CAVE_INFO("Saved {} view to: {}", name, file->string());
                out.file = std::move(file.value());
            } else {
                CAVE_ERROR("View '{}' failed: {}", name, file.error().message);
                out.error = std::move(file.error());
            }
        }
        out.projection = std::move(projection.value());
        result.views.push_back(std::move(out));
    }

    return result;
}

core::Result<PipelineResult> run(const PipelineConfig& config) {
    if (config.inputs.empty()) {
        return core::unexpected(core::Error{core::ErrorCode::kInvalidArgument, "No input file given"});
    }
    if (config.inputs.size() > 1) {
        CAVE_WARN("{} input files given, only {} is processed",
                  config.inputs.size(), config.inputs.front().string());
    }

    const auto& path = config.inputs.front();
    CAVE_INFO("Loading survey: {}", path.string());
    auto shots = io::read_shots_csv(path);
    if (!shots) return core::unexpected(std::move(shots.error()));
    CAVE_INFO("Loaded {} shots", shots->size());

    return run(std::move(shots.value()), config);
}

}  // namespace cave::pipeline
