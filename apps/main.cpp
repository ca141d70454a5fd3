/// @file main.cpp
/// @brief cavemap 命令行入口

#include "CavePipeline.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace
{
	void print_usage(const char* prog)
	{
		std::cerr << "Usage: " << prog << " [options] <survey.csv> [more.csv ...]\n";
		std::cerr << "\n";
		std::cerr << "Views (any combination, one output per view):\n";
		std::cerr << "  --plan            Plan view        -> <name>_plan.png\n";
		std::cerr << "  --profile         Profile view     -> <name>_profile.png\n";
		std::cerr << "  --flat            Flattened profile -> <name>_flattened_profile.png\n";
		std::cerr << "  --3d              Full 3D line plot -> <name>_full_3d.ply\n";
		std::cerr << "\n";
		std::cerr << "Options:\n";
		std::cerr << "  -o, --output DIR  Output directory (default: same as input)\n";
		std::cerr << "  --tolerance DEG   Fore/backsight tolerance in degrees (default: 2.0)\n";
		std::cerr << "  --units LABEL     Distance unit label (default: feet)\n";
		std::cerr << "  --title TEXT      Cave name (default: Cave)\n";
		std::cerr << "  --unordered       Allow shots that start from a station defined later\n";
		std::cerr << "  --no-labels       Do not draw station names\n";
		std::cerr << "  --binary-ply      Write binary PLY\n";
		std::cerr << "  -v, --verbose     Debug logging\n";
		std::cerr << "  -q, --quiet       Only warnings and errors\n";
		std::cerr << "  --log-level LVL   trace|debug|info|warn|error|off (default: info)\n";
		std::cerr << "  -h, --help        Show this help\n";
	}

	[[nodiscard]] bool parse_number(std::string_view text, double& value)
	{
		const std::string token(text);
		char* endptr = nullptr;
		value = std::strtod(token.c_str(), &endptr);
		return !token.empty() && endptr == token.c_str() + token.size();
	}

	void print_stations(const cave::survey::LinePlot& plot)
	{
		std::cout << plot.title << ": " << plot.size() << " stations, "
			<< plot.total_length() << " " << plot.distance_units << " surveyed\n";
		for (const auto& station : plot.stations)
		{
			std::cout << fmt::format("  {:<12} {:>10.2f} {:>10.2f} {:>10.2f}   flat {:>10.2f} {:>10.2f}\n",
			                         station.name,
			                         station.position.x(), station.position.y(), station.position.z(),
			                         station.flat_position.x(), station.flat_position.y());
		}
	}
} // namespace

int main(int argc, char* argv[])
{
	if (argc < 2)
	{
		print_usage(argv[0]);
		return 1;
	}

	cave::pipeline::PipelineConfig config;
	auto level = cave::core::LogLevel::kInfo;

	for (int i = 1; i < argc; ++i)
	{
		const std::string_view arg(argv[i]);
		const auto next_value = [&](std::string_view& out) {
			if (i + 1 >= argc) return false;
			out = argv[++i];
			return true;
		};

		std::string_view value;
		if (arg == "-h" || arg == "--help")
		{
			print_usage(argv[0]);
			return 0;
		}
		if (arg == "--plan") { config.views.emplace_back("plan"); continue; }
		if (arg == "--profile") { config.views.emplace_back("profile"); continue; }
		if (arg == "--flat") { config.views.emplace_back("flattened_profile"); continue; }
		if (arg == "--3d") { config.views.emplace_back("full_3d"); continue; }
		if (arg == "--unordered") { config.network.require_connected_order = false; continue; }
		if (arg == "--no-labels") { config.render.draw_labels = false; continue; }
		if (arg == "--binary-ply") { config.binary_ply = true; continue; }
		if (arg == "-v" || arg == "--verbose") { level = cave::core::LogLevel::kDebug; continue; }
		if (arg == "-q" || arg == "--quiet") { level = cave::core::LogLevel::kWarn; continue; }
		if (arg == "-o" || arg == "--output")
		{
			if (!next_value(value))
			{
				std::cerr << "Error: " << arg << " requires a directory\n";
				return 1;
			}
			config.output_dir = std::filesystem::path(value);
			continue;
		}
		if (arg == "--tolerance")
		{
			double tol = 0.0;
			if (!next_value(value) || !parse_number(value, tol) || tol < 0.0)
			{
				std::cerr << "Error: --tolerance requires a non-negative number\n";
				return 1;
			}
			config.network.angle_tolerance = tol;
			continue;
		}
		if (arg == "--units" || arg == "--title")
		{
			if (!next_value(value))
			{
				std::cerr << "Error: " << arg << " requires a value\n";
				return 1;
			}
			(arg == "--units" ? config.network.distance_units : config.network.title) = std::string(value);
			continue;
		}
		if (arg == "--log-level")
		{
			std::optional<cave::core::LogLevel> parsed;
			if (next_value(value)) parsed = cave::core::log_level_from_string(value);
			if (!parsed)
			{
				std::cerr << "Error: --log-level requires trace|debug|info|warn|error|critical|off\n";
				return 1;
			}
			level = *parsed;
			continue;
		}
		if (arg.size() > 1 && arg.front() == '-')
		{
			std::cerr << "Error: Unknown option: " << arg << "\n";
			print_usage(argv[0]);
			return 1;
		}
		config.inputs.emplace_back(argv[i]);
	}

	if (config.inputs.empty())
	{
		print_usage(argv[0]);
		return 1;
	}

	cave::core::Log::init("cavemap", level);
	CAVE_INFO("cavemap v{}", cave::core::version());

	auto result = cave::pipeline::run(config);
	if (!result)
	{
		const auto& err = result.error();
		std::cerr << "Error [" << cave::core::error_code_name(err.code) << "]: " << err.message << "\n";
		return 1;
	}

	print_stations(result->plot);
	if (!result->warnings.empty())
	{
		std::cout << result->warnings.size() << " fore/backsight pair(s) outside tolerance\n";
	}

	const size_t failed = result->failed_views();
	if (failed > 0)
	{
		std::cerr << "Error: " << failed << " view(s) failed\n";
		return 1;
	}
	return 0;
}
