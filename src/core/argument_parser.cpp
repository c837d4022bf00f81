/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include "core/path_utils.hpp"
#include <args.hxx>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <print>
#include <string_view>
#include <vector>

namespace {

    constexpr const char* MAIN_HELP =
        "NeuralPseudoScan: extract colored point clouds from trained radiance fields.\n"
        "\n"
        "USAGE:\n"
        "  neural-pseudo-scan <subcommand> [options]\n"
        "\n"
        "SUBCOMMANDS:\n"
        "  sample-points          Render a camera path and extract surface points\n"
        "  visualize-point-cloud  Convert a point-cloud container to .pcd / .ply\n"
        "\n"
        "Run '<subcommand> --help' for details.\n"
        "\n"
        "EXAMPLES:\n"
        "  neural-pseudo-scan sample-points --data-dir ./scene --output-dir ./out \\\n"
        "      --point-cloud-filename cloud.npc --train-dir ./experiment\n"
        "  neural-pseudo-scan visualize-point-cloud --point-cloud-path ./out/cloud.npc\n"
        "\n"
        "ENVIRONMENT:\n"
        "  LOG_LEVEL -- Set log level (trace/debug/info/perf/warn/error)\n";

    constexpr const char* SAMPLE_HELP_HEADER = "NeuralPseudoScan - Render a camera path and extract surface points\n";
    constexpr const char* SAMPLE_HELP_FOOTER =
        "\n"
        "One point per pixel is taken where the accumulated ray weight first reaches\n"
        "the opaqueness threshold. Frames are written as <output-dir>/NNNN.jpg.\n"
        "\n";

    constexpr const char* VISUALIZE_HELP_HEADER = "NeuralPseudoScan - Convert a point-cloud container to an interchange format\n";
    constexpr const char* VISUALIZE_HELP_FOOTER =
        "\n"
        "Writes <stem>_o3d.pcd (or .ply) next to the container.\n"
        "\n";

    // Logging flags shared by every subcommand
    struct LoggingFlags {
        ::args::Group sep;
        ::args::Group group;
        ::args::ValueFlag<std::string> log_level;
        ::args::Flag verbose;
        ::args::Flag quiet;
        ::args::ValueFlag<std::string> log_file;
        ::args::ValueFlagList<std::string> mute;

        explicit LoggingFlags(::args::ArgumentParser& parser)
            : sep(parser, " "),
              group(parser, "LOGGING:"),
              log_level(group, "level", "Log level: trace, debug, info, perf, warn, error, critical, off (default: info)", {"log-level"}),
              verbose(group, "verbose", "Verbose output (equivalent to --log-level debug)", {"verbose"}),
              quiet(group, "quiet", "Suppress non-error output (equivalent to --log-level error)", {'q', "quiet"}),
              log_file(group, "file", "Optional log file path", {"log-file"}),
              mute(group, "module", "Silence a module: core, rendering, models, io, sampling, app (repeatable)", {"log-mute"}) {}

        // CLI args override the environment variable
        std::expected<void, std::string> init_logger() {
            auto level = nps::core::LogLevel::Info;
            std::string log_file_path;

            if (const char* env_level = std::getenv("LOG_LEVEL")) {
                level = nps::core::parse_log_level(env_level);
            }
            if (verbose) {
                level = nps::core::LogLevel::Debug;
            }
            if (quiet) {
                level = nps::core::LogLevel::Error;
            }
            if (log_level) {
                level = nps::core::parse_log_level(::args::get(log_level));
            }
            if (log_file) {
                log_file_path = ::args::get(log_file);
            }

            std::vector<nps::core::LogModule> muted;
            for (const auto& name : ::args::get(mute)) {
                const auto module = nps::core::parse_log_module(name);
                if (!module) {
                    return std::unexpected(std::format("Unknown log module '{}'", name));
                }
                muted.push_back(*module);
            }

            auto& logger = nps::core::Logger::get();
            if (auto initialized = logger.init(level, log_file_path); !initialized) {
                return std::unexpected(initialized.error());
            }
            for (const auto module : muted) {
                logger.enable_module(module, false);
            }

            LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
            if (!log_file_path.empty()) {
                LOG_DEBUG("Logging to file: {}", log_file_path);
            }
            return {};
        }
    };

    std::vector<std::string> subcommand_args(const int argc, const char* const argv[], const std::string_view name) {
        std::vector<std::string> args_vec(argv + 1, argv + argc);
        args_vec[0] = std::format("{} {}", argv[0], name);
        return args_vec;
    }

    std::expected<nps::core::args::ParsedArgs, std::string> parse_sample_points(const int argc, const char* const argv[]) {
        using namespace nps::core;

        ::args::ArgumentParser parser(SAMPLE_HELP_HEADER, SAMPLE_HELP_FOOTER);
        parser.helpParams.width = 160;
        ::args::HelpFlag help(parser, "help", "Display help menu", {'h', "help"});

        ::args::Group paths_group(parser, "PATHS:");
        ::args::ValueFlag<std::string> data_dir(paths_group, "dir", "Dataset directory (scene.json, camera paths)", {'d', "data-dir"});
        ::args::ValueFlag<std::string> output_dir(paths_group, "dir", "Output directory for frames and the point cloud", {'o', "output-dir"});
        ::args::ValueFlag<std::string> train_dir(paths_group, "dir", "Experiment directory (config.json, checkpoints/)", {'t', "train-dir"});
        ::args::ValueFlag<std::string> filename(paths_group, "name", "Point-cloud container filename, relative to the output directory", {"point-cloud-filename"});

        ::args::Group sampling_sep(parser, " ");
        ::args::Group sampling_group(parser, "SAMPLING:");
        ::args::ValueFlag<int> frame_step(sampling_group, "step", "Render every N-th camera of the path (default: 1)", {"frame-step"});
        ::args::ValueFlag<float> threshold(sampling_group, "tau", "Opaqueness threshold in [0, 1] (default: 0.5)", {"threshold"});
        ::args::ValueFlag<int> devices(sampling_group, "count", "Number of compute devices, 0 = hardware threads (default: 0)", {"devices"});
        ::args::ValueFlag<int> chunk(sampling_group, "rays", "Rays per dispatch (default: from config.json)", {"chunk"});
        ::args::Flag no_frames(sampling_group, "no_frames", "Do not write rendered frames", {"no-frames"});

        LoggingFlags logging(parser);

        const auto args_vec = subcommand_args(argc, argv, "sample-points");
        parser.Prog(args_vec[0]);

        try {
            parser.ParseArgs(std::vector<std::string>(args_vec.begin() + 1, args_vec.end()));
        } catch (const ::args::Help&) {
            std::print("{}", parser.Help());
            return nps::core::args::HelpMode{};
        } catch (const ::args::ParseError& e) {
            return std::unexpected(std::format("{}\n\n{}", e.what(), parser.Help()));
        } catch (const ::args::ValidationError& e) {
            return std::unexpected(std::format("{}\n\n{}", e.what(), parser.Help()));
        }

        if (auto initialized = logging.init_logger(); !initialized) {
            return std::unexpected(initialized.error());
        }

        if (!data_dir || !output_dir || !train_dir || !filename) {
            return std::unexpected(std::format(
                "sample-points requires --data-dir, --output-dir, --train-dir and --point-cloud-filename\n\n{}",
                parser.Help()));
        }

        auto params = std::make_unique<param::SamplingParameters>();
        params->data_path = utf8_to_path(::args::get(data_dir));
        params->output_path = utf8_to_path(::args::get(output_dir));
        params->train_path = utf8_to_path(::args::get(train_dir));
        params->point_cloud_filename = ::args::get(filename);

        if (frame_step)
            params->frame_step = ::args::get(frame_step);
        if (threshold)
            params->opaqueness_threshold = ::args::get(threshold);
        if (devices)
            params->device_count = ::args::get(devices);
        if (chunk)
            params->chunk = ::args::get(chunk);
        params->save_frames = !no_frames;

        if (!std::filesystem::is_directory(params->data_path)) {
            return std::unexpected(std::format("Data directory not found: {}", path_to_utf8(params->data_path)));
        }
        if (!std::filesystem::is_directory(params->train_path)) {
            return std::unexpected(std::format("Train directory not found: {}", path_to_utf8(params->train_path)));
        }

        // The experiment section is filled in by the runner after config.json is read
        if (auto error = params->validate(); !error.empty()) {
            return std::unexpected("ERROR: " + error);
        }

        return nps::core::args::SamplePointsMode{std::move(params)};
    }

    std::expected<nps::core::args::ParsedArgs, std::string> parse_visualize_point_cloud(const int argc, const char* const argv[]) {
        using namespace nps::core;

        ::args::ArgumentParser parser(VISUALIZE_HELP_HEADER, VISUALIZE_HELP_FOOTER);
        ::args::HelpFlag help(parser, "help", "Display help menu", {'h', "help"});
        ::args::ValueFlag<std::string> point_cloud_path(parser, "path", "Point-cloud container written by sample-points", {'p', "point-cloud-path"});
        ::args::ValueFlag<std::string> format(parser, "format", "Interchange format: pcd, ply (default: pcd)", {'f', "format"});
        ::args::Flag drop_degenerate(parser, "drop_degenerate", "Drop points at the origin (rays that never reached the threshold)", {"drop-degenerate"});

        LoggingFlags logging(parser);

        const auto args_vec = subcommand_args(argc, argv, "visualize-point-cloud");
        parser.Prog(args_vec[0]);

        try {
            parser.ParseArgs(std::vector<std::string>(args_vec.begin() + 1, args_vec.end()));
        } catch (const ::args::Help&) {
            std::print("{}", parser.Help());
            return nps::core::args::HelpMode{};
        } catch (const ::args::ParseError& e) {
            return std::unexpected(std::format("{}\n\n{}", e.what(), parser.Help()));
        } catch (const ::args::ValidationError& e) {
            return std::unexpected(std::format("{}\n\n{}", e.what(), parser.Help()));
        }

        if (auto initialized = logging.init_logger(); !initialized) {
            return std::unexpected(initialized.error());
        }

        if (!point_cloud_path) {
            return std::unexpected(std::format("Missing --point-cloud-path\n\n{}", parser.Help()));
        }

        param::ExportParameters params;
        params.point_cloud_path = utf8_to_path(::args::get(point_cloud_path));
        params.drop_degenerate = drop_degenerate;

        if (!std::filesystem::exists(params.point_cloud_path)) {
            return std::unexpected(std::format("Input not found: {}", path_to_utf8(params.point_cloud_path)));
        }

        if (format) {
            if (const auto fmt = param::parse_interchange_format(::args::get(format))) {
                params.format = *fmt;
            } else {
                return std::unexpected(std::format("Invalid format '{}'. Use: pcd, ply", ::args::get(format)));
            }
        }

        return nps::core::args::VisualizePointCloudMode{params};
    }

} // namespace

std::expected<nps::core::args::ParsedArgs, std::string>
nps::core::args::parse_args(const int argc, const char* const argv[]) {
    if (argc < 2) {
        std::print("{}", MAIN_HELP);
        return HelpMode{};
    }

    const std::string_view arg1 = argv[1];

    if (arg1 == "-V" || arg1 == "--version") {
        return VersionMode{};
    }
    if (arg1 == "-h" || arg1 == "--help") {
        std::print("{}", MAIN_HELP);
        return HelpMode{};
    }
    if (arg1 == "sample-points") {
        return parse_sample_points(argc, argv);
    }
    if (arg1 == "visualize-point-cloud") {
        return parse_visualize_point_cloud(argc, argv);
    }

    return std::unexpected(std::format("Unknown subcommand: {}\n\n{}", arg1, MAIN_HELP));
}
