/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include "test_helpers.hpp"
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace nps::core;

namespace {

    std::expected<args::ParsedArgs, std::string> parse(std::vector<std::string> argv) {
        argv.insert(argv.begin(), "neural-pseudo-scan");
        argv.insert(argv.end(), {"--log-level", "warn"});
        std::vector<const char*> ptrs;
        for (const auto& a : argv) {
            ptrs.push_back(a.c_str());
        }
        return args::parse_args(static_cast<int>(ptrs.size()), ptrs.data());
    }

    class ArgumentParserTest : public ::testing::Test {
    protected:
        void SetUp() override {
            std::filesystem::create_directories(data_dir());
            std::filesystem::create_directories(train_dir());
        }

        std::filesystem::path data_dir() const { return dir_.path() / "data"; }
        std::filesystem::path train_dir() const { return dir_.path() / "train"; }
        std::filesystem::path out_dir() const { return dir_.path() / "out"; }

        std::vector<std::string> sample_args() const {
            return {"sample-points",
                    "--data-dir", data_dir().string(),
                    "--output-dir", out_dir().string(),
                    "--train-dir", train_dir().string(),
                    "--point-cloud-filename", "cloud.npc"};
        }

        nps::test::TempDir dir_{"args"};
    };

} // namespace

TEST(ArgumentParserBasicsTest, NoArgumentsShowsHelp) {
    const char* argv[] = {"neural-pseudo-scan"};
    const auto parsed = args::parse_args(1, argv);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(std::holds_alternative<args::HelpMode>(*parsed));
}

TEST(ArgumentParserBasicsTest, VersionFlag) {
    const char* argv[] = {"neural-pseudo-scan", "--version"};
    const auto parsed = args::parse_args(2, argv);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(std::holds_alternative<args::VersionMode>(*parsed));
}

TEST(ArgumentParserBasicsTest, UnknownSubcommandFails) {
    const char* argv[] = {"neural-pseudo-scan", "render-mesh"};
    const auto parsed = args::parse_args(2, argv);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_NE(parsed.error().find("render-mesh"), std::string::npos);
}

TEST_F(ArgumentParserTest, SamplePointsDefaults) {
    const auto parsed = parse(sample_args());
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    ASSERT_TRUE(std::holds_alternative<args::SamplePointsMode>(*parsed));

    const auto& params = *std::get<args::SamplePointsMode>(*parsed).params;
    EXPECT_EQ(params.data_path, data_dir());
    EXPECT_EQ(params.output_path, out_dir());
    EXPECT_EQ(params.train_path, train_dir());
    EXPECT_EQ(params.point_cloud_filename, "cloud.npc");
    EXPECT_EQ(params.frame_step, 1);
    EXPECT_FLOAT_EQ(params.opaqueness_threshold, 0.5f);
    EXPECT_TRUE(params.save_frames);
    EXPECT_FALSE(params.chunk.has_value());
    EXPECT_EQ(params.effective_chunk(), 8192);
}

TEST_F(ArgumentParserTest, SamplePointsOptions) {
    auto argv = sample_args();
    argv.insert(argv.end(), {"--frame-step", "3", "--threshold", "0.25", "--devices", "2",
                             "--chunk", "512", "--no-frames"});

    const auto parsed = parse(argv);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();

    const auto& params = *std::get<args::SamplePointsMode>(*parsed).params;
    EXPECT_EQ(params.frame_step, 3);
    EXPECT_FLOAT_EQ(params.opaqueness_threshold, 0.25f);
    EXPECT_EQ(params.device_count, 2);
    EXPECT_EQ(params.effective_chunk(), 512);
    EXPECT_FALSE(params.save_frames);
}

TEST_F(ArgumentParserTest, SamplePointsRequiresAllPaths) {
    const auto parsed = parse({"sample-points", "--data-dir", data_dir().string()});
    EXPECT_FALSE(parsed.has_value());
}

TEST_F(ArgumentParserTest, FrameStepMustBePositive) {
    auto argv = sample_args();
    argv.insert(argv.end(), {"--frame-step", "0"});
    const auto parsed = parse(argv);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_NE(parsed.error().find("frame step"), std::string::npos);
}

TEST_F(ArgumentParserTest, MissingDataDirectoryFails) {
    auto argv = sample_args();
    argv[2] = (dir_.path() / "nope").string();
    EXPECT_FALSE(parse(argv).has_value());
}

TEST_F(ArgumentParserTest, VisualizePointCloud) {
    const auto cloud = dir_.path() / "cloud.npc";
    std::ofstream(cloud) << "x";

    const auto parsed = parse({"visualize-point-cloud", "--point-cloud-path", cloud.string(),
                               "--format", "ply", "--drop-degenerate"});
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    ASSERT_TRUE(std::holds_alternative<args::VisualizePointCloudMode>(*parsed));

    const auto& params = std::get<args::VisualizePointCloudMode>(*parsed).params;
    EXPECT_EQ(params.point_cloud_path, cloud);
    EXPECT_EQ(params.format, param::InterchangeFormat::PLY);
    EXPECT_TRUE(params.drop_degenerate);
}

TEST_F(ArgumentParserTest, VisualizeDefaultsToPcd) {
    const auto cloud = dir_.path() / "cloud.npc";
    std::ofstream(cloud) << "x";

    const auto parsed = parse({"visualize-point-cloud", "-p", cloud.string()});
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    const auto& params = std::get<args::VisualizePointCloudMode>(*parsed).params;
    EXPECT_EQ(params.format, param::InterchangeFormat::PCD);
    EXPECT_FALSE(params.drop_degenerate);
}

TEST_F(ArgumentParserTest, VisualizeRejectsUnknownFormat) {
    const auto cloud = dir_.path() / "cloud.npc";
    std::ofstream(cloud) << "x";

    EXPECT_FALSE(parse({"visualize-point-cloud", "-p", cloud.string(), "--format", "obj"}).has_value());
    EXPECT_FALSE(parse({"visualize-point-cloud", "-p", (dir_.path() / "missing.npc").string()}).has_value());
}

TEST_F(ArgumentParserTest, UnopenableLogFileIsAParseError) {
    const auto blocker = dir_.path() / "blocker";
    std::ofstream(blocker) << "x";

    auto argv = sample_args();
    argv.insert(argv.end(), {"--log-file", (blocker / "sub" / "run.log").string()});
    const auto parsed = parse(argv);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_NE(parsed.error().find("Cannot open log file"), std::string::npos);
}

TEST_F(ArgumentParserTest, LogMuteTakesModuleNames) {
    auto argv = sample_args();
    argv.insert(argv.end(), {"--log-mute", "rendering", "--log-mute", "io"});
    EXPECT_TRUE(parse(argv).has_value());

    argv.insert(argv.end(), {"--log-mute", "gui"});
    const auto parsed = parse(argv);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_NE(parsed.error().find("gui"), std::string::npos);
}

TEST(LogModuleTest, ParsesKnownNames) {
    EXPECT_EQ(parse_log_module("sampling"), LogModule::Sampling);
    EXPECT_EQ(parse_log_module("io"), LogModule::IO);
    EXPECT_FALSE(parse_log_module("Sampling").has_value());
}

// --- Parameters ---

TEST(ParametersTest, ValidateChecksRanges) {
    param::SamplingParameters params;
    params.point_cloud_filename = "cloud.npc";
    EXPECT_TRUE(params.validate().empty());

    params.opaqueness_threshold = 1.5f;
    EXPECT_FALSE(params.validate().empty());
    params.opaqueness_threshold = 0.5f;

    params.chunk = 0;
    EXPECT_FALSE(params.validate().empty());
    params.chunk.reset();

    params.point_cloud_filename.clear();
    EXPECT_FALSE(params.validate().empty());
}

TEST(ParametersTest, MissingExperimentConfigGivesDefaults) {
    nps::test::TempDir dir("experiment");

    const auto config = param::read_experiment_config(dir.path());
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->random_seed, 0u);
    EXPECT_EQ(config->chunk, 8192);
    EXPECT_EQ(config->camera_path, "camera-paths/orbit-mild");
    EXPECT_EQ(config->model.type, "voxel_radiance_field");
}

TEST(ParametersTest, ExperimentConfigIsRead) {
    nps::test::TempDir dir("experiment");
    std::ofstream(dir.path() / "config.json") << R"({
        "random_seed": 7,
        "image_scale": 4,
        "chunk": 1024,
        "camera_path": "camera-paths/spiral",
        "model": {"num_coarse_samples": 32, "num_fine_samples": 0, "near": 0.1, "far": 2.5}
    })";

    const auto config = param::read_experiment_config(dir.path());
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->random_seed, 7u);
    EXPECT_FLOAT_EQ(config->image_scale, 4.0f);
    EXPECT_EQ(config->chunk, 1024);
    EXPECT_EQ(config->camera_path, "camera-paths/spiral");
    EXPECT_EQ(config->model.num_coarse_samples, 32);
    EXPECT_EQ(config->model.num_fine_samples, 0);
    ASSERT_TRUE(config->model.near.has_value());
    EXPECT_FLOAT_EQ(*config->model.far, 2.5f);
}

TEST(ParametersTest, MalformedExperimentConfigFails) {
    nps::test::TempDir dir("experiment");
    std::ofstream(dir.path() / "config.json") << "{ \"chunk\": ";

    EXPECT_FALSE(param::read_experiment_config(dir.path()).has_value());
}

TEST(ParametersTest, SamplingConfigIsSavedBesideOutput) {
    nps::test::TempDir dir("saved");
    param::SamplingParameters params;
    params.point_cloud_filename = "cloud.npc";
    params.frame_step = 2;
    params.chunk = 256;

    ASSERT_TRUE(param::save_sampling_parameters_to_json(params, dir.path()).has_value());

    std::ifstream file(dir.path() / "sampling_config.json");
    const auto json = nlohmann::json::parse(file);
    EXPECT_EQ(json["frame_step"], 2);
    EXPECT_EQ(json["chunk"], 256);
    EXPECT_EQ(json["point_cloud_filename"], "cloud.npc");
    EXPECT_TRUE(json.contains("timestamp"));
    EXPECT_EQ(json["experiment"]["camera_path"], "camera-paths/orbit-mild");
}

TEST(ParametersTest, InterchangeFormatNames) {
    EXPECT_EQ(param::parse_interchange_format("pcd"), param::InterchangeFormat::PCD);
    EXPECT_EQ(param::parse_interchange_format(".ply"), param::InterchangeFormat::PLY);
    EXPECT_FALSE(param::parse_interchange_format("obj").has_value());
    EXPECT_STREQ(param::interchange_extension(param::InterchangeFormat::PLY), ".ply");
}
