/// @file test_io.cpp
/// @brief CaveIO 单元测试
#include "CaveIO.hpp"
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace {

// testdata 目录路径 (相对于构建目录)
const std::filesystem::path kTestDataDir = TESTDATA_DIR;

using cave::survey::Absent;
using cave::survey::Paired;
using cave::survey::Reading;
using cave::survey::Single;

/// 每个测试用独立的临时目录
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("cave_io_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

cave::view::Projection make_projection(cave::view::ViewKind kind) {
    cave::view::Projection proj;
    proj.kind = kind;
    proj.title = "Sump Cave";
    const int dim = cave::view::view_dimension(kind);
    proj.points = cave::core::MatXd::Zero(3, dim);
    proj.points(1, 0) = 10.0;
    proj.points(2, 0) = 10.0;
    proj.points(2, 1) = 5.0;
    proj.labels = {"A", "B", "C"};
    proj.segments = {{0, 1}, {1, 2}};
    return proj;
}

}  // namespace

// ============================================================================
// 读数单元格
// ============================================================================

TEST(CaveIO, ParseReadingForms) {
    EXPECT_EQ(cave::io::parse_reading(""), Reading{Absent{}});
    EXPECT_EQ(cave::io::parse_reading("   "), Reading{Absent{}});
    EXPECT_EQ(cave::io::parse_reading("12.5"), Reading{Single{12.5}});
    EXPECT_EQ(cave::io::parse_reading(" -30 "), Reading{Single{-30.0}});
    EXPECT_EQ(cave::io::parse_reading("10/191"), Reading{(Paired{10.0, 191.0})});
    EXPECT_EQ(cave::io::parse_reading("1/2/3"), Reading{(Paired{1.0, 2.0})});
}

TEST(CaveIO, ParseReadingRejectsGarbage) {
    EXPECT_FALSE(cave::io::parse_reading("north").has_value());
    EXPECT_FALSE(cave::io::parse_reading("12ft").has_value());
    EXPECT_FALSE(cave::io::parse_reading("/5").has_value());
    EXPECT_FALSE(cave::io::parse_reading("5/").has_value());
}

// ============================================================================
// 测段表
// ============================================================================

TEST(CaveIO, ParseShotsFromStream) {
    std::istringstream is(
        "Name,From,Distance,Azimuth,Inclination,Note\n"
        "B,A,12,45,-5,\"wet, muddy\"\n"
        "\n"
        "C,B,3.5,10/191,2/-1,\n");
    auto shots = cave::io::parse_shots_csv(is);
    ASSERT_TRUE(shots.has_value()) << shots.error().message;
    ASSERT_EQ(shots->size(), 2u);

    const auto& first = (*shots)[0];
    EXPECT_EQ(first.from, "A");
    EXPECT_EQ(first.name, "B");
    EXPECT_DOUBLE_EQ(first.distance, 12.0);
    EXPECT_EQ(first.azimuth, Reading{Single{45.0}});
    EXPECT_EQ(first.note, "wet, muddy");
    EXPECT_TRUE(cave::survey::is_absent(first.left));

    const auto& second = (*shots)[1];
    EXPECT_EQ(second.azimuth, Reading{(Paired{10.0, 191.0})});
    EXPECT_EQ(second.inclination, Reading{(Paired{2.0, -1.0})});
    EXPECT_TRUE(second.note.empty());
}

TEST(CaveIO, ParseShotsMissingColumn) {
    std::istringstream is("from,name,azimuth\nA,B,10\n");
    auto shots = cave::io::parse_shots_csv(is, "inline.csv");
    ASSERT_FALSE(shots.has_value());
    EXPECT_EQ(shots.error().code, cave::core::ErrorCode::kParseError);
    EXPECT_NE(shots.error().message.find("missing column 'distance'"), std::string::npos);
}

TEST(CaveIO, ParseShotsEmptyStream) {
    std::istringstream is("");
    auto shots = cave::io::parse_shots_csv(is);
    ASSERT_FALSE(shots.has_value());
    EXPECT_EQ(shots.error().code, cave::core::ErrorCode::kParseError);
}

TEST(CaveIO, ReadShotsCsv) {
    auto shots = cave::io::read_shots_csv(kTestDataDir / "simple_chain.csv");
    ASSERT_TRUE(shots.has_value()) << shots.error().message;
    ASSERT_EQ(shots->size(), 4u);

    EXPECT_EQ((*shots)[0].note, "entrance");
    EXPECT_EQ((*shots)[0].up, Reading{Single{2.0}});
    EXPECT_EQ((*shots)[2].from, "C");
    EXPECT_EQ((*shots)[2].name, "D");
    EXPECT_EQ((*shots)[2].left, Reading{(Paired{1.0, 2.0})});
    EXPECT_EQ((*shots)[2].note, "crawl, tight");
    EXPECT_DOUBLE_EQ((*shots)[3].distance, 8.5);
}

TEST(CaveIO, ReadShotsReportsBadField) {
    auto shots = cave::io::read_shots_csv(kTestDataDir / "bad_field.csv");
    ASSERT_FALSE(shots.has_value());
    const auto& err = shots.error();
    EXPECT_EQ(err.code, cave::core::ErrorCode::kParseError);
    EXPECT_NE(err.message.find(":3:"), std::string::npos) << err.message;
    EXPECT_NE(err.message.find("azimuth"), std::string::npos) << err.message;
    EXPECT_NE(err.message.find("north"), std::string::npos) << err.message;
}

TEST(CaveIO, ReadShotsFileNotFound) {
    auto shots = cave::io::read_shots_csv(kTestDataDir / "no_such_survey.csv");
    ASSERT_FALSE(shots.has_value());
    EXPECT_EQ(shots.error().code, cave::core::ErrorCode::kFileNotFound);
}

// ============================================================================
// PLY
// ============================================================================

TEST_F(TempDirTest, PlyAsciiLinePlot) {
    const auto path = dir_ / "plot.ply";
    const auto proj = make_projection(cave::view::ViewKind::FULL_3D);
    auto written = cave::io::PlyFile::write_line_plot(path, proj);
    ASSERT_TRUE(written.has_value()) << written.error().message;

    auto header = cave::io::PlyFile::read_header(path);
    ASSERT_TRUE(header.has_value()) << header.error().message;
    EXPECT_FALSE(header->is_binary());
    EXPECT_EQ(header->vertex_count(), 3u);
    EXPECT_EQ(header->edge_count(), 2u);

    const auto* vertex = header->find_element("vertex");
    ASSERT_NE(vertex, nullptr);
    EXPECT_TRUE(vertex->has_property("x"));
    EXPECT_TRUE(vertex->has_property("z"));
    const auto* edge = header->find_element("edge");
    ASSERT_NE(edge, nullptr);
    EXPECT_TRUE(edge->has_property("vertex1"));

    const auto& comments = header->comments;
    EXPECT_NE(std::find(comments.begin(), comments.end(), "title Sump Cave"), comments.end());
    EXPECT_NE(std::find(comments.begin(), comments.end(), "view full_3d"), comments.end());
    EXPECT_NE(std::find(comments.begin(), comments.end(), "station 0 A"), comments.end());
}

TEST_F(TempDirTest, PlyBinaryLinePlot) {
    const auto path = dir_ / "plot_bin.ply";
    const auto proj = make_projection(cave::view::ViewKind::PLAN);
    ASSERT_TRUE(cave::io::PlyFile::write_line_plot(path, proj, true).has_value());

    auto header = cave::io::Ply::read_header(path);
    ASSERT_TRUE(header.has_value()) << header.error().message;
    EXPECT_TRUE(header->is_binary());
    EXPECT_EQ(header->vertex_count(), 3u);
    EXPECT_EQ(header->edge_count(), 2u);
}

TEST_F(TempDirTest, PlyRejectsEmptyProjection) {
    cave::view::Projection empty;
    auto written = cave::io::PlyFile::write_line_plot(dir_ / "empty.ply", empty);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, cave::core::ErrorCode::kInvalidArgument);
}

TEST(CaveIO, PlyReadHeaderMissingFile) {
    auto header = cave::io::PlyFile::read_header(kTestDataDir / "missing.ply");
    ASSERT_FALSE(header.has_value());
    EXPECT_EQ(header.error().code, cave::core::ErrorCode::kFileNotFound);
}

// ============================================================================
// 图像
// ============================================================================

TEST_F(TempDirTest, WriteImagePng) {
    const cv::Mat image(40, 60, CV_8UC3, cv::Scalar(255, 255, 255));
    const auto path = dir_ / "blank.png";
    auto written = cave::io::write_image(path, image);
    ASSERT_TRUE(written.has_value()) << written.error().message;
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_GT(std::filesystem::file_size(path), 0u);
}

TEST_F(TempDirTest, WriteImageRejectsEmpty) {
    auto written = cave::io::write_image(dir_ / "empty.png", cv::Mat());
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, cave::core::ErrorCode::kInvalidArgument);
}
