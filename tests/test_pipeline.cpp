/// @file test_pipeline.cpp
#include "MmsPipeline.hpp"
#include <gtest/gtest.h>

using mms::codec::make_leaf;
using mms::core::Vec2d;
using mms::core::Vec3d;
using mms::paint::Color;
using mms::paint::Palette;
using mms::pipeline::Attribute;
using mms::pipeline::DiagnosticKind;

namespace {

const Palette kPalette = Palette::defaults();

/// 单位正方形，两个三角形，UV 铺满纹理并留出 5% 边距
mms::geom::TriangleMesh make_quad() {
    mms::geom::TriangleMesh mesh;
    mesh.vertices = {Vec3d(0, 0, 0), Vec3d(1, 0, 0), Vec3d(1, 1, 0), Vec3d(0, 1, 0)};
    mesh.indices = {0, 1, 2, 0, 2, 3};
    mesh.uvs = {Vec2d(0.05, 0.05), Vec2d(0.95, 0.05), Vec2d(0.95, 0.95),
                Vec2d(0.05, 0.05), Vec2d(0.95, 0.95), Vec2d(0.05, 0.95)};
    return mesh;
}

mms::paint::Raster wrap(const cv::Mat& image) {
    auto r = mms::paint::Raster::wrap(image);
    EXPECT_TRUE(r);
    return *r;
}

size_t count_kind(const std::vector<mms::pipeline::Diagnostic>& diags, DiagnosticKind kind) {
    size_t n = 0;
    for (const auto& d : diags) n += d.kind == kind ? 1 : 0;
    return n;
}

}  // namespace

// ============================================================================
// 导入
// ============================================================================

TEST(RenderSegmentation, PaintsEveryTriangle) {
    const auto mesh = make_quad();
    cv::Mat image = mms::paint::make_image(128, 128, kPalette.color(0));
    auto raster = wrap(image);

    const std::vector<Attribute> attributes = {std::string("1"), std::string("82223")};
    auto report = mms::pipeline::render_segmentation(mesh, attributes, raster, kPalette);
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report->triangles, 2u);
    EXPECT_EQ(report->painted, 2u);
    EXPECT_EQ(report->malformed, 0u);
    EXPECT_EQ(report->leaves, 5u);
    EXPECT_TRUE(report->diagnostics.empty());

    // 第一个三角形内部为红色，第二个三角形 corner0 (v0) 附近为绿色
    EXPECT_EQ(raster.sample(Vec2d(0.8, 0.2)), kPalette.color(1));
    EXPECT_EQ(raster.sample(Vec2d(0.1, 0.2)), kPalette.color(2));
    // 边距内保持不变
    EXPECT_EQ(raster.sample(Vec2d(0.01, 0.01)), kPalette.color(0));
}

TEST(RenderSegmentation, MalformedFallsBackToUnpainted) {
    const auto mesh = make_quad();
    cv::Mat image = mms::paint::make_image(64, 64, kPalette.color(0));
    auto raster = wrap(image);

    const std::vector<Attribute> attributes = {std::string("8"), std::string("3")};
    auto report = mms::pipeline::render_segmentation(mesh, attributes, raster, kPalette);
    ASSERT_TRUE(report);
    EXPECT_EQ(report->malformed, 1u);
    EXPECT_EQ(report->painted, 1u);
    ASSERT_EQ(report->diagnostics.size(), 1u);
    EXPECT_EQ(report->diagnostics[0].kind, DiagnosticKind::kMalformedSegmentation);
    EXPECT_EQ(report->diagnostics[0].triangle, 0u);

    EXPECT_EQ(raster.sample(Vec2d(0.8, 0.2)), kPalette.color(0));
    EXPECT_EQ(raster.sample(Vec2d(0.2, 0.8)), kPalette.color(3));
}

TEST(RenderSegmentation, DegenerateUvSkipped) {
    auto mesh = make_quad();
    mesh.uvs[3] = mesh.uvs[4];
    cv::Mat image = mms::paint::make_image(64, 64, kPalette.color(0));
    auto raster = wrap(image);

    auto report = mms::pipeline::render_segmentation(mesh, {std::string("1"), std::string("2")}, raster, kPalette);
    ASSERT_TRUE(report);
    EXPECT_EQ(report->degenerate, 1u);
    EXPECT_EQ(count_kind(report->diagnostics, DiagnosticKind::kInvalidFootprint), 1u);
    EXPECT_EQ(raster.sample(Vec2d(0.8, 0.2)), kPalette.color(1));
}

TEST(RenderSegmentation, InvalidInput) {
    const auto mesh = make_quad();
    cv::Mat image = mms::paint::make_image(16, 16, kPalette.color(0));
    auto raster = wrap(image);

    auto wrong_count = mms::pipeline::render_segmentation(mesh, {std::nullopt}, raster, kPalette);
    ASSERT_FALSE(wrong_count);
    EXPECT_EQ(wrong_count.error().code, mms::core::ErrorCode::kInvalidArgument);

    auto no_uvs = mesh;
    no_uvs.uvs.clear();
    EXPECT_FALSE(mms::pipeline::render_segmentation(no_uvs, {std::nullopt, std::nullopt}, raster, kPalette));

    mms::paint::Raster empty;
    EXPECT_FALSE(mms::pipeline::render_segmentation(mesh, {std::nullopt, std::nullopt}, empty, kPalette));
}

// ============================================================================
// 导出
// ============================================================================

TEST(ExtractSegmentation, RoundTripThroughTexture) {
    const auto mesh = make_quad();
    cv::Mat image = mms::paint::make_image(256, 256, kPalette.color(0));
    auto raster = wrap(image);

    const std::vector<Attribute> attributes = {std::string("8812300382210"), std::nullopt};
    ASSERT_TRUE(mms::pipeline::render_segmentation(mesh, attributes, raster, kPalette));

    auto report = mms::pipeline::extract_segmentation(mesh, raster, kPalette);
    ASSERT_TRUE(report) << report.error().message;
    ASSERT_EQ(report->attributes.size(), 2u);
    EXPECT_EQ(report->attributes[0], attributes[0]);
    EXPECT_FALSE(report->attributes[1].has_value());
    EXPECT_EQ(report->painted, 1u);
    EXPECT_EQ(report->lossy_triangles, 0u);
    EXPECT_TRUE(report->diagnostics.empty());
}

TEST(ExtractSegmentation, PrecisionLossReported) {
    const auto mesh = make_quad();
    cv::Mat image = mms::paint::make_image(64, 64, kPalette.color(0));
    // 细条纹：深度 1 无法表达
    for (int x = 0; x < image.cols; x += 4) {
        image.colRange(x, x + 2).setTo(cv::Scalar(255, 0, 0, 255));
    }
    auto raster = wrap(image);

    mms::pipeline::PipelineConfig config;
    config.extract.max_depth = 1;
    auto report = mms::pipeline::extract_segmentation(mesh, raster, kPalette, config);
    ASSERT_TRUE(report);
    EXPECT_EQ(report->lossy_triangles, 2u);
    EXPECT_EQ(count_kind(report->diagnostics, DiagnosticKind::kExtractionPrecisionLoss), 2u);
    for (const auto& attribute : report->attributes) {
        if (!attribute) continue;
        auto tree = mms::codec::decode(*attribute);
        ASSERT_TRUE(tree);
        EXPECT_LE(mms::codec::depth(*tree), 1u);
    }
}

TEST(ExtractSegmentation, RejectsDepthAboveFormatLimit) {
    const auto mesh = make_quad();
    cv::Mat image = mms::paint::make_image(16, 16, kPalette.color(0));
    mms::pipeline::PipelineConfig config;
    config.extract.max_depth = mms::codec::kMaxDepth + 1;
    auto report = mms::pipeline::extract_segmentation(mesh, wrap(image), kPalette, config);
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().code, mms::core::ErrorCode::kInvalidArgument);
}

// ============================================================================
// 网格化
// ============================================================================

TEST(SegmentMesh, SubdividesPaintedTriangles) {
    const auto mesh = make_quad();
    auto out = mms::pipeline::segment_mesh(mesh, {std::string("80123"), std::nullopt});
    ASSERT_TRUE(out);
    ASSERT_EQ(out->triangles.size(), 5u);
    EXPECT_EQ(out->vertices.size(), 6u + 3u);

    EXPECT_EQ(out->triangles[1].material, 1);
    EXPECT_EQ(out->triangles[3].material, 3);
    EXPECT_EQ(out->triangles[3].source_triangle, 0u);
    EXPECT_EQ(out->triangles[4].material, 0);
    EXPECT_EQ(out->triangles[4].source_triangle, 1u);
}

TEST(SegmentMesh, MalformedKeptUnsegmented) {
    const auto mesh = make_quad();
    auto out = mms::pipeline::segment_mesh(mesh, {std::string("80"), std::string("2")});
    ASSERT_TRUE(out);
    ASSERT_EQ(out->triangles.size(), 2u);
    EXPECT_EQ(out->triangles[0].material, 0);
    EXPECT_EQ(out->triangles[1].material, 2);
}
