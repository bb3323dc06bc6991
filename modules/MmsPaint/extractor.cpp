/// @file extractor.cpp
#include "extractor.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace mms::paint {

namespace {

// fillConvexPoly 的定点小数位
constexpr int kPolyShift = 8;
constexpr double kPolyScale = 1 << kPolyShift;

// 退化取样：3 个角点 + 3 个边中点 + 质心
constexpr size_t kFallbackSamples = 7;
// 取样点向质心收拢，避免正好落在相邻区域共享的边界像素上
constexpr double kFallbackPull = 0.9;

/// 多数票，并列取较小索引
[[nodiscard]] uint8_t majority(const std::array<size_t, codec::kMaterialCount>& votes) noexcept {
    uint8_t best = 0;
    for (uint8_t k = 1; k < codec::kMaterialCount; ++k) {
        if (votes[k] > votes[best]) best = k;
    }
    return best;
}

}  // namespace

TreeExtractor::TreeExtractor(cv::Mat1b state_map, const ExtractParams& params)
    : states_(std::move(state_map)), params_(params) {}

core::Result<TreeExtractor> TreeExtractor::create(
    const Raster& raster, const Palette& palette, const ExtractParams& params) {
    if (params.max_depth > codec::kMaxDepth) {
        return core::make_error(core::ErrorCode::kInvalidArgument,
                                fmt::format("max_depth {} exceeds format limit {}",
                                            params.max_depth, codec::kMaxDepth));
    }
    auto states = build_state_map(raster, palette, params.color_tolerance);
    if (!states) return core::unexpected(states.error());
    return TreeExtractor(std::move(*states), params);
}

TreeExtractor::Votes TreeExtractor::count_votes(const geom::UvFootprint& footprint) const {
    Votes votes{};
    std::array<core::Vec2d, 3> p;
    for (int i = 0; i < 3; ++i) p[i] = to_pixel(footprint.v[i]);

    // 向内心收缩 edge_margin_px，避开与相邻区域共享的边界像素
    const double a = (p[1] - p[2]).norm();
    const double b = (p[2] - p[0]).norm();
    const double c = (p[0] - p[1]).norm();
    const double perimeter = a + b + c;
    const core::Vec2d e1 = p[1] - p[0], e2 = p[2] - p[0];
    const double area = 0.5 * std::abs(e1.x() * e2.y() - e1.y() * e2.x());
    const double inradius = perimeter > 0.0 ? 2.0 * area / perimeter : 0.0;

    if (inradius > params_.edge_margin_px) {
        const core::Vec2d incenter = (a * p[0] + b * p[1] + c * p[2]) / perimeter;
        const double scale = (inradius - params_.edge_margin_px) / inradius;

        // OpenCV 整数像素坐标以像素中心为原点，故平移 -0.5
        std::array<core::Vec2d, 3> q;
        for (int i = 0; i < 3; ++i) {
            q[i] = incenter + (p[i] - incenter) * scale - core::Vec2d(0.5, 0.5);
        }
        const double min_x = std::min({q[0].x(), q[1].x(), q[2].x()});
        const double max_x = std::max({q[0].x(), q[1].x(), q[2].x()});
        const double min_y = std::min({q[0].y(), q[1].y(), q[2].y()});
        const double max_y = std::max({q[0].y(), q[1].y(), q[2].y()});
        const int x0 = std::max(0, static_cast<int>(std::floor(min_x)));
        const int y0 = std::max(0, static_cast<int>(std::floor(min_y)));
        const int x1 = std::min(states_.cols, static_cast<int>(std::ceil(max_x)) + 1);
        const int y1 = std::min(states_.rows, static_cast<int>(std::ceil(max_y)) + 1);

        if (x0 < x1 && y0 < y1) {
            const cv::Rect roi(x0, y0, x1 - x0, y1 - y0);
            cv::Mat1b mask = cv::Mat1b::zeros(roi.size());
            std::array<cv::Point, 3> pts;
            for (int i = 0; i < 3; ++i) {
                pts[i] = cv::Point(cvRound((q[i].x() - x0) * kPolyScale),
                                   cvRound((q[i].y() - y0) * kPolyScale));
            }
            cv::fillConvexPoly(mask, pts.data(), 3, cv::Scalar(255), cv::LINE_8, kPolyShift);

            if (cv::countNonZero(mask) > 0) {
                const cv::Mat1b region = states_(roi);
                cv::Mat1b hits;
                for (uint8_t k = 0; k < codec::kMaterialCount; ++k) {
                    cv::compare(region, cv::Scalar(k), hits, cv::CMP_EQ);
                    cv::bitwise_and(hits, mask, hits);
                    votes[k] = static_cast<size_t>(cv::countNonZero(hits));
                }
                return votes;
            }
        }
    }

    // 细长或亚像素三角形：内缩后没有像素，改为在角点、边中点和质心处取样，
    // 取样点间不一致时照常继续细分，到 max_depth 记为有损叶子
    const core::Vec2d centroid = (p[0] + p[1] + p[2]) / 3.0;
    std::array<core::Vec2d, kFallbackSamples> samples;
    for (int i = 0; i < 3; ++i) {
        samples[i] = p[i];
        samples[3 + i] = (p[i] + p[(i + 1) % 3]) * 0.5;
    }
    samples[6] = centroid;
    for (const auto& sample : samples) {
        const core::Vec2d q = centroid + (sample - centroid) * kFallbackPull;
        const int x = std::clamp(static_cast<int>(std::floor(q.x())), 0, states_.cols - 1);
        const int y = std::clamp(static_cast<int>(std::floor(q.y())), 0, states_.rows - 1);
        const uint8_t s = states_(y, x);
        if (s < codec::kMaterialCount) ++votes[s];
    }
    return votes;
}

core::Result<codec::SegmentationNode> TreeExtractor::extract_node(
    const geom::UvFootprint& footprint, uint32_t level, ExtractStats& stats) const {
    ++stats.nodes_visited;
    stats.deepest_level = std::max(stats.deepest_level, level);

    const Votes votes = count_votes(footprint);
    const auto present = std::count_if(votes.begin(), votes.end(), [](size_t v) { return v > 0; });

    if (present <= 1) {
        // 全部一致（或没有可分类的像素，视为未涂色）
        return codec::make_leaf(majority(votes));
    }
    if (level >= params_.max_depth) {
        ++stats.lossy_leaves;
        const uint8_t m = majority(votes);
        MMS_TRACE("precision loss at depth {}: votes [{}, {}, {}, {}] -> material {}",
                  level, votes[0], votes[1], votes[2], votes[3], m);
        return codec::make_leaf(m);
    }

    auto children = geom::subdivide(footprint);
    if (!children) return core::unexpected(children.error());

    std::array<codec::SegmentationNode, codec::kChildCount> nodes;
    for (size_t i = 0; i < codec::kChildCount; ++i) {
        auto child = extract_node((*children)[i], level + 1, stats);
        if (!child) return child;
        nodes[i] = std::move(*child);
    }

    codec::SegmentationNode node = codec::make_split(std::move(nodes));
    if (params_.simplify) {
        const auto& first = node.children.front();
        const bool uniform = std::all_of(node.children.begin(), node.children.end(),
            [&](const codec::SegmentationNode& c) { return c.is_leaf() && c.material == first.material; });
        if (uniform) return codec::make_leaf(first.material);
    }
    return node;
}

core::Result<codec::SegmentationNode> TreeExtractor::extract(
    const geom::UvFootprint& footprint, ExtractStats* stats) const {
    if (states_.empty()) {
        return core::make_error(core::ErrorCode::kInvalidArgument, "extractor has no state map");
    }
    if (geom::is_degenerate(footprint)) {
        return core::make_error(core::ErrorCode::kInvalidFootprint,
                                "cannot extract from degenerate UV triangle");
    }
    ExtractStats local;
    auto tree = extract_node(footprint, 0, local);
    if (stats) {
        stats->nodes_visited += local.nodes_visited;
        stats->lossy_leaves += local.lossy_leaves;
        stats->deepest_level = std::max(stats->deepest_level, local.deepest_level);
    }
    return tree;
}

core::Result<codec::SegmentationNode> extract(const geom::UvFootprint& footprint, const Raster& raster,
                                              const Palette& palette, const ExtractParams& params,
                                              ExtractStats* stats) {
    auto extractor = TreeExtractor::create(raster, palette, params);
    if (!extractor) return core::unexpected(extractor.error());
    ExtractStats local;
    auto tree = extractor->extract(footprint, &local);
    if (tree && local.precision_loss()) {
        MMS_WARN("extraction hit max depth {}: {} lossy leaves", params.max_depth, local.lossy_leaves);
    }
    if (stats) {
        stats->nodes_visited += local.nodes_visited;
        stats->lossy_leaves += local.lossy_leaves;
        stats->deepest_level = std::max(stats->deepest_level, local.deepest_level);
    }
    return tree;
}

}  // namespace mms::paint
