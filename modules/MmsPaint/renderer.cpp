/// @file renderer.cpp
#include "renderer.hpp"
#include "macro.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace mms::paint {

namespace {

// 并行栅格化的行带高度
constexpr int kBandRows = 64;

}  // namespace

/// 像素坐标下的三角形，绕序已归一化为正向
struct TreeRenderer::PixelTriangle {
    std::array<core::Vec2d, 3> p;
    std::array<double, 3> edge_len{};
    double min_x = 0.0, max_x = 0.0, min_y = 0.0, max_y = 0.0;
};

TreeRenderer::TreeRenderer(Raster raster, const Palette& palette, const RenderParams& params)
    : raster_(std::move(raster)), palette_(palette), params_(params) {
    coverage_ = cv::Mat1b::zeros(raster_.height(), raster_.width());
}

TreeRenderer::PixelTriangle TreeRenderer::to_pixels(const geom::UvFootprint& f) const {
    PixelTriangle t;
    for (int i = 0; i < 3; ++i) t.p[i] = raster_.uv_to_pixel(f.v[i]);

    const core::Vec2d ab = t.p[1] - t.p[0], ac = t.p[2] - t.p[0];
    if (ab.x() * ac.y() - ab.y() * ac.x() < 0.0) std::swap(t.p[1], t.p[2]);

    for (int i = 0; i < 3; ++i) t.edge_len[i] = (t.p[(i + 1) % 3] - t.p[i]).norm();
    t.min_x = std::min({t.p[0].x(), t.p[1].x(), t.p[2].x()});
    t.max_x = std::max({t.p[0].x(), t.p[1].x(), t.p[2].x()});
    t.min_y = std::min({t.p[0].y(), t.p[1].y(), t.p[2].y()});
    t.max_y = std::max({t.p[0].y(), t.p[1].y(), t.p[2].y()});
    return t;
}

template <typename Fn>
void TreeRenderer::scan(const PixelTriangle& tri, int row_begin, int row_end, Fn&& on_pixel) const {
    const double eps = params_.edge_epsilon_px;
    // 像素中心 c 满足 min <= c + 0.5 <= max
    const int x0 = std::max(0, static_cast<int>(std::floor(tri.min_x - 0.5 - eps)));
    const int x1 = std::min(raster_.width() - 1, static_cast<int>(std::ceil(tri.max_x - 0.5 + eps)));
    const int y0 = std::max(row_begin, static_cast<int>(std::floor(tri.min_y - 0.5 - eps)));
    const int y1 = std::min(row_end - 1, static_cast<int>(std::ceil(tri.max_y - 0.5 + eps)));

    for (int y = y0; y <= y1; ++y) {
        const double py = y + 0.5;
        for (int x = x0; x <= x1; ++x) {
            const double px = x + 0.5;
            bool inside = true;
            for (int i = 0; i < 3 && inside; ++i) {
                const core::Vec2d& a = tri.p[i];
                const core::Vec2d& b = tri.p[(i + 1) % 3];
                const double e = (b.x() - a.x()) * (py - a.y()) - (b.y() - a.y()) * (px - a.x());
                inside = e >= -eps * tri.edge_len[i];
            }
            if (inside) on_pixel(x, y);
        }
    }
}

void TreeRenderer::rasterize(const geom::UvLeaf& leaf, int row_begin, int row_end) {
    const PixelTriangle tri = to_pixels(leaf.footprint);
    if (leaf.material == codec::kBaseMaterial) {
        scan(tri, row_begin, row_end, [&](int x, int y) { coverage_(y, x) = 1; });
        return;
    }
    const Color color = palette_.color(leaf.material);
    cv::Mat& image = raster_.image();
    scan(tri, row_begin, row_end, [&](int x, int y) {
        image.at<Color>(y, x) = color;
        coverage_(y, x) = 1;
    });
}

core::Result<void> TreeRenderer::fill(const codec::SegmentationNode& tree, const geom::UvFootprint& footprint) {
    if (raster_.empty()) {
        return core::make_error(core::ErrorCode::kInvalidArgument, "cannot paint into an empty raster");
    }
    if (geom::is_degenerate(footprint)) {
        return core::make_error(core::ErrorCode::kInvalidFootprint,
                                "cannot paint degenerate UV triangle");
    }
    auto leaves = geom::flatten(tree, footprint);
    if (!leaves) return core::unexpected(leaves.error());

    for (const auto& leaf : *leaves) rasterize(leaf, 0, raster_.height());
    roots_.push_back(footprint);
    MMS_TRACE("painted {} leaves", leaves->size());
    return {};
}

void TreeRenderer::fill_leaves(const std::vector<geom::UvLeaf>& leaves,
                               const std::vector<geom::UvFootprint>& roots) {
    const int bands = (raster_.height() + kBandRows - 1) / kBandRows;

    MMS_OMP_PARALLEL_FOR
    for (int band = 0; band < bands; ++band) {
        const int row_begin = band * kBandRows;
        const int row_end = std::min(row_begin + kBandRows, raster_.height());
        const double v_begin = static_cast<double>(row_begin) / raster_.height();
        const double v_end = static_cast<double>(row_end) / raster_.height();
        for (const auto& leaf : leaves) {
            const auto& v = leaf.footprint.v;
            const double lo = std::min({v[0].y(), v[1].y(), v[2].y()});
            const double hi = std::max({v[0].y(), v[1].y(), v[2].y()});
            // 粗筛：与行带不相交的叶子（留一个像素余量）
            if (hi < v_begin - 1.0 / raster_.height() || lo > v_end + 1.0 / raster_.height()) continue;
            rasterize(leaf, row_begin, row_end);
        }
    }
    roots_.insert(roots_.end(), roots.begin(), roots.end());
}

size_t TreeRenderer::close_gaps() {
    if (roots_.empty()) return 0;

    cv::Mat1b gaps = cv::Mat1b::zeros(coverage_.size());
    for (const auto& root : roots_) {
        scan(to_pixels(root), 0, raster_.height(), [&](int x, int y) {
            if (!coverage_(y, x)) gaps(y, x) = 255;
        });
    }
    const int gap_count = cv::countNonZero(gaps);
    if (gap_count == 0) return 0;
    if (cv::countNonZero(coverage_) == 0) {
        MMS_WARN("close_gaps: {} gap pixels but no covered pixels to copy from", gap_count);
        return 0;
    }

    // 每个已覆盖像素（距离变换的零点）一个标签，标签 -> 像素位置
    cv::Mat1b sources = (coverage_ == 0);
    cv::Mat dist, labels;
    cv::distanceTransform(sources, dist, labels, cv::DIST_L2, cv::DIST_MASK_5, cv::DIST_LABEL_PIXEL);

    std::vector<cv::Point> label_pos(static_cast<size_t>(coverage_.total()) + 1, cv::Point(-1, -1));
    for (int y = 0; y < coverage_.rows; ++y) {
        for (int x = 0; x < coverage_.cols; ++x) {
            if (coverage_(y, x)) label_pos[labels.at<int>(y, x)] = cv::Point(x, y);
        }
    }

    cv::Mat& image = raster_.image();
    size_t filled = 0;
    for (int y = 0; y < gaps.rows; ++y) {
        for (int x = 0; x < gaps.cols; ++x) {
            if (!gaps(y, x)) continue;
            const cv::Point src = label_pos[labels.at<int>(y, x)];
            if (src.x < 0) continue;
            image.at<Color>(y, x) = image.at<Color>(src);
            ++filled;
        }
    }
    // 补过的像素视为已覆盖，重复调用不会再次填充
    for (int y = 0; y < gaps.rows; ++y) {
        for (int x = 0; x < gaps.cols; ++x) {
            if (gaps(y, x) && label_pos[labels.at<int>(y, x)].x >= 0) coverage_(y, x) = 1;
        }
    }
    MMS_DEBUG("close_gaps: filled {} / {} gap pixels", filled, gap_count);
    return filled;
}

core::Result<size_t> paint(const codec::SegmentationNode& tree, const geom::UvFootprint& footprint,
                           Raster& raster, const Palette& palette, const RenderParams& params) {
    TreeRenderer renderer(raster, palette, params);
    auto r = renderer.fill(tree, footprint);
    if (!r) return core::unexpected(r.error());
    return params.close_gaps ? renderer.close_gaps() : size_t{0};
}

}  // namespace mms::paint
