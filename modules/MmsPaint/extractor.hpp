#pragma once
/// @file extractor.hpp
/// @brief 纹理 -> 分割树（导出方向）

#include "raster.hpp"
#include "state_map.hpp"
#include "MmsGeometry.hpp"

namespace mms::paint {

// ============================================================================
// 提取参数
// ============================================================================
struct ExtractParams {
    uint32_t max_depth = codec::kMaxDepth;        // 递归上限，到达后强制生成（有损）叶子
    int      color_tolerance = kDefaultColorTolerance;  // 状态图分类容差
    double   edge_margin_px = 0.75;               // 只统计离三角形边至少此距离的像素
    bool     simplify = true;                     // 四个同材质叶子合并为一个
};

// ============================================================================
// 提取统计
// ============================================================================
struct ExtractStats {
    size_t   nodes_visited = 0;
    size_t   lossy_leaves = 0;       // 在 max_depth 处按多数票生成的叶子
    uint32_t deepest_level = 0;

    /// 是否发生 ExtractionPrecisionLoss（非致命）
    [[nodiscard]] bool precision_loss() const noexcept { return lossy_leaves > 0; }
};

// ============================================================================
// 提取器
// ============================================================================
/// 持有一份状态图快照，extract() 为只读操作，可在多个线程中并发调用
class MMSPAINT_API TreeExtractor {
public:
    /// @param state_map build_state_map() 的结果（CV_8UC1）
    explicit TreeExtractor(cv::Mat1b state_map, const ExtractParams& params = {});

    /// @brief 从 raster 构建状态图并创建提取器
    [[nodiscard]] static core::Result<TreeExtractor> create(
        const Raster& raster, const Palette& palette, const ExtractParams& params = {});

    /// @brief 提取一个 UV 三角形的分割树
    /// @param stats 可选统计输出（累加）
    [[nodiscard]] core::Result<codec::SegmentationNode> extract(
        const geom::UvFootprint& footprint, ExtractStats* stats = nullptr) const;

    [[nodiscard]] const cv::Mat1b& state_map() const noexcept { return states_; }
    [[nodiscard]] const ExtractParams& params() const noexcept { return params_; }

private:
    using Votes = std::array<size_t, codec::kMaterialCount>;

    [[nodiscard]] core::Result<codec::SegmentationNode> extract_node(
        const geom::UvFootprint& footprint, uint32_t level, ExtractStats& stats) const;

    [[nodiscard]] Votes count_votes(const geom::UvFootprint& footprint) const;

    [[nodiscard]] core::Vec2d to_pixel(const core::Vec2d& uv) const noexcept {
        return {uv.x() * states_.cols, uv.y() * states_.rows};
    }

    cv::Mat1b     states_;
    ExtractParams params_;
};

// ============================================================================
// 便捷函数
// ============================================================================

/// @brief 单个三角形：构建状态图并提取
[[nodiscard]] MMSPAINT_API core::Result<codec::SegmentationNode> extract(
    const geom::UvFootprint& footprint,
    const Raster& raster,
    const Palette& palette,
    const ExtractParams& params = {},
    ExtractStats* stats = nullptr);

}  // namespace mms::paint
