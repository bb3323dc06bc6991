#pragma once
/// @file renderer.hpp
/// @brief 分割树 -> 纹理（导入方向）

#include "raster.hpp"
#include "MmsGeometry.hpp"
#include <vector>

namespace mms::paint {

// ============================================================================
// 渲染参数
// ============================================================================
struct RenderParams {
    double edge_epsilon_px = 1e-4;  // 边包含容差（像素），避免相邻叶子间出现细缝
    bool   close_gaps = true;       // 叶子全部写完后执行补缝
};

// ============================================================================
// 渲染器
// ============================================================================
/// 叶子栅格化：像素中心落在叶子三角形内（含边）即写入该材质颜色；
/// 材质 0 不写颜色，但同样记为已覆盖。
/// 补缝：根 footprint 内没有被任何叶子覆盖的像素，取最近已覆盖像素的值。
class MMSPAINT_API TreeRenderer {
public:
    TreeRenderer(Raster raster, const Palette& palette, const RenderParams& params = {});

    /// @brief 展开并栅格化一棵树
    [[nodiscard]] core::Result<void> fill(
        const codec::SegmentationNode& tree, const geom::UvFootprint& footprint);

    /// @brief 批量栅格化已展开的叶子
    /// 按行带并行，每个行带内按叶子顺序写入，结果与串行一致
    /// @param leaves flatten() 的结果（材质已校验）
    /// @param roots 各三角形的根 footprint（补缝范围）
    void fill_leaves(const std::vector<geom::UvLeaf>& leaves,
                     const std::vector<geom::UvFootprint>& roots);

    /// @brief 补缝，必须在所有叶子写入之后调用
    /// @return 被填充的像素数
    size_t close_gaps();

    [[nodiscard]] const cv::Mat1b& coverage() const noexcept { return coverage_; }
    [[nodiscard]] const Raster& raster() const noexcept { return raster_; }

private:
    struct PixelTriangle;

    [[nodiscard]] PixelTriangle to_pixels(const geom::UvFootprint& f) const;

    template <typename Fn>
    void scan(const PixelTriangle& tri, int row_begin, int row_end, Fn&& on_pixel) const;

    void rasterize(const geom::UvLeaf& leaf, int row_begin, int row_end);

    Raster       raster_;
    Palette      palette_;
    RenderParams params_;
    cv::Mat1b    coverage_;  // 非零 = 已被叶子覆盖
    std::vector<geom::UvFootprint> roots_;
};

// ============================================================================
// 便捷函数
// ============================================================================

/// @brief 渲染一个三角形的分割树并补缝
/// @return 补缝填充的像素数；退化 footprint 返回 kInvalidFootprint
[[nodiscard]] MMSPAINT_API core::Result<size_t> paint(
    const codec::SegmentationNode& tree,
    const geom::UvFootprint& footprint,
    Raster& raster,
    const Palette& palette,
    const RenderParams& params = {});

}  // namespace mms::paint
