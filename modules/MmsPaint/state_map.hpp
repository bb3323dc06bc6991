#pragma once
/// @file state_map.hpp
/// @brief 状态图：整张纹理一次性分类为材质索引

#include "raster.hpp"

namespace mms::paint {

/// 与任何调色板颜色都不够接近（或全透明）的像素
constexpr uint8_t kUnclassified = 0xFF;

/// 默认颜色容差：RGB 三通道绝对差之和
constexpr int kDefaultColorTolerance = 48;

/// @brief 构建状态图
/// 每个像素取 L1 RGB 距离最近的调色板索引（并列取较小索引），
/// 距离超过 color_tolerance 或 alpha == 0 的像素记为 kUnclassified。
/// 全部为整块数组运算，按行带分块以限制峰值内存。
/// @return CV_8UC1，尺寸与 raster 相同
[[nodiscard]] MMSPAINT_API core::Result<cv::Mat1b> build_state_map(
    const Raster& raster,
    const Palette& palette,
    int color_tolerance = kDefaultColorTolerance);

}  // namespace mms::paint
