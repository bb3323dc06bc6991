#pragma once
/// @file raster.hpp
/// @brief 纹理栅格句柄与调色板 (基于 OpenCV)

#if defined(_WIN32)
  #ifdef MMSPAINT_EXPORTS
    #define MMSPAINT_API __declspec(dllexport)
  #else
    #define MMSPAINT_API __declspec(dllimport)
  #endif
#else
  #define MMSPAINT_API __attribute__((visibility("default")))
#endif

#include "MmsCore.hpp"
#include "MmsCodec.hpp"
#include <opencv2/core.hpp>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace mms::paint {

/// RGBA8，通道顺序 R, G, B, A
using Color = cv::Vec4b;

// ============================================================================
// Raster
// ============================================================================
/// 不拥有像素缓冲：wrap() 只复制 cv::Mat 头，写入直接落到调用方的图像
/// UV 映射：像素 (x, y) 覆盖 [x, x+1) x [y, y+1)，中心 (x+0.5, y+0.5)，
/// x = u * width, y = v * height（v = 0 对应第 0 行）
class MMSPAINT_API Raster {
public:
    Raster() = default;

    /// @brief 包装调用方的 CV_8UC4 图像
    [[nodiscard]] static core::Result<Raster> wrap(cv::Mat image);

    [[nodiscard]] int width() const noexcept { return image_.cols; }
    [[nodiscard]] int height() const noexcept { return image_.rows; }
    [[nodiscard]] bool empty() const noexcept { return image_.empty(); }

    [[nodiscard]] cv::Mat& image() noexcept { return image_; }
    [[nodiscard]] const cv::Mat& image() const noexcept { return image_; }

    /// UV -> 连续像素坐标
    [[nodiscard]] core::Vec2d uv_to_pixel(const core::Vec2d& uv) const noexcept {
        return {uv.x() * width(), uv.y() * height()};
    }

    /// UV -> 像素索引（越界钳制到边缘）
    [[nodiscard]] cv::Point pixel_index(const core::Vec2d& uv) const noexcept;

    [[nodiscard]] Color sample(const core::Vec2d& uv) const {
        return image_.at<Color>(pixel_index(uv));
    }

private:
    explicit Raster(cv::Mat image) : image_(std::move(image)) {}

    cv::Mat image_;
};

/// @brief 分配一张填充为 fill 的 RGBA 图像（调用方持有）
[[nodiscard]] MMSPAINT_API cv::Mat make_image(int width, int height, const Color& fill);

// ============================================================================
// 调色板：材质索引 -> 颜色
// ============================================================================
/// colors[0] 为基础色：渲染时不写入，提取时用于识别未涂色区域
struct MMSPAINT_API Palette {
    std::array<Color, codec::kMaterialCount> colors{};

    [[nodiscard]] const Color& color(uint8_t material) const { return colors[material]; }

    /// @brief RGB 绝对差之和最小的材质索引（并列取较小索引），忽略 alpha
    /// @param distance 可选输出：最小距离
    [[nodiscard]] uint8_t nearest(const Color& c, int* distance = nullptr) const noexcept;

    /// @brief 默认调色板：浅灰基础色 + 红/绿/蓝
    [[nodiscard]] static Palette defaults();

    /// @brief 从 "#RRGGBB" / "#RRGGBBAA" 列表构造，不足 4 个的位置保留默认色
    [[nodiscard]] static core::Result<Palette> from_hex(const std::vector<std::string>& hex_colors);
};

/// @brief 解析 "#RRGGBB" 或 "#RRGGBBAA"（'#' 可省略）
[[nodiscard]] MMSPAINT_API core::Result<Color> parse_hex_color(std::string_view text);

/// @brief 颜色转 "#RRGGBBAA"
[[nodiscard]] MMSPAINT_API std::string to_hex(const Color& color);

}  // namespace mms::paint
