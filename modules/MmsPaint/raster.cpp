/// @file raster.cpp
#include "raster.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace mms::paint {

namespace {

[[nodiscard]] int hex_nibble(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

core::Result<Raster> Raster::wrap(cv::Mat image) {
    if (image.empty()) {
        return core::make_error(core::ErrorCode::kInvalidArgument, "raster image is empty");
    }
    if (image.type() != CV_8UC4) {
        return core::make_error(core::ErrorCode::kUnsupportedFormat,
                                fmt::format("raster must be CV_8UC4, got type {}", image.type()));
    }
    return Raster(std::move(image));
}

cv::Point Raster::pixel_index(const core::Vec2d& uv) const noexcept {
    const core::Vec2d p = uv_to_pixel(uv);
    const int x = static_cast<int>(std::floor(p.x()));
    const int y = static_cast<int>(std::floor(p.y()));
    return {std::clamp(x, 0, width() - 1), std::clamp(y, 0, height() - 1)};
}

cv::Mat make_image(int width, int height, const Color& fill) {
    return cv::Mat(height, width, CV_8UC4, cv::Scalar(fill[0], fill[1], fill[2], fill[3]));
}

Palette Palette::defaults() {
    Palette p;
    p.colors[0] = Color(200, 200, 200, 255);
    p.colors[1] = Color(255, 0, 0, 255);
    p.colors[2] = Color(0, 255, 0, 255);
    p.colors[3] = Color(0, 0, 255, 255);
    return p;
}

uint8_t Palette::nearest(const Color& c, int* distance) const noexcept {
    uint8_t best = 0;
    int best_dist = -1;
    for (uint8_t k = 0; k < codec::kMaterialCount; ++k) {
        int d = 0;
        for (int ch = 0; ch < 3; ++ch) d += std::abs(int(c[ch]) - int(colors[k][ch]));
        if (best_dist < 0 || d < best_dist) {
            best = k;
            best_dist = d;
        }
    }
    if (distance) *distance = best_dist;
    return best;
}

core::Result<Palette> Palette::from_hex(const std::vector<std::string>& hex_colors) {
    if (hex_colors.size() > codec::kMaterialCount) {
        return core::make_error(core::ErrorCode::kInvalidArgument,
                                fmt::format("palette has {} colors, at most {} supported",
                                            hex_colors.size(), codec::kMaterialCount));
    }
    Palette p = defaults();
    for (size_t i = 0; i < hex_colors.size(); ++i) {
        auto c = parse_hex_color(hex_colors[i]);
        if (!c) return core::unexpected(c.error());
        p.colors[i] = *c;
    }
    return p;
}

core::Result<Color> parse_hex_color(std::string_view text) {
    if (!text.empty() && text.front() == '#') text.remove_prefix(1);
    if (text.size() != 6 && text.size() != 8) {
        return core::make_error(core::ErrorCode::kParseError,
                                fmt::format("invalid color '{}': expected #RRGGBB or #RRGGBBAA", text));
    }
    Color c(0, 0, 0, 255);
    for (size_t i = 0; i < text.size() / 2; ++i) {
        const int hi = hex_nibble(text[2 * i]);
        const int lo = hex_nibble(text[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return core::make_error(core::ErrorCode::kParseError,
                                    fmt::format("invalid hex digit in color '{}'", text));
        }
        c[static_cast<int>(i)] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return c;
}

std::string to_hex(const Color& color) {
    return fmt::format("#{:02X}{:02X}{:02X}{:02X}", color[0], color[1], color[2], color[3]);
}

}  // namespace mms::paint
