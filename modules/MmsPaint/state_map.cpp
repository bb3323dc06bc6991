/// @file state_map.cpp
#include "state_map.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <limits>

namespace mms::paint {

namespace {

// 分块行数，8K 纹理时峰值内存约 width * 256 * 16 字节
constexpr int kChunkRows = 256;

void classify_chunk(const cv::Mat& rgba, const Palette& palette, float tolerance, cv::Mat1b& states) {
    cv::Mat1f best(rgba.size(), std::numeric_limits<float>::max());
    states.setTo(cv::Scalar(kUnclassified));

    cv::Mat rgba_f;
    rgba.convertTo(rgba_f, CV_32FC4);

    // 只累加 RGB，忽略 alpha
    const cv::Matx14f rgb_sum(1.0f, 1.0f, 1.0f, 0.0f);
    cv::Mat diff, dist;
    cv::Mat1b closer;
    for (uint8_t k = 0; k < codec::kMaterialCount; ++k) {
        const Color& c = palette.color(k);
        cv::absdiff(rgba_f, cv::Scalar(c[0], c[1], c[2], c[3]), diff);
        cv::transform(diff, dist, rgb_sum);
        cv::compare(dist, best, closer, cv::CMP_LT);
        dist.copyTo(best, closer);
        states.setTo(cv::Scalar(k), closer);
    }
    states.setTo(cv::Scalar(kUnclassified), best > tolerance);

    cv::Mat alpha;
    cv::extractChannel(rgba, alpha, 3);
    states.setTo(cv::Scalar(kUnclassified), alpha == 0);
}

}  // namespace

core::Result<cv::Mat1b> build_state_map(const Raster& raster, const Palette& palette, int color_tolerance) {
    if (raster.empty()) {
        return core::make_error(core::ErrorCode::kInvalidArgument, "cannot classify an empty raster");
    }
    if (color_tolerance < 0) {
        return core::make_error(core::ErrorCode::kInvalidArgument,
                                fmt::format("color tolerance must be >= 0, got {}", color_tolerance));
    }

    const cv::Mat& image = raster.image();
    cv::Mat1b states(image.size(), kUnclassified);
    for (int y0 = 0; y0 < image.rows; y0 += kChunkRows) {
        const int y1 = std::min(y0 + kChunkRows, image.rows);
        const cv::Range rows(y0, y1);
        cv::Mat1b chunk_states = states.rowRange(rows);
        classify_chunk(image.rowRange(rows), palette, static_cast<float>(color_tolerance), chunk_states);
    }

    MMS_DEBUG("state map {}x{} built (tolerance {})", image.cols, image.rows, color_tolerance);
    return states;
}

}  // namespace mms::paint
