#pragma once
/// @file footprint.hpp
/// @brief 三角形 footprint 与中点细分

#if defined(_WIN32)
  #ifdef MMSGEOMETRY_EXPORTS
    #define MMSGEOMETRY_API __declspec(dllexport)
  #else
    #define MMSGEOMETRY_API __declspec(dllimport)
  #endif
#else
  #define MMSGEOMETRY_API __attribute__((visibility("default")))
#endif

#include "MmsCore.hpp"
#include "MmsCodec.hpp"
#include <array>
#include <vector>

namespace mms::geom {

// ============================================================================
// Footprint
// ============================================================================
/// 三个角点 [v0, v1, v2]，顺序必须与生成分割串时一致
template <typename Vec>
struct Footprint {
    std::array<Vec, 3> v;

    [[nodiscard]] Vec centroid() const { return (v[0] + v[1] + v[2]) / 3.0; }
};

using UvFootprint     = Footprint<core::Vec2d>;
using ObjectFootprint = Footprint<core::Vec3d>;

/// 细分结果，顺序 [corner0, corner1, corner2, center]
template <typename Vec>
using Subdivision = std::array<Footprint<Vec>, codec::kChildCount>;

/// 叶子三角形（展开后的分割树）
template <typename Vec>
struct LeafTriangle {
    Footprint<Vec> footprint;
    uint8_t material = codec::kBaseMaterial;
};

using UvLeaf = LeafTriangle<core::Vec2d>;

// ============================================================================
// 几何量
// ============================================================================

/// 相对退化阈值：面积 <= eps * 最长边^2 视为退化
constexpr double kDegenerateEpsilon = 1e-12;

template <typename Vec>
[[nodiscard]] MMSGEOMETRY_API double area(const Footprint<Vec>& f);

template <typename Vec>
[[nodiscard]] MMSGEOMETRY_API bool is_degenerate(const Footprint<Vec>& f);

/// @brief 点是否在 UV 三角形内（含边，eps 为到边的容差）
[[nodiscard]] MMSGEOMETRY_API bool contains(
    const UvFootprint& f, const core::Vec2d& p, double eps = 0.0);

// ============================================================================
// 细分
// ============================================================================

/// @brief 中点四分
/// child0 = [v0, m01, m20], child1 = [v1, m12, m01],
/// child2 = [v2, m20, m12], child3 = [m01, m12, m20]
/// @return 四个子 footprint，退化输入返回 kInvalidFootprint
template <typename Vec>
[[nodiscard]] MMSGEOMETRY_API core::Result<Subdivision<Vec>> subdivide(const Footprint<Vec>& f);

/// @brief 按分割树展开为叶子三角形（每个分裂节点恰好细分一次）
/// @return 叶子列表（先序）；树结构非法返回 kInvalidArgument，退化返回 kInvalidFootprint
template <typename Vec>
[[nodiscard]] MMSGEOMETRY_API core::Result<std::vector<LeafTriangle<Vec>>> flatten(
    const codec::SegmentationNode& tree, const Footprint<Vec>& f);

}  // namespace mms::geom
