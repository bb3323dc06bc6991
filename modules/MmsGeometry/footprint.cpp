/// @file footprint.cpp
#include "footprint.hpp"
#include <algorithm>
#include <cmath>

namespace mms::geom {

namespace {

[[nodiscard]] double twice_area(const core::Vec2d& a, const core::Vec2d& b, const core::Vec2d& c) {
    const core::Vec2d ab = b - a, ac = c - a;
    return std::abs(ab.x() * ac.y() - ab.y() * ac.x());
}

[[nodiscard]] double twice_area(const core::Vec3d& a, const core::Vec3d& b, const core::Vec3d& c) {
    return (b - a).cross(c - a).norm();
}

template <typename Vec>
[[nodiscard]] Vec midpoint(const Vec& a, const Vec& b) {
    return (a + b) * 0.5;
}

template <typename Vec>
core::Result<void> flatten_into(const codec::SegmentationNode& node, const Footprint<Vec>& f,
                                std::vector<LeafTriangle<Vec>>& out) {
    if (node.is_leaf()) {
        out.push_back({f, node.material});
        return {};
    }
    if (node.children.size() != codec::kChildCount) {
        return core::make_error(core::ErrorCode::kInvalidArgument, "split node without four children");
    }
    auto children = subdivide(f);
    if (!children) return core::unexpected(children.error());
    for (size_t i = 0; i < codec::kChildCount; ++i) {
        auto r = flatten_into(node.children[i], (*children)[i], out);
        if (!r) return r;
    }
    return {};
}

}  // namespace

template <typename Vec>
double area(const Footprint<Vec>& f) {
    return 0.5 * twice_area(f.v[0], f.v[1], f.v[2]);
}

template <typename Vec>
bool is_degenerate(const Footprint<Vec>& f) {
    for (const auto& p : f.v) {
        if (!p.allFinite()) return true;
    }
    const double e01 = (f.v[1] - f.v[0]).squaredNorm();
    const double e12 = (f.v[2] - f.v[1]).squaredNorm();
    const double e20 = (f.v[0] - f.v[2]).squaredNorm();
    const double longest = std::max({e01, e12, e20});
    if (longest <= 0.0) return true;
    return twice_area(f.v[0], f.v[1], f.v[2]) <= 2.0 * kDegenerateEpsilon * longest;
}

bool contains(const UvFootprint& f, const core::Vec2d& p, double eps) {
    // 边函数，按绕序归一化后三条都 >= -eps*|edge| 即在内
    const auto edge = [&](const core::Vec2d& a, const core::Vec2d& b) {
        const core::Vec2d e = b - a;
        const core::Vec2d d = p - a;
        return (e.x() * d.y() - e.y() * d.x());
    };
    const core::Vec2d a = f.v[0], b = f.v[1], c = f.v[2];
    const double orient = (b - a).x() * (c - a).y() - (b - a).y() * (c - a).x();
    const double sign = orient < 0.0 ? -1.0 : 1.0;
    return sign * edge(a, b) >= -eps * (b - a).norm() &&
           sign * edge(b, c) >= -eps * (c - b).norm() &&
           sign * edge(c, a) >= -eps * (a - c).norm();
}

template <typename Vec>
core::Result<Subdivision<Vec>> subdivide(const Footprint<Vec>& f) {
    if (is_degenerate(f)) {
        return core::make_error(core::ErrorCode::kInvalidFootprint,
                                "cannot subdivide degenerate triangle");
    }
    const Vec& v0 = f.v[0];
    const Vec& v1 = f.v[1];
    const Vec& v2 = f.v[2];
    const Vec m01 = midpoint(v0, v1);
    const Vec m12 = midpoint(v1, v2);
    const Vec m20 = midpoint(v2, v0);

    Subdivision<Vec> out;
    out[0].v = {v0, m01, m20};
    out[1].v = {v1, m12, m01};
    out[2].v = {v2, m20, m12};
    out[3].v = {m01, m12, m20};
    return out;
}

template <typename Vec>
core::Result<std::vector<LeafTriangle<Vec>>> flatten(
    const codec::SegmentationNode& tree, const Footprint<Vec>& f) {
    // 材质越界或过深的树不能展开
    auto valid = codec::validate(tree);
    if (!valid) return core::unexpected(valid.error());

    std::vector<LeafTriangle<Vec>> leaves;
    leaves.reserve(codec::leaf_count(tree));
    auto r = flatten_into(tree, f, leaves);
    if (!r) return core::unexpected(r.error());
    return leaves;
}

// 显式实例化：UV (2D) 与物体空间 (3D)
template double area(const Footprint<core::Vec2d>&);
template double area(const Footprint<core::Vec3d>&);
template bool is_degenerate(const Footprint<core::Vec2d>&);
template bool is_degenerate(const Footprint<core::Vec3d>&);
template core::Result<Subdivision<core::Vec2d>> subdivide(const Footprint<core::Vec2d>&);
template core::Result<Subdivision<core::Vec3d>> subdivide(const Footprint<core::Vec3d>&);
template core::Result<std::vector<LeafTriangle<core::Vec2d>>> flatten(
    const codec::SegmentationNode&, const Footprint<core::Vec2d>&);
template core::Result<std::vector<LeafTriangle<core::Vec3d>>> flatten(
    const codec::SegmentationNode&, const Footprint<core::Vec3d>&);

}  // namespace mms::geom
