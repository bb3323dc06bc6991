#pragma once
/// @file mesh.hpp
/// @brief 三角网格与分割树网格化

#include "footprint.hpp"
#include <cstdint>
#include <vector>

namespace mms::geom {

// ============================================================================
// 网格数据结构
// ============================================================================
struct TriangleMesh {
    std::vector<core::Vec3d> vertices;
    std::vector<uint32_t>    indices;  // 三角形索引，每 3 个一组
    std::vector<core::Vec2d> uvs;      // 每个角点的 UV，与 indices 一一对应（可为空）

    [[nodiscard]] size_t triangle_count() const noexcept { return indices.size() / 3; }
    [[nodiscard]] bool has_uvs() const noexcept { return !uvs.empty() && uvs.size() == indices.size(); }

    [[nodiscard]] ObjectFootprint object_footprint(size_t triangle) const {
        return {{vertices[indices[3 * triangle]],
                 vertices[indices[3 * triangle + 1]],
                 vertices[indices[3 * triangle + 2]]}};
    }

    [[nodiscard]] UvFootprint uv_footprint(size_t triangle) const {
        return {{uvs[3 * triangle], uvs[3 * triangle + 1], uvs[3 * triangle + 2]}};
    }
};

/// @brief 检查索引范围与 UV 数量
[[nodiscard]] MMSGEOMETRY_API core::Result<void> validate(const TriangleMesh& mesh, bool require_uvs);

// ============================================================================
// 分割树网格化
// ============================================================================
struct SubTriangle {
    std::array<uint32_t, 3> v{};
    uint8_t  material = codec::kBaseMaterial;
    uint32_t source_triangle = 0;
};

struct SegmentedMesh {
    std::vector<core::Vec3d>  vertices;
    std::vector<SubTriangle>  triangles;
};

/// @brief 按分割树细分一个物体空间三角形
/// 顶点 0..2 为原角点，边中点在相邻子三角形间共享
/// @param source_triangle 写入每个子三角形的来源索引
[[nodiscard]] MMSGEOMETRY_API core::Result<SegmentedMesh> mesh_tree(
    const ObjectFootprint& footprint,
    const codec::SegmentationNode& tree,
    uint32_t source_triangle = 0);

/// @brief 将 part 追加到 mesh（重映射顶点索引）
MMSGEOMETRY_API void append(SegmentedMesh& mesh, const SegmentedMesh& part);

}  // namespace mms::geom
