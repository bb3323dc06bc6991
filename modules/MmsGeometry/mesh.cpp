/// @file mesh.cpp
#include "mesh.hpp"
#include <algorithm>
#include <unordered_map>

namespace mms::geom {

namespace {

struct EdgeKey {
    uint32_t a, b;
    bool operator==(const EdgeKey& o) const { return a == o.a && b == o.b; }
};

struct EdgeKeyHash {
    size_t operator()(const EdgeKey& k) const {
        size_t h = 14695981039346656037ULL;
        h ^= static_cast<size_t>(k.a); h *= 1099511628211ULL;
        h ^= static_cast<size_t>(k.b); h *= 1099511628211ULL;
        return h;
    }
};

class TreeMesher {
public:
    TreeMesher(const ObjectFootprint& f, uint32_t source) : source_(source) {
        mesh_.vertices.assign(f.v.begin(), f.v.end());
    }

    void run(const codec::SegmentationNode& node, uint32_t i0, uint32_t i1, uint32_t i2) {
        if (node.is_leaf()) {
            mesh_.triangles.push_back({{i0, i1, i2}, node.material, source_});
            return;
        }
        const uint32_t m01 = midpoint(i0, i1);
        const uint32_t m12 = midpoint(i1, i2);
        const uint32_t m20 = midpoint(i2, i0);
        run(node.children[0], i0, m01, m20);
        run(node.children[1], i1, m12, m01);
        run(node.children[2], i2, m20, m12);
        run(node.children[3], m01, m12, m20);
    }

    [[nodiscard]] SegmentedMesh take() { return std::move(mesh_); }

private:
    uint32_t midpoint(uint32_t a, uint32_t b) {
        const EdgeKey key{std::min(a, b), std::max(a, b)};
        auto it = midpoints_.find(key);
        if (it != midpoints_.end()) return it->second;
        const auto idx = static_cast<uint32_t>(mesh_.vertices.size());
        mesh_.vertices.push_back((mesh_.vertices[a] + mesh_.vertices[b]) * 0.5);
        midpoints_.emplace(key, idx);
        return idx;
    }

    SegmentedMesh mesh_;
    std::unordered_map<EdgeKey, uint32_t, EdgeKeyHash> midpoints_;
    uint32_t source_ = 0;
};

}  // namespace

core::Result<void> validate(const TriangleMesh& mesh, bool require_uvs) {
    if (mesh.indices.size() % 3 != 0) {
        return core::make_error(core::ErrorCode::kInvalidArgument,
                                "index count is not a multiple of 3");
    }
    for (uint32_t idx : mesh.indices) {
        if (idx >= mesh.vertices.size()) {
            return core::make_error(core::ErrorCode::kInvalidArgument,
                                    fmt::format("vertex index {} out of range ({} vertices)",
                                                idx, mesh.vertices.size()));
        }
    }
    if (require_uvs && !mesh.has_uvs()) {
        return core::make_error(core::ErrorCode::kInvalidArgument,
                                fmt::format("mesh has {} uvs, expected one per corner ({})",
                                            mesh.uvs.size(), mesh.indices.size()));
    }
    return {};
}

core::Result<SegmentedMesh> mesh_tree(
    const ObjectFootprint& footprint, const codec::SegmentationNode& tree, uint32_t source_triangle) {
    auto valid = codec::validate(tree);
    if (!valid) return core::unexpected(valid.error());
    if (!tree.is_leaf() && is_degenerate(footprint)) {
        return core::make_error(core::ErrorCode::kInvalidFootprint,
                                "cannot subdivide degenerate triangle");
    }

    TreeMesher mesher(footprint, source_triangle);
    mesher.run(tree, 0, 1, 2);
    return mesher.take();
}

void append(SegmentedMesh& mesh, const SegmentedMesh& part) {
    const auto base = static_cast<uint32_t>(mesh.vertices.size());
    mesh.vertices.insert(mesh.vertices.end(), part.vertices.begin(), part.vertices.end());
    mesh.triangles.reserve(mesh.triangles.size() + part.triangles.size());
    for (const auto& t : part.triangles) {
        SubTriangle shifted = t;
        for (auto& i : shifted.v) i += base;
        mesh.triangles.push_back(shifted);
    }
}

}  // namespace mms::geom
