/// @file segmentation.cpp
#include "segmentation.hpp"
#include <algorithm>

namespace mms::codec {

bool operator==(const SegmentationNode& a, const SegmentationNode& b) noexcept {
    if (a.kind != b.kind) return false;
    if (a.is_leaf()) return a.material == b.material;
    return a.children == b.children;
}

SegmentationNode make_leaf(uint8_t material) {
    SegmentationNode node;
    node.kind = NodeKind::kLeaf;
    node.material = material;
    return node;
}

SegmentationNode make_split(std::array<SegmentationNode, kChildCount> children) {
    SegmentationNode node;
    node.kind = NodeKind::kSplit;
    node.material = kBaseMaterial;
    node.children.reserve(kChildCount);
    for (auto& c : children) node.children.push_back(std::move(c));
    return node;
}

uint32_t depth(const SegmentationNode& node) noexcept {
    if (node.is_leaf()) return 0;
    uint32_t d = 0;
    for (const auto& c : node.children) d = std::max(d, depth(c));
    return d + 1;
}

size_t leaf_count(const SegmentationNode& node) noexcept {
    if (node.is_leaf()) return 1;
    size_t n = 0;
    for (const auto& c : node.children) n += leaf_count(c);
    return n;
}

size_t node_count(const SegmentationNode& node) noexcept {
    size_t n = 1;
    for (const auto& c : node.children) n += node_count(c);
    return n;
}

namespace {

core::Result<void> validate_at(const SegmentationNode& node, uint32_t level, uint32_t max_depth) {
    if (level > max_depth) {
        return core::make_error(core::ErrorCode::kInvalidArgument,
                                fmt::format("tree exceeds maximum depth {}", max_depth));
    }
    if (node.is_leaf()) {
        if (node.material >= kMaterialCount) {
            return core::make_error(core::ErrorCode::kInvalidArgument,
                                    fmt::format("leaf material {} out of range [0, {}]",
                                                node.material, kMaterialCount - 1));
        }
        if (!node.children.empty()) {
            return core::make_error(core::ErrorCode::kInvalidArgument, "leaf node has children");
        }
        return {};
    }
    if (node.children.size() != kChildCount) {
        return core::make_error(core::ErrorCode::kInvalidArgument,
                                fmt::format("split node has {} children, expected {}",
                                            node.children.size(), kChildCount));
    }
    for (const auto& c : node.children) {
        auto r = validate_at(c, level + 1, max_depth);
        if (!r) return r;
    }
    return {};
}

void append_string(const SegmentationNode& node, std::string& out) {
    if (node.is_leaf()) {
        out += 'L';
        out += std::to_string(node.material);
        return;
    }
    out += "Split[";
    for (size_t i = 0; i < node.children.size(); ++i) {
        if (i > 0) out += ", ";
        append_string(node.children[i], out);
    }
    out += ']';
}

}  // namespace

core::Result<void> validate(const SegmentationNode& node, uint32_t max_depth) {
    return validate_at(node, 0, max_depth);
}

SegmentationNode simplify(SegmentationNode node) {
    if (node.is_leaf()) return node;
    for (auto& c : node.children) c = simplify(std::move(c));

    const bool uniform = std::all_of(node.children.begin(), node.children.end(),
        [&](const SegmentationNode& c) {
            return c.is_leaf() && c.material == node.children.front().material;
        });
    if (uniform && !node.children.empty()) {
        return make_leaf(node.children.front().material);
    }
    return node;
}

std::string to_string(const SegmentationNode& node) {
    std::string out;
    append_string(node, out);
    return out;
}

}  // namespace mms::codec
