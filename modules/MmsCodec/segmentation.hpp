#pragma once
/// @file segmentation.hpp
/// @brief 分割树数据结构 (每个三角形一棵 4 叉细分树)

#if defined(_WIN32)
  #ifdef MMSCODEC_EXPORTS
    #define MMSCODEC_API __declspec(dllexport)
  #else
    #define MMSCODEC_API __declspec(dllimport)
  #endif
#else
  #define MMSCODEC_API __attribute__((visibility("default")))
#endif

#include "MmsCore.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace mms::codec {

// ============================================================================
// 常量
// ============================================================================
constexpr uint32_t kMaxDepth = 8;        // 根节点深度为 0
constexpr uint8_t  kMaterialCount = 4;   // 材质索引 [0, 3]
constexpr uint8_t  kBaseMaterial = 0;    // 未涂色 / 基础材质
constexpr size_t   kChildCount = 4;

enum class NodeKind : uint8_t {
    kLeaf = 0,
    kSplit,
};

/// 子三角形顺序，与几何细分顺序一致
enum class ChildSlot : uint8_t {
    kCorner0 = 0,
    kCorner1,
    kCorner2,
    kCenter,
};

// ============================================================================
// 分割树节点
// ============================================================================
/// 叶子：material 有效，children 为空
/// 分裂：children 恰好 4 个，顺序 [corner0, corner1, corner2, center]
struct SegmentationNode {
    NodeKind kind = NodeKind::kLeaf;
    uint8_t  material = kBaseMaterial;
    std::vector<SegmentationNode> children;

    [[nodiscard]] bool is_leaf() const noexcept { return kind == NodeKind::kLeaf; }
    [[nodiscard]] bool is_split() const noexcept { return kind == NodeKind::kSplit; }

    [[nodiscard]] const SegmentationNode& child(ChildSlot slot) const {
        return children[static_cast<size_t>(slot)];
    }
};

[[nodiscard]] MMSCODEC_API bool operator==(const SegmentationNode& a, const SegmentationNode& b) noexcept;
[[nodiscard]] inline bool operator!=(const SegmentationNode& a, const SegmentationNode& b) noexcept {
    return !(a == b);
}

// ============================================================================
// 构造
// ============================================================================
[[nodiscard]] MMSCODEC_API SegmentationNode make_leaf(uint8_t material = kBaseMaterial);
[[nodiscard]] MMSCODEC_API SegmentationNode make_split(std::array<SegmentationNode, kChildCount> children);

// ============================================================================
// 查询
// ============================================================================

/// @brief 树深度（单叶子为 0）
[[nodiscard]] MMSCODEC_API uint32_t depth(const SegmentationNode& node) noexcept;

[[nodiscard]] MMSCODEC_API size_t leaf_count(const SegmentationNode& node) noexcept;
[[nodiscard]] MMSCODEC_API size_t node_count(const SegmentationNode& node) noexcept;

/// @brief 检查结构不变量：材质范围、子节点个数、深度上限
[[nodiscard]] MMSCODEC_API core::Result<void> validate(
    const SegmentationNode& node, uint32_t max_depth = kMaxDepth);

/// @brief 是否为单个未涂色叶子（等价于属性缺失）
[[nodiscard]] inline bool is_unpainted(const SegmentationNode& node) noexcept {
    return node.is_leaf() && node.material == kBaseMaterial;
}

// ============================================================================
// 变换
// ============================================================================

/// @brief 合并四个子节点为同材质叶子的分裂节点（自底向上）
[[nodiscard]] MMSCODEC_API SegmentationNode simplify(SegmentationNode node);

/// @brief 调试输出，例如 "Split[L0, L1, Split[...], L3]"
[[nodiscard]] MMSCODEC_API std::string to_string(const SegmentationNode& node);

}  // namespace mms::codec
