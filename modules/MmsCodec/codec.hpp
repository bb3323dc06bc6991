#pragma once
/// @file codec.hpp
/// @brief 分割树 <-> 十六进制串 编解码
///
/// 每个 nibble = typeBits(2) | valueBits(2)：
///   00 未涂色叶子 / 01 涂色叶子 / 10 分裂 / 11 保留
/// 先序深度优先：分裂 nibble 之后依次是 child0..child3 的完整序列化，
/// 无长度前缀、无终止符。

#include "segmentation.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace mms::codec {

// ============================================================================
// Nibble 布局
// ============================================================================
enum class NibbleType : uint8_t {
    kLeafUnpainted = 0b00,
    kLeafPainted   = 0b01,
    kSplit         = 0b10,
    kReserved      = 0b11,
};

[[nodiscard]] constexpr uint8_t make_nibble(NibbleType type, uint8_t value) noexcept {
    return static_cast<uint8_t>((static_cast<uint8_t>(type) << 2) | (value & 0b11));
}

[[nodiscard]] constexpr NibbleType nibble_type(uint8_t nibble) noexcept {
    return static_cast<NibbleType>((nibble >> 2) & 0b11);
}

[[nodiscard]] constexpr uint8_t nibble_value(uint8_t nibble) noexcept {
    return nibble & 0b11;
}

// ============================================================================
// 编解码
// ============================================================================

/// @brief 解码十六进制分割串
/// @param hex 分割串（大小写均可）
/// @param max_depth 最大允许深度，超出即失败
/// @return 分割树，或 kMalformedSegmentation（不会返回部分结果）
[[nodiscard]] MMSCODEC_API core::Result<SegmentationNode> decode(
    std::string_view hex, uint32_t max_depth = kMaxDepth);

/// @brief 编码分割树（大写十六进制）
/// @return 十六进制串，树结构非法时返回 kInvalidArgument
[[nodiscard]] MMSCODEC_API core::Result<std::string> encode(
    const SegmentationNode& node, uint32_t max_depth = kMaxDepth);

// ============================================================================
// 三角形属性
// ============================================================================

/// @brief 解码三角形属性，属性缺失等价于 Leaf(0)
[[nodiscard]] MMSCODEC_API core::Result<SegmentationNode> decode_attribute(
    std::optional<std::string_view> attribute, uint32_t max_depth = kMaxDepth);

/// @brief 编码三角形属性，Leaf(0) 返回 nullopt（不写属性）
[[nodiscard]] MMSCODEC_API core::Result<std::optional<std::string>> encode_attribute(
    const SegmentationNode& node, uint32_t max_depth = kMaxDepth);

}  // namespace mms::codec
