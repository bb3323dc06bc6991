/// @file codec.cpp
#include "codec.hpp"
#include <vector>

namespace mms::codec {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

[[nodiscard]] core::Unexpected<core::Error> malformed(std::string msg) {
    return core::make_error(core::ErrorCode::kMalformedSegmentation, std::move(msg));
}

[[nodiscard]] int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// 待填充子节点的分裂帧
struct Frame {
    SegmentationNode node;
    uint32_t level = 0;
};

void encode_node(const SegmentationNode& node, std::string& out) {
    if (node.is_leaf()) {
        out.push_back(kHexDigits[make_nibble(NibbleType::kLeafUnpainted, node.material)]);
        return;
    }
    out.push_back(kHexDigits[make_nibble(NibbleType::kSplit, 0)]);
    for (const auto& c : node.children) encode_node(c, out);
}

}  // namespace

core::Result<SegmentationNode> decode(std::string_view hex, uint32_t max_depth) {
    if (hex.empty()) return malformed("empty segmentation string");

    std::vector<Frame> stack;
    stack.reserve(max_depth + 1);
    std::optional<SegmentationNode> root;

    for (size_t pos = 0; pos < hex.size(); ++pos) {
        if (root) {
            return malformed(fmt::format("{} trailing nibbles after complete tree at position {}",
                                         hex.size() - pos, pos));
        }

        const int nibble = hex_value(hex[pos]);
        if (nibble < 0) {
            return malformed(fmt::format("invalid hex character '{}' at position {}", hex[pos], pos));
        }
        const auto n = static_cast<uint8_t>(nibble);
        const uint32_t level = stack.empty() ? 0 : stack.back().level + 1;

        SegmentationNode node;
        switch (nibble_type(n)) {
            case NibbleType::kLeafUnpainted:
                node = make_leaf(nibble_value(n));
                break;
            case NibbleType::kLeafPainted:
                if (nibble_value(n) == kBaseMaterial) {
                    return malformed(fmt::format(
                        "painted leaf with base material at position {}", pos));
                }
                node = make_leaf(nibble_value(n));
                break;
            case NibbleType::kSplit:
                if (nibble_value(n) != 0) {
                    return malformed(fmt::format(
                        "split nibble '{}' with non-zero value bits at position {}", hex[pos], pos));
                }
                if (level >= max_depth) {
                    return malformed(fmt::format(
                        "segmentation exceeds maximum depth {} at position {}", max_depth, pos));
                }
                node.kind = NodeKind::kSplit;
                node.children.reserve(kChildCount);
                stack.push_back(Frame{std::move(node), level});
                continue;
            case NibbleType::kReserved:
            default:
                return malformed(fmt::format("reserved nibble '{}' at position {}", hex[pos], pos));
        }

        // 叶子完成：逐层挂到最近的待填充帧，填满的帧继续上移
        while (true) {
            if (stack.empty()) {
                root = std::move(node);
                break;
            }
            auto& parent = stack.back().node;
            parent.children.push_back(std::move(node));
            if (parent.children.size() < kChildCount) break;
            node = std::move(parent);
            stack.pop_back();
        }
    }

    if (!root) {
        return malformed(fmt::format("segmentation string truncated: {} split(s) still pending after {} nibbles",
                                     stack.size(), hex.size()));
    }
    return std::move(*root);
}

core::Result<std::string> encode(const SegmentationNode& node, uint32_t max_depth) {
    auto valid = validate(node, max_depth);
    if (!valid) return core::unexpected(valid.error());

    std::string out;
    out.reserve(node_count(node));
    encode_node(node, out);
    return out;
}

core::Result<SegmentationNode> decode_attribute(
    std::optional<std::string_view> attribute, uint32_t max_depth) {
    if (!attribute) return make_leaf(kBaseMaterial);
    return decode(*attribute, max_depth);
}

core::Result<std::optional<std::string>> encode_attribute(
    const SegmentationNode& node, uint32_t max_depth) {
    if (is_unpainted(node)) return std::optional<std::string>{};
    auto hex = encode(node, max_depth);
    if (!hex) return core::unexpected(hex.error());
    return std::optional<std::string>{std::move(*hex)};
}

}  // namespace mms::codec
