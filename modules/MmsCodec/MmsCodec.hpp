#pragma once
/// @file MmsCodec.hpp
/// @brief MmsCodec 公开接口

#include "segmentation.hpp"
#include "codec.hpp"

// 对外暴露：
// - SegmentationNode, make_leaf(), make_split(), simplify(), validate()
// - decode(), encode(), decode_attribute(), encode_attribute()
