#pragma once
/// @file MmsPaint.hpp
/// @brief MmsPaint 公开接口

#include "raster.hpp"
#include "state_map.hpp"
#include "renderer.hpp"
#include "extractor.hpp"

// 对外暴露：
// - Raster, Palette, Color, parse_hex_color()
// - build_state_map()
// - TreeRenderer, paint() (分割树 -> 纹理)
// - TreeExtractor, extract() (纹理 -> 分割树)
