#pragma once
/// @file pipeline.hpp
/// @brief MmsPipeline 内部实现：整网格的导入 / 导出 / 网格化

#if defined(_WIN32)
  #ifdef MMSPIPELINE_EXPORTS
    #define MMSPIPELINE_API __declspec(dllexport)
  #else
    #define MMSPIPELINE_API __declspec(dllimport)
  #endif
#else
  #define MMSPIPELINE_API __attribute__((visibility("default")))
#endif

#include "MmsCore.hpp"
#include "MmsCodec.hpp"
#include "MmsGeometry.hpp"
#include "MmsPaint.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mms::pipeline {

// ============================================================================
// 流水线配置
// ============================================================================
struct PipelineConfig {
    paint::RenderParams  render;
    paint::ExtractParams extract;
    int threads = 0;  // <= 0 使用 OpenMP 默认线程数
};

/// 每个三角形的分割属性，nullopt 表示属性缺失（等价于 Leaf(0)）
using Attribute = std::optional<std::string>;

// ============================================================================
// 诊断信息
// ============================================================================
enum class DiagnosticKind : uint8_t {
    kMalformedSegmentation,    // 属性无法解码，已按 Leaf(0) 处理
    kExtractionPrecisionLoss,  // 到达 max_depth，部分叶子按多数票生成
    kInvalidFootprint,         // UV 三角形退化，已跳过
};

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::kMalformedSegmentation;
    size_t         triangle = 0;
    std::string    message;
};

// ============================================================================
// 流水线结果
// ============================================================================
struct RenderReport {
    size_t triangles = 0;
    size_t painted = 0;      // 非 Leaf(0) 的三角形
    size_t malformed = 0;
    size_t degenerate = 0;
    size_t leaves = 0;       // 栅格化的叶子总数
    size_t gap_pixels = 0;
    std::vector<Diagnostic> diagnostics;
};

struct ExtractReport {
    std::vector<Attribute> attributes;  // 与三角形一一对应
    size_t painted = 0;
    size_t lossy_triangles = 0;
    size_t degenerate = 0;
    size_t nodes_visited = 0;
    std::vector<Diagnostic> diagnostics;
};

// ============================================================================
// 流水线函数
// ============================================================================

/// @brief 把所有三角形的分割属性渲染到纹理
/// 单个三角形的解码失败不会中断整体，以诊断信息返回
/// @param attributes 与三角形一一对应
[[nodiscard]] MMSPIPELINE_API core::Result<RenderReport> render_segmentation(
    const geom::TriangleMesh& mesh,
    const std::vector<Attribute>& attributes,
    paint::Raster& raster,
    const paint::Palette& palette,
    const PipelineConfig& config = {});

/// @brief 从纹理为每个三角形提取分割属性
[[nodiscard]] MMSPIPELINE_API core::Result<ExtractReport> extract_segmentation(
    const geom::TriangleMesh& mesh,
    const paint::Raster& raster,
    const paint::Palette& palette,
    const PipelineConfig& config = {});

/// @brief 按分割属性细分网格，每个子三角形带材质与来源三角形索引
/// 无法解码的属性按 Leaf(0) 处理并记录警告
[[nodiscard]] MMSPIPELINE_API core::Result<geom::SegmentedMesh> segment_mesh(
    const geom::TriangleMesh& mesh,
    const std::vector<Attribute>& attributes);

}  // namespace mms::pipeline
