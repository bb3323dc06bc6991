#pragma once
/// @file MmsPipeline.hpp
/// @brief MmsPipeline 公开接口

#include "pipeline.hpp"

// 对外暴露：
// - PipelineConfig, Diagnostic, DiagnosticKind
// - render_segmentation(), extract_segmentation(), segment_mesh()
