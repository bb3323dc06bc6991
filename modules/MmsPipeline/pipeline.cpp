/// @file pipeline.cpp
#include "pipeline.hpp"
#include "macro.hpp"
#include <cstdint>

namespace mms::pipeline {

namespace {

[[nodiscard]] core::Result<void> check_attributes(const geom::TriangleMesh& mesh,
                                                  const std::vector<Attribute>& attributes) {
    if (attributes.size() != mesh.triangle_count()) {
        return core::make_error(core::ErrorCode::kInvalidArgument,
                                fmt::format("{} attributes for {} triangles",
                                            attributes.size(), mesh.triangle_count()));
    }
    return {};
}

[[nodiscard]] std::optional<std::string_view> view(const Attribute& attribute) {
    if (!attribute) return std::nullopt;
    return std::string_view(*attribute);
}

void apply_threads(const PipelineConfig& config) {
    if (config.threads > 0) MMS_OMP_SET_NUM_THREADS(config.threads);
}

/// 单个三角形的解码 + 展开结果
struct TriangleLeaves {
    std::vector<geom::UvLeaf>  leaves;
    std::optional<Diagnostic>  diagnostic;
    bool painted = false;
    bool degenerate = false;
};

}  // namespace

// ============================================================================
// 导入：属性 -> 纹理
// ============================================================================

core::Result<RenderReport> render_segmentation(const geom::TriangleMesh& mesh,
                                               const std::vector<Attribute>& attributes,
                                               paint::Raster& raster, const paint::Palette& palette,
                                               const PipelineConfig& config) {
    if (auto r = geom::validate(mesh, true); !r) return core::unexpected(r.error());
    if (auto r = check_attributes(mesh, attributes); !r) return core::unexpected(r.error());
    if (raster.empty()) {
        return core::make_error(core::ErrorCode::kInvalidArgument, "cannot paint into an empty raster");
    }

    const auto n = static_cast<int64_t>(mesh.triangle_count());
    std::vector<TriangleLeaves> per_triangle(static_cast<size_t>(n));
    apply_threads(config);

    MMS_OMP_PARALLEL_FOR_DYNAMIC
    for (int64_t i = 0; i < n; ++i) {
        const auto t = static_cast<size_t>(i);
        TriangleLeaves& out = per_triangle[t];
        const geom::UvFootprint uv = mesh.uv_footprint(t);

        if (geom::is_degenerate(uv)) {
            out.degenerate = true;
            out.diagnostic = Diagnostic{DiagnosticKind::kInvalidFootprint, t, "degenerate UV triangle"};
            continue;
        }

        auto tree = codec::decode_attribute(view(attributes[t]));
        if (!tree) {
            out.diagnostic = Diagnostic{DiagnosticKind::kMalformedSegmentation, t, tree.error().message};
            tree = codec::make_leaf();
        }
        out.painted = !codec::is_unpainted(*tree);

        auto leaves = geom::flatten(*tree, uv);
        if (!leaves) {
            out.degenerate = true;
            out.diagnostic = Diagnostic{DiagnosticKind::kInvalidFootprint, t, leaves.error().message};
            continue;
        }
        out.leaves = std::move(*leaves);
    }

    RenderReport report;
    report.triangles = static_cast<size_t>(n);
    std::vector<geom::UvLeaf> leaves;
    std::vector<geom::UvFootprint> roots;
    for (size_t t = 0; t < per_triangle.size(); ++t) {
        TriangleLeaves& tri = per_triangle[t];
        if (tri.diagnostic) {
            if (tri.diagnostic->kind == DiagnosticKind::kMalformedSegmentation) ++report.malformed;
            MMS_DEBUG("triangle {}: {} ({})", t, core::enum_name(tri.diagnostic->kind), tri.diagnostic->message);
            report.diagnostics.push_back(std::move(*tri.diagnostic));
        }
        if (tri.degenerate) {
            ++report.degenerate;
            continue;
        }
        if (tri.painted) ++report.painted;
        roots.push_back(mesh.uv_footprint(t));
        leaves.insert(leaves.end(), tri.leaves.begin(), tri.leaves.end());
    }
    report.leaves = leaves.size();

    paint::TreeRenderer renderer(raster, palette, config.render);
    renderer.fill_leaves(leaves, roots);
    if (config.render.close_gaps) report.gap_pixels = renderer.close_gaps();

    MMS_INFO("render: {} triangles, {} painted, {} leaves, {} gap pixels filled",
             report.triangles, report.painted, report.leaves, report.gap_pixels);
    if (report.malformed > 0 || report.degenerate > 0) {
        MMS_WARN("render: {} malformed attributes, {} degenerate triangles",
                 report.malformed, report.degenerate);
    }
    return report;
}

// ============================================================================
// 导出：纹理 -> 属性
// ============================================================================

core::Result<ExtractReport> extract_segmentation(const geom::TriangleMesh& mesh,
                                                 const paint::Raster& raster,
                                                 const paint::Palette& palette,
                                                 const PipelineConfig& config) {
    if (auto r = geom::validate(mesh, true); !r) return core::unexpected(r.error());
    auto extractor = paint::TreeExtractor::create(raster, palette, config.extract);
    if (!extractor) return core::unexpected(extractor.error());

    const auto n = static_cast<int64_t>(mesh.triangle_count());
    std::vector<Attribute> attributes(static_cast<size_t>(n));
    std::vector<paint::ExtractStats> stats(static_cast<size_t>(n));
    std::vector<std::optional<core::Error>> errors(static_cast<size_t>(n));
    apply_threads(config);

    MMS_OMP_PARALLEL_FOR_DYNAMIC
    for (int64_t i = 0; i < n; ++i) {
        const auto t = static_cast<size_t>(i);
        auto tree = extractor->extract(mesh.uv_footprint(t), &stats[t]);
        if (!tree) {
            errors[t] = tree.error();
            continue;
        }
        auto attribute = codec::encode_attribute(*tree, config.extract.max_depth);
        if (!attribute) {
            errors[t] = attribute.error();
            continue;
        }
        attributes[t] = std::move(*attribute);
    }

    ExtractReport report;
    for (size_t t = 0; t < attributes.size(); ++t) {
        report.nodes_visited += stats[t].nodes_visited;
        if (errors[t]) {
            ++report.degenerate;
            report.diagnostics.push_back({DiagnosticKind::kInvalidFootprint, t, errors[t]->message});
            continue;
        }
        if (attributes[t]) ++report.painted;
        if (stats[t].precision_loss()) {
            ++report.lossy_triangles;
            report.diagnostics.push_back(
                {DiagnosticKind::kExtractionPrecisionLoss, t,
                 fmt::format("{} leaves resolved by majority vote at depth {}",
                             stats[t].lossy_leaves, config.extract.max_depth)});
        }
    }
    report.attributes = std::move(attributes);

    MMS_INFO("extract: {} triangles, {} painted, {} nodes visited",
             report.attributes.size(), report.painted, report.nodes_visited);
    if (report.lossy_triangles > 0) {
        MMS_WARN("extract: {} triangles lost detail at max depth {}",
                 report.lossy_triangles, config.extract.max_depth);
    }
    if (report.degenerate > 0) {
        MMS_WARN("extract: {} degenerate UV triangles skipped", report.degenerate);
    }
    return report;
}

// ============================================================================
// 网格化
// ============================================================================

core::Result<geom::SegmentedMesh> segment_mesh(const geom::TriangleMesh& mesh,
                                               const std::vector<Attribute>& attributes) {
    if (auto r = geom::validate(mesh, false); !r) return core::unexpected(r.error());
    if (auto r = check_attributes(mesh, attributes); !r) return core::unexpected(r.error());

    geom::SegmentedMesh out;
    size_t fallbacks = 0;
    for (size_t t = 0; t < mesh.triangle_count(); ++t) {
        const auto source = static_cast<uint32_t>(t);
        const geom::ObjectFootprint footprint = mesh.object_footprint(t);

        auto tree = codec::decode_attribute(view(attributes[t]));
        if (!tree) {
            MMS_WARN("triangle {}: {}", t, tree.error().message);
            tree = codec::make_leaf();
            ++fallbacks;
        }
        auto part = geom::mesh_tree(footprint, *tree, source);
        if (!part) {
            MMS_WARN("triangle {}: {}", t, part.error().message);
            part = geom::mesh_tree(footprint, codec::make_leaf(), source);
            ++fallbacks;
            if (!part) return core::unexpected(part.error());
        }
        geom::append(out, *part);
    }

    MMS_INFO("segment: {} triangles -> {} sub-triangles, {} vertices",
             mesh.triangle_count(), out.triangles.size(), out.vertices.size());
    if (fallbacks > 0) MMS_WARN("segment: {} triangles kept unsegmented", fallbacks);
    return out;
}

}  // namespace mms::pipeline
