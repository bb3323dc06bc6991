#pragma once
/// @file MmsGeometry.hpp
/// @brief MmsGeometry 公开接口

#include "footprint.hpp"
#include "mesh.hpp"

// 对外暴露：
// - Footprint<Vec> (UvFootprint, ObjectFootprint), subdivide(), flatten(), area()
// - TriangleMesh, SegmentedMesh, mesh_tree()
