#pragma once
/// @file MmsCore.hpp
/// @brief MmsCore 公开接口

#include "core.hpp"
#include "log.hpp"
#include "enum_utils.hpp"

// 对外暴露：
// - 基础类型别名 (Vec2d, Vec3d, ...)
// - 错误处理 (Error, ErrorCode, Result<T>, make_error)
// - 日志系统 (Log, MMS_INFO, ...)
// - 枚举工具 (enum_name, enum_cast, ...)
// - version()
