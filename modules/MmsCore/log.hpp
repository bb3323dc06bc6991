#pragma once
/// @file log.hpp
/// @brief MMSeg 日志系统 (基于 spdlog)

#include "core.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <optional>

namespace mms::core {

// ============================================================================
// 日志级别
// ============================================================================
enum class LogLevel : uint8_t {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarn,
    kError,
    kCritical,
    kOff,
};

// ============================================================================
// 日志类
// ============================================================================
class MMSCORE_API Log {
public:
    /// @brief 初始化日志系统
    /// @param name 日志器名称
    /// @param level 日志级别
    /// @param pattern 日志格式 (spdlog pattern)
    static void init(
        std::string_view name = "MMSeg",
        LogLevel level = LogLevel::kInfo,
        std::string_view pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    /// @brief 设置日志级别
    static void set_level(LogLevel level);

    /// @brief 获取日志级别
    [[nodiscard]] static LogLevel level();

    /// @brief 解析级别名 ("trace", "Debug", "WARN" ...)，大小写不敏感
    [[nodiscard]] static std::optional<LogLevel> parse_level(std::string_view name);

    /// @brief 追加 / 移除输出端 (例如文件或测试用的内存 sink)
    static void add_sink(spdlog::sink_ptr sink);
    static void remove_sink(const spdlog::sink_ptr& sink);

    /// @brief 获取 spdlog logger (高级用法)
    [[nodiscard]] static std::shared_ptr<spdlog::logger>& logger();

    // 便捷日志函数
    template <typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->trace(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->debug(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->info(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->warn(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->error(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// 便捷宏
// ============================================================================
#define MMS_TRACE(...)    ::mms::core::Log::trace(__VA_ARGS__)
#define MMS_DEBUG(...)    ::mms::core::Log::debug(__VA_ARGS__)
#define MMS_INFO(...)     ::mms::core::Log::info(__VA_ARGS__)
#define MMS_WARN(...)     ::mms::core::Log::warn(__VA_ARGS__)
#define MMS_ERROR(...)    ::mms::core::Log::error(__VA_ARGS__)
#define MMS_CRITICAL(...) ::mms::core::Log::critical(__VA_ARGS__)

}  // namespace mms::core
