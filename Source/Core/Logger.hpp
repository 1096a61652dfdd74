#pragma once

// =============================
// Chronos - Logger.hpp (C++23, header-only)
// =============================
// Goals
//  - Always-safe to include (no heavy deps, header-only)
//  - C++23 std::format backend, std::print for the default console sink
//  - Zero/low overhead when disabled (compile-time switches)
//  - Runtime min-level filter and optional category filter
//  - Optional user sink (function pointer + userData) so hosts and tests can
//    capture lines instead of printing them
//
// Non-goals (for now)
//  - Async logging, ring buffers, files, colors, structured logs
//
// Notes
//  - Categories are plain string literals (const char*). Keep them short (e.g., "Timer", "Driver").
//  - The sink receives a fully formatted message without the level/category prefix.

#include <cstdint>
#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <print>        // C++23 std::print / std::println
#include <format>       // std::format_string, std::vformat
#include <cstdio>       // std::FILE, stdout/stderr
#include <exception>    // std::exception

#ifndef CHR_ENABLE_LOGGING
#  define CHR_ENABLE_LOGGING 1
#endif
#ifndef CHR_ENABLE_LOG_ASSERT
#  define CHR_ENABLE_LOG_ASSERT 1
#endif

namespace chr::core {

    enum class LogLevel : std::uint8_t {
        Disabled = 0,
        Fatal = 1,
        Error = 2,
        Warn = 3,
        Info = 4,
        Verbose = 5,
        // NOTE: higher number == more chatty
        // MinLevel policy: a message is emitted if (level <= MinLevel).
    };

    struct LogSink {
        using WriteFunc = void(*)(void* userData, LogLevel level, const char* category, std::string_view message) noexcept;

        WriteFunc write    = nullptr;
        void*     userData = nullptr;

        [[nodiscard]] constexpr bool IsBound() const noexcept { return write != nullptr; }
    };

    struct LoggerConfig {
        std::atomic<LogLevel> MinLevel{ LogLevel::Info };
        // If non-null, only messages whose category equals this filter are emitted.
        // Must stay a stable C-string literal (e.g., "Timer").
        std::atomic<const char*> CategoryEqualsFilter{ nullptr };
    };

    class Logger final {
    public:
        static Logger& Get() noexcept {
            static Logger g;
            return g;
        }

        static void SetMinLevel(LogLevel lvl) noexcept { Get().mCfg.MinLevel.store(lvl, std::memory_order_relaxed); }
        static LogLevel GetMinLevel() noexcept { return Get().mCfg.MinLevel.load(std::memory_order_relaxed); }
        static void SetCategoryEqualsFilter(const char* cat) noexcept {
            Get().mCfg.CategoryEqualsFilter.store(cat, std::memory_order_relaxed);
        }

        // Replaces the console sink. Pass LogSink{} to restore console output.
        static void SetSink(LogSink sink) noexcept {
            Logger& self = Get();
            std::scoped_lock lock(self.mMutex);
            self.mSink = sink;
        }

        static bool IsEnabled(LogLevel lvl, const char* category) noexcept {
            Logger& self = Get();
            if (lvl == LogLevel::Disabled) return false;
            if (lvl > self.mCfg.MinLevel.load(std::memory_order_relaxed)) return false;
            const char* filter = self.mCfg.CategoryEqualsFilter.load(std::memory_order_relaxed);
            if (filter) {
                if (!category) return false;
                if (std::string_view(filter) != category) return false;
            }
            return true;
        }

        template <class... Args>
        static void Log(LogLevel lvl, const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            if (!IsEnabled(lvl, category)) return;
            try {
                const std::string message = std::vformat(fmt.get(), std::make_format_args(args...));
                Emit(lvl, category, message);
            }
            catch (const std::exception& e) {
                Emit(LogLevel::Error, "Logger", e.what());
            }
        }

        static void Log(LogLevel lvl, const char* category, std::string_view msg) noexcept {
            if (!IsEnabled(lvl, category)) return;
            Emit(lvl, category, msg);
        }

    private:
        Logger() = default;

        static void Emit(LogLevel lvl, const char* category, std::string_view msg) noexcept {
            Logger& self = Get();
            std::scoped_lock lock(self.mMutex);
            if (self.mSink.IsBound()) {
                self.mSink.write(self.mSink.userData, lvl, category, msg);
                return;
            }

            std::FILE* stream = (lvl <= LogLevel::Warn) ? stderr : stdout;
            const char* lvlStr = ToShortLevel(lvl);
            try {
                if (category) {
                    std::println(stream, "[{}][{}] {}", lvlStr, category, msg);
                }
                else {
                    std::println(stream, "[{}] {}", lvlStr, msg);
                }
            }
            catch (const std::exception&) {
                // Console is unusable; fall back to the C stream API.
                std::fwrite(msg.data(), 1, msg.size(), stream);
                std::fputc('\n', stream);
            }
        }

        static const char* ToShortLevel(LogLevel lvl) noexcept {
            switch (lvl) {
            case LogLevel::Fatal:   return "F";
            case LogLevel::Error:   return "E";
            case LogLevel::Warn:    return "W";
            case LogLevel::Info:    return "I";
            case LogLevel::Verbose: return "V";
            default:                return "-";
            }
        }

    private:
        std::mutex mMutex{};
        LoggerConfig mCfg{};
        LogSink mSink{};
    };

} // namespace chr::core

// ----------------------
// Public log macros (single evaluation of Category)
// ----------------------
#if CHR_ENABLE_LOGGING
#define CHR_LOG_AT(Level, Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::chr::core::Logger::IsEnabled((Level), _cat)) { \
            ::chr::core::Logger::Log((Level), _cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define CHR_LOG_VERBOSE(Category, Fmt, ...) CHR_LOG_AT(::chr::core::LogLevel::Verbose, Category, Fmt __VA_OPT__(,) __VA_ARGS__)
#define CHR_LOG_INFO(Category, Fmt, ...)    CHR_LOG_AT(::chr::core::LogLevel::Info, Category, Fmt __VA_OPT__(,) __VA_ARGS__)
#define CHR_LOG_WARNING(Category, Fmt, ...) CHR_LOG_AT(::chr::core::LogLevel::Warn, Category, Fmt __VA_OPT__(,) __VA_ARGS__)
#define CHR_LOG_ERROR(Category, Fmt, ...)   CHR_LOG_AT(::chr::core::LogLevel::Error, Category, Fmt __VA_OPT__(,) __VA_ARGS__)
#else
#define CHR_LOG_VERBOSE(Category, Fmt, ...)  ((void)0)
#define CHR_LOG_INFO(Category, Fmt, ...)     ((void)0)
#define CHR_LOG_WARNING(Category, Fmt, ...)  ((void)0)
#define CHR_LOG_ERROR(Category, Fmt, ...)    ((void)0)
#endif

// ----------------------
// Assert macro (logs, never aborts)
// ----------------------
#if CHR_ENABLE_LOG_ASSERT
#ifndef CHR_ASSERT
#include <source_location>

#define CHR_EXPAND(x) x
#define CHR_GET_MACRO(_1,_2,NAME,...) NAME

// 1-arg form: CHR_ASSERT(Expr)
#define CHR_ASSERT_1(Expr) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::chr::core::Logger::Log(::chr::core::LogLevel::Error, "Assert", "{} ({}:{}): assertion failed: {}", \
                    loc.function_name(), loc.file_name(), loc.line(), #Expr); \
            } \
        } while(0)

// 2-arg form: CHR_ASSERT(Expr, Msg)
#define CHR_ASSERT_2(Expr, Msg) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::chr::core::Logger::Log(::chr::core::LogLevel::Error, "Assert", "{} ({}:{}): {}", \
                    loc.function_name(), loc.file_name(), loc.line(), Msg); \
            } \
        } while(0)

#define CHR_ASSERT(...) \
            CHR_EXPAND(CHR_GET_MACRO(__VA_ARGS__, CHR_ASSERT_2, CHR_ASSERT_1)(__VA_ARGS__))

#endif
#else
#ifndef CHR_ASSERT
#define CHR_ASSERT(...) ((void)0)
#endif
#endif
