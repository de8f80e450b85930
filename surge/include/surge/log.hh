// surge

#pragma once

#include "surge/export.hh"

#include <fmt/format.h>

#include <cstdint>
#include <mutex>
#include <string_view>

namespace surge {
    enum class sgLogLevel : uint8_t
    {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Off,
    };

    struct sgLogEvent final
    {
        sgLogLevel level = sgLogLevel::Info;
        char const* tag = "";
        char const* message = "";
        uint32_t messageLength = 0;
    };

    using sgLogSink = void (*)(sgLogEvent const& event, void* userData);

    /// Leveled, tag-filtered logger shared by all surge components. Nothing is
    /// emitted until a sink is installed and the logger is enabled.
    class SG_API sgLogger final
    {
    public:
        static constexpr uint32_t tagCapacity = 32;
        static constexpr uint32_t maxTags = 8;

        void setLevel(sgLogLevel level) noexcept;
        [[nodiscard]] sgLogLevel level() const noexcept;

        void enable() noexcept;
        void disable() noexcept;

        void setSink(sgLogSink sink, void* userData = nullptr) noexcept;

        // once any tag is allowed, events with other tags are dropped; fails
        // when the tag is empty, longer than tagCapacity - 1 or the table is full
        bool allowTag(std::string_view tag) noexcept;
        void clearTags() noexcept;

        [[nodiscard]] bool enabled(sgLogLevel level, std::string_view tag) const noexcept;

        void write(sgLogLevel level, std::string_view tag, std::string_view message);

    private:
        bool acceptsLocked(sgLogLevel level, std::string_view tag) const noexcept;

        bool enabled_ = false;
        sgLogLevel level_ = sgLogLevel::Warn;
        char tags_[maxTags][tagCapacity] = {};
        uint32_t tagCount_ = 0;
        sgLogSink sink_ = nullptr;
        void* sinkUserData_ = nullptr;
        mutable std::mutex mutex_;
    };

    [[nodiscard]] SG_API char const* sgLogLevelName(sgLogLevel level) noexcept;
} // namespace surge

// clang-format off
#define SG_LOG(logger, level, tag, ...)                                               \
    do                                                                                \
    {                                                                                 \
        ::surge::sgLogger* const sgLog_ = (logger);                                   \
        if (sgLog_ != nullptr && sgLog_->enabled((level), (tag)))                     \
            sgLog_->write((level), (tag), ::fmt::format(__VA_ARGS__));                \
    } while (false)
// clang-format on

#define SG_LOG_TRACE(logger, tag, ...) SG_LOG(logger, ::surge::sgLogLevel::Trace, tag, __VA_ARGS__)
#define SG_LOG_DEBUG(logger, tag, ...) SG_LOG(logger, ::surge::sgLogLevel::Debug, tag, __VA_ARGS__)
#define SG_LOG_INFO(logger, tag, ...) SG_LOG(logger, ::surge::sgLogLevel::Info, tag, __VA_ARGS__)
#define SG_LOG_WARN(logger, tag, ...) SG_LOG(logger, ::surge::sgLogLevel::Warn, tag, __VA_ARGS__)
#define SG_LOG_ERROR(logger, tag, ...) SG_LOG(logger, ::surge::sgLogLevel::Error, tag, __VA_ARGS__)
