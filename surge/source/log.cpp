// surge

#include "surge/log.hh"

#include <cstring>

namespace surge {
    void sgLogger::setLevel(sgLogLevel level) noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    sgLogLevel sgLogger::level() const noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void sgLogger::enable() noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_ = true;
    }

    void sgLogger::disable() noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_ = false;
    }

    void sgLogger::setSink(sgLogSink sink, void* userData) noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = sink;
        sinkUserData_ = userData;
    }

    bool sgLogger::allowTag(std::string_view tag) noexcept
    {
        if (tag.empty() || tag.size() >= tagCapacity)
            return false;

        std::lock_guard<std::mutex> lock(mutex_);
        for (uint32_t index = 0; index != tagCount_; ++index)
        {
            if (tag == tags_[index])
                return true;
        }
        if (tagCount_ == maxTags)
            return false;

        char* const slot = tags_[tagCount_++];
        std::memcpy(slot, tag.data(), tag.size());
        slot[tag.size()] = '\0';
        return true;
    }

    void sgLogger::clearTags() noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tagCount_ = 0;
    }

    bool sgLogger::enabled(sgLogLevel level, std::string_view tag) const noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sink_ != nullptr && acceptsLocked(level, tag);
    }

    void sgLogger::write(sgLogLevel level, std::string_view tag, std::string_view message)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_ == nullptr || !acceptsLocked(level, tag))
            return;

        // sinks get a terminated tag; long tags are cut
        char tagText[tagCapacity];
        size_t const tagLength = tag.size() < tagCapacity ? tag.size() : tagCapacity - 1;
        std::memcpy(tagText, tag.data(), tagLength);
        tagText[tagLength] = '\0';

        sgLogEvent event;
        event.level = level;
        event.tag = tagText;
        event.message = message.data();
        event.messageLength = static_cast<uint32_t>(message.size());
        sink_(event, sinkUserData_);
    }

    bool sgLogger::acceptsLocked(sgLogLevel level, std::string_view tag) const noexcept
    {
        if (!enabled_ || level_ == sgLogLevel::Off || level == sgLogLevel::Off)
            return false;

        if (level < level_)
            return false;

        if (tagCount_ == 0)
            return true;

        for (uint32_t index = 0; index != tagCount_; ++index)
        {
            if (tag == tags_[index])
                return true;
        }
        return false;
    }

    char const* sgLogLevelName(sgLogLevel level) noexcept
    {
        switch (level)
        {
        case sgLogLevel::Trace: return "trace";
        case sgLogLevel::Debug: return "debug";
        case sgLogLevel::Info: return "info";
        case sgLogLevel::Warn: return "warn";
        case sgLogLevel::Error: return "error";
        case sgLogLevel::Off: return "off";
        }
        return "unknown";
    }
} // namespace surge
