// surge

#pragma once

#include "surge/alloc.hh"
#include "surge/types.hh"

#include "assert.hh"

#include <cstring>

namespace surge {
    /// NUL-terminated byte string owned through an sgAllocator. Attribute
    /// names and locators are stored as UTF-8 in these.
    class sgString
    {
    public:
        explicit sgString(sgAllocator& alloc) noexcept : allocator_(&alloc) {}

        sgString(sgAllocator& alloc, char const* string, char const* sentinel = nullptr) : allocator_(&alloc) { reset(string, sentinel); }
        sgString(sgAllocator& alloc, sgName name) : allocator_(&alloc) { reset(name.name, name.nameEnd); }
        sgString(sgAllocator& alloc, decltype(nullptr), char const*) = delete;

        sgString(sgString const&) = delete;
        sgString& operator=(sgString const&) = delete;

        sgString(sgString&& rhs) noexcept : allocator_(rhs.allocator_), first_(rhs.first_), last_(rhs.last_)
        {
            rhs.first_ = rhs.last_ = emptyString;
        }
        sgString& operator=(sgString&& rhs) noexcept
        {
            if (this != &rhs)
            {
                reset();
                allocator_ = rhs.allocator_;
                first_ = rhs.first_;
                last_ = rhs.last_;
                rhs.first_ = rhs.last_ = emptyString;
            }
            return *this;
        }

        ~sgString() { reset(); }

        bool empty() const noexcept { return first_ == last_; }

        char const* cStr() const noexcept { return first_; }

        char const* data() const noexcept { return first_; }
        uint32_t size() const noexcept { return static_cast<uint32_t>(last_ - first_); }

        char const* begin() const noexcept { return first_; }
        char const* end() const noexcept { return last_; }

        sgName name() const noexcept { return sgName{first_, last_}; }

        bool equals(char const* text, uint32_t length) const noexcept
        {
            return length == size() && (length == 0 || std::memcmp(first_, text, length) == 0);
        }

        inline void reset();
        inline void reset(char const* string, char const* sentinel = nullptr);
        inline void reset(decltype(nullptr), char const* sentinel = nullptr) = delete;

    private:
        // to avoid allocating for empty strings
        static constexpr char emptyString[] = "";

        sgAllocator* allocator_ = nullptr;
        char const* first_ = emptyString;
        char const* last_ = emptyString;
    };

    void sgString::reset()
    {
        if (first_ != emptyString)
            allocator_->free(const_cast<char*>(first_), size() + 1 /*NUL*/, 1);
        first_ = last_ = emptyString;
    }

    void sgString::reset(char const* string, char const* sentinel)
    {
        if (string == nullptr)
            return reset();

        if (sentinel == nullptr)
            sentinel = string + std::strlen(string);

        uint32_t const length = static_cast<uint32_t>(sentinel - string);
        if (length == 0)
            return reset();

        // copy before releasing so a sub-range of ourselves can be assigned
        char* const alloc = static_cast<char*>(allocator_->allocate(length + 1 /*NUL*/, 1));
        std::memcpy(alloc, string, length);
        alloc[length] = '\0';

        reset();

        first_ = alloc;
        last_ = first_ + length;
    }
} // namespace surge
