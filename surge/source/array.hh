// surge

#pragma once

#include "surge/alloc.hh"

#include "assert.hh"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace surge {
    /// Growable array whose storage comes from an sgAllocator. IndexT lets
    /// callers address it with a strong index type.
    template <typename Value, typename IndexT = uint32_t>
    class sgArray
    {
    public:
        static_assert(std::is_nothrow_destructible_v<Value>);
        static_assert(std::is_nothrow_move_constructible_v<Value>);

        using index_type = IndexT;

        explicit sgArray(sgAllocator& allocator) noexcept : allocator_(&allocator) {}
        ~sgArray() noexcept { deallocate(); }

        sgArray(sgArray const&) = delete;
        sgArray& operator=(sgArray const&) = delete;

        sgArray(sgArray&& rhs) noexcept : first_(rhs.first_), sentinel_(rhs.sentinel_), last_(rhs.last_), allocator_(rhs.allocator_)
        {
            rhs.first_ = rhs.sentinel_ = rhs.last_ = nullptr;
        }

        sgArray& operator=(sgArray&& rhs) noexcept
        {
            if (this != &rhs)
            {
                deallocate();
                first_ = rhs.first_;
                sentinel_ = rhs.sentinel_;
                last_ = rhs.last_;
                allocator_ = rhs.allocator_;
                rhs.first_ = rhs.sentinel_ = rhs.last_ = nullptr;
            }
            return *this;
        }

        void resize(uint32_t size);
        void reserve(uint32_t minimumCapacity);

        uint32_t size() const noexcept { return static_cast<uint32_t>(sentinel_ - first_); }
        bool empty() const noexcept { return first_ == sentinel_; }

        Value* data() noexcept { return first_; }
        Value const* data() const noexcept { return first_; }

        Value* begin() noexcept { return first_; }
        Value const* begin() const noexcept { return first_; }

        Value* end() noexcept { return sentinel_; }
        Value const* end() const noexcept { return sentinel_; }

        Value& operator[](index_type index) noexcept
        {
            SG_ASSERT(static_cast<uint32_t>(index) < size());
            return first_[static_cast<uint32_t>(index)];
        }
        Value const& operator[](index_type index) const noexcept
        {
            SG_ASSERT(static_cast<uint32_t>(index) < size());
            return first_[static_cast<uint32_t>(index)];
        }

        Value& back() noexcept
        {
            SG_ASSERT(first_ != sentinel_);
            return *(sentinel_ - 1);
        }
        Value const& back() const noexcept
        {
            SG_ASSERT(first_ != sentinel_);
            return *(sentinel_ - 1);
        }

        void clear() noexcept;

        Value& pushBack(Value const& value);
        Value& pushBack(Value&& value);

        template <typename... Args>
        Value& emplaceBack(Args&&... args);

        // shifts later elements up by one
        Value& insertAt(uint32_t position, Value&& value);

        // bulk copy for byte buffers and other trivially copyable payloads
        void append(Value const* items, uint32_t count);
        void assign(Value const* items, uint32_t count)
        {
            clear();
            append(items, count);
        }

        Value popBack();

        sgAllocator& allocator() const noexcept { return *allocator_; }

    private:
        void grow();
        void reallocate(uint32_t required);
        void deallocate() noexcept;

        Value* first_ = nullptr;
        Value* sentinel_ = nullptr;
        Value* last_ = nullptr;
        sgAllocator* allocator_ = nullptr;
    };

    template <typename Value, typename IndexT>
    void sgArray<Value, IndexT>::resize(uint32_t size)
    {
        if (size < this->size())
        {
            Value* const newSentinel = first_ + size;
            if constexpr (!std::is_trivially_destructible_v<Value>)
            {
                for (Value* item = newSentinel; item != sentinel_; ++item)
                    item->~Value();
            }
            sentinel_ = newSentinel;
        }
        else if (size > this->size())
        {
            reserve(size);
            Value* const newSentinel = first_ + size;
            for (Value* item = sentinel_; item != newSentinel; ++item)
                new (item) Value{};
            sentinel_ = newSentinel;
        }
    }

    template <typename Value, typename IndexT>
    void sgArray<Value, IndexT>::reserve(uint32_t minimumCapacity)
    {
        if (minimumCapacity > static_cast<uint32_t>(last_ - first_))
            reallocate(minimumCapacity);
    }

    template <typename Value, typename IndexT>
    void sgArray<Value, IndexT>::clear() noexcept
    {
        if constexpr (std::is_trivially_destructible_v<Value>)
        {
            sentinel_ = first_;
        }
        else
        {
            while (sentinel_ != first_)
                (--sentinel_)->~Value();
        }
    }

    template <typename Value, typename IndexT>
    auto sgArray<Value, IndexT>::pushBack(Value const& value) -> Value&
    {
        if (sentinel_ == last_)
        {
            // value may alias our own storage
            Value copy(value);
            grow();
            return *new (sentinel_++) Value(std::move(copy));
        }

        return *new (sentinel_++) Value(value);
    }

    template <typename Value, typename IndexT>
    auto sgArray<Value, IndexT>::pushBack(Value&& value) -> Value&
    {
        if (sentinel_ == last_)
            grow();

        return *new (sentinel_++) Value(std::move(value));
    }

    template <typename Value, typename IndexT>
    template <typename... Args>
    Value& sgArray<Value, IndexT>::emplaceBack(Args&&... args)
    {
        if (sentinel_ == last_)
            grow();

        return *new (sentinel_++) Value(std::forward<Args>(args)...);
    }

    template <typename Value, typename IndexT>
    Value& sgArray<Value, IndexT>::insertAt(uint32_t position, Value&& value)
    {
        SG_ASSERT(position <= size());

        if (position == size())
            return pushBack(std::move(value));

        if (sentinel_ == last_)
            grow();

        new (sentinel_) Value(std::move(*(sentinel_ - 1)));
        for (Value* item = sentinel_ - 1; item != first_ + position; --item)
            *item = std::move(*(item - 1));
        ++sentinel_;

        first_[position] = std::move(value);
        return first_[position];
    }

    template <typename Value, typename IndexT>
    void sgArray<Value, IndexT>::append(Value const* items, uint32_t count)
    {
        static_assert(std::is_trivially_copyable_v<Value>);

        if (count == 0)
            return;

        reserve(size() + count);
        std::memcpy(sentinel_, items, count * sizeof(Value));
        sentinel_ += count;
    }

    template <typename Value, typename IndexT>
    auto sgArray<Value, IndexT>::popBack() -> Value
    {
        SG_ASSERT(first_ != sentinel_);
        Value ret = std::move(*--sentinel_);
        sentinel_->~Value();
        return ret;
    }

    template <typename Value, typename IndexT>
    void sgArray<Value, IndexT>::grow()
    {
        uint32_t const cap = static_cast<uint32_t>(last_ - first_);
        reallocate(cap < 16 ? 16 : cap + (cap >> 1));
    }

    template <typename Value, typename IndexT>
    void sgArray<Value, IndexT>::reallocate(uint32_t required)
    {
        uint32_t const count = size();
        if (static_cast<uint32_t>(last_ - first_) >= required)
            return;

        Value* const memory = static_cast<Value*>(allocator_->allocate(required * sizeof(Value), alignof(Value)));
        if (first_ != nullptr)
        {
            if constexpr (std::is_trivially_copyable_v<Value>)
            {
                std::memcpy(memory, first_, count * sizeof(Value));
            }
            else
            {
                for (Value *item = first_, *out = memory; item != sentinel_; ++item, ++out)
                {
                    new (out) Value(std::move(*item));
                    item->~Value();
                }
            }

            // moved-from elements are already destroyed
            sentinel_ = first_;
        }

        deallocate();

        first_ = memory;
        sentinel_ = memory + count;
        last_ = memory + required;
    }

    template <typename Value, typename IndexT>
    void sgArray<Value, IndexT>::deallocate() noexcept
    {
        clear();
        if (first_ != nullptr)
            allocator_->free(first_, static_cast<uint32_t>(last_ - first_) * sizeof(Value), alignof(Value));
        first_ = sentinel_ = last_ = nullptr;
    }
} // namespace surge
