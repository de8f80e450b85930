// surge

#pragma once

#include "assert.hh"
#include "utility.hh"

#include <cstdint>

namespace surge {
    /// Array stored inside a contiguous block, addressed by a byte offset
    /// relative to this field so the block can be moved or memcpy'd freely.
    template <typename T, typename IndexT = uint32_t>
    struct sgRelativeArray
    {
        uint32_t offset = 0;
        uint32_t count = 0;

        T const* data() const noexcept
        {
            return count == 0 ? nullptr : reinterpret_cast<T const*>(reinterpret_cast<uintptr_t>(this) + offset);
        }
        T* data() noexcept { return count == 0 ? nullptr : reinterpret_cast<T*>(reinterpret_cast<uintptr_t>(this) + offset); }

        T const& operator[](IndexT index) const noexcept
        {
            SG_ASSERT(static_cast<uint32_t>(index) < count);
            return data()[static_cast<uint32_t>(index)];
        }
        T& operator[](IndexT index) noexcept
        {
            SG_ASSERT(static_cast<uint32_t>(index) < count);
            return data()[static_cast<uint32_t>(index)];
        }

        T const* begin() const noexcept { return data(); }
        T const* end() const noexcept { return data() + count; }

        T* begin() noexcept { return data(); }
        T* end() noexcept { return data() + count; }

        // reserves space for length items at the end of a block of the given size
        static uint32_t allocate(uint32_t& size, uint32_t length) noexcept
        {
            if (length == 0)
                return 0;

            size = sgAlign(size, alignof(T));
            uint32_t const start = size;
            size += static_cast<uint32_t>(sizeof(T)) * length;
            return start;
        }

        // block is the address of the enclosing block; blockOffset came from allocate()
        void assign(uintptr_t block, uint32_t blockOffset, uint32_t length) noexcept
        {
            count = length;
            offset = 0;
            if (length != 0)
            {
                uintptr_t const self = reinterpret_cast<uintptr_t>(this);
                SG_ASSERT(block + blockOffset > self);
                offset = static_cast<uint32_t>(block + blockOffset - self);
            }
        }

        bool validate(uintptr_t block, uint32_t size) const noexcept
        {
            if (count == 0)
                return true;

            uintptr_t const self = reinterpret_cast<uintptr_t>(this);
            uintptr_t const start = self + offset;
            uintptr_t const end = start + static_cast<uint64_t>(count) * sizeof(T);
            return offset != 0 && start % alignof(T) == 0 && start < end && block <= start && end <= block + size;
        }
    };
} // namespace surge
