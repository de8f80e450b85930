// surge

#pragma once

#include "surge/types.hh"

#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>

namespace surge {
    constexpr uint32_t sgAlign(uint32_t value, uint32_t alignment) noexcept
    {
        uint32_t const mask = alignment - 1;
        uint32_t const overage = value & mask;
        return overage == 0 ? value : value + (alignment - overage);
    }

    template <typename T, uint32_t Count>
    constexpr uint32_t sgCountOf(T (&)[Count]) noexcept
    {
        return Count;
    }

    template <class ResultT, class FromT>
    inline ResultT sgBitCast(FromT const& from) noexcept
    {
        static_assert(sizeof(ResultT) == sizeof(FromT));
        static_assert(std::is_trivially_copyable_v<ResultT>);
        static_assert(std::is_trivially_copyable_v<FromT>);

        ResultT result;
        std::memcpy(&result, &from, sizeof(result));
        return result;
    }

    // integers and floats travel as 8-byte big-endian words
    inline uint64_t sgLoadBigEndian64(uint8_t const* bytes) noexcept
    {
        uint64_t value = 0;
        for (uint32_t index = 0; index != 8; ++index)
            value = (value << 8) | bytes[index];
        return value;
    }

    inline void sgStoreBigEndian64(uint64_t value, uint8_t* out_bytes) noexcept
    {
        for (uint32_t index = 8; index != 0; --index)
        {
            out_bytes[index - 1] = static_cast<uint8_t>(value & 0xffu);
            value >>= 8;
        }
    }

    constexpr uint32_t sgNameLen(sgName name) noexcept
    {
        if (name.name == nullptr)
            return 0;

        if (name.nameEnd != nullptr)
            return static_cast<uint32_t>(name.nameEnd - name.name);

        return static_cast<uint32_t>(std::char_traits<char>::length(name.name));
    }

    constexpr bool sgIsNameEmpty(sgName name) noexcept { return sgNameLen(name) == 0; }

    inline bool sgNameEquals(sgName name, char const* text) noexcept
    {
        uint32_t const length = sgNameLen(name);
        return length == std::strlen(text) && (length == 0 || std::memcmp(name.name, text, length) == 0);
    }

    inline bool sgNameEquals(sgName lhs, sgName rhs) noexcept
    {
        uint32_t const length = sgNameLen(lhs);
        return length == sgNameLen(rhs) && (length == 0 || std::memcmp(lhs.name, rhs.name, length) == 0);
    }

    inline bool sgNameStartsWith(sgName name, char const* prefix) noexcept
    {
        uint32_t const prefixLen = static_cast<uint32_t>(std::strlen(prefix));
        return sgNameLen(name) >= prefixLen && std::memcmp(name.name, prefix, prefixLen) == 0;
    }

    // true for α0, α1, ... with a non-empty all-digit suffix
    inline bool sgIsPositionalName(sgName name) noexcept
    {
        if (!sgNameStartsWith(name, sgAttr::alpha))
            return false;

        uint32_t const length = sgNameLen(name);
        uint32_t const prefixLen = sizeof(sgAttr::alpha) - 1;
        if (length == prefixLen)
            return false;

        for (uint32_t index = prefixLen; index != length; ++index)
        {
            if (name.name[index] < '0' || name.name[index] > '9')
                return false;
        }
        return true;
    }
} // namespace surge
