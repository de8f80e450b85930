// surge

#pragma once

#include <cstdint>

namespace surge {
    inline constexpr uint64_t sgFnvOffsetBasis = 0xcbf2'9ce4'8422'2325ull;
    inline constexpr uint64_t sgFnvPrime = 0x0000'0100'0000'01b3ull;

    // FNV-1a over a byte range; pass a previous result as hash to continue it
    constexpr uint64_t sgHashFnv1a64(uint8_t const* bytes, uint32_t length, uint64_t hash = sgFnvOffsetBasis) noexcept
    {
        for (uint32_t index = 0; index != length; ++index)
            hash = (hash ^ bytes[index]) * sgFnvPrime;
        return hash;
    }

    constexpr uint64_t sgHashFnv1a64(char const* start, char const* end, uint64_t hash = sgFnvOffsetBasis) noexcept
    {
        for (; start != end; ++start)
            hash = (hash ^ static_cast<uint8_t>(*start)) * sgFnvPrime;
        return hash;
    }
} // namespace surge
