// surge

#pragma once

#include "surge/alloc.hh"

#include "rel.hh"

#include <cstdint>

namespace surge {
    static constexpr uint32_t sgImageMagic = 0x4744'4f53; // "SODG" in file byte order
    static constexpr uint32_t sgImageVersion = 1;

    enum sgImageVertexFlags : uint32_t
    {
        sgImageVertexHasPayload = 1u << 0,
    };

    struct sgImageVertex
    {
        uint32_t id = 0;
        uint32_t flags = 0;
        uint32_t payloadOffset = 0; // into blob
        uint32_t payloadSize = 0;
    };

    struct sgImageEdge
    {
        uint32_t from = 0;
        uint32_t to = 0;
        uint32_t nameOffset = 0; // into blob
        uint32_t nameLength = 0;
    };

    struct sgImageHeader
    {
        uint32_t magic = sgImageMagic;
        uint32_t version = sgImageVersion;
        uint32_t size = 0;     // number of bytes, including header, payload, and all padding
        uint32_t reserved = 0; // zero
        uint64_t hash = 0;     // hash of header and all payload bytes, assuming padding and hash field are all 0

        sgRelativeArray<sgImageVertex> vertices;
        sgRelativeArray<sgImageEdge> edges;
        sgRelativeArray<uint8_t> blob;
    };

    struct sgImage
    {
        sgImage(sgAllocator& alloc, uint8_t* block, uint32_t blockSize) noexcept : allocator(alloc), bytes(block), size(blockSize) {}

        sgAllocator& allocator;
        uint8_t* bytes = nullptr; // aligned for sgImageHeader
        uint32_t size = 0;
    };

    /// Correctness requires all padding bytes to be 0.
    uint64_t sgHashImage(sgImageHeader const* header) noexcept;
} // namespace surge
