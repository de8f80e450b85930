// surge

#pragma once

#include "surge/errors.hh"
#include "surge/export.hh"

#include <cstdint>

namespace surge {
    class sgAllocator;
    class sgGraph;
    struct sgImage;

    /// Serializes vertices, edges and payloads of a graph into one contiguous
    /// block. Dataization memo state is not part of the image.
    [[nodiscard]] SG_API sgImage* sgBuildImage(sgAllocator& alloc, sgGraph const& graph);
    SG_API void sgDestroyImage(sgImage* image);

    [[nodiscard]] SG_API uint8_t const* sgImageBytes(sgImage const* image) noexcept;
    [[nodiscard]] SG_API uint32_t sgImageSize(sgImage const* image) noexcept;

    /// Checks the block's framing, hash and internal ranges.
    [[nodiscard]] SG_API bool sgValidateImage(uint8_t const* bytes, uint32_t size) noexcept;

    /// Rebuilds a graph from an image block; CorruptImage if it is not one.
    [[nodiscard]] SG_API sgGraph* sgLoadImage(sgAllocator& alloc, uint8_t const* bytes, uint32_t size, sgError& out_error);

    // file helpers; ReadFailed / WriteFailed carry the path as the error name
    [[nodiscard]] SG_API bool sgSaveGraph(sgAllocator& alloc, sgGraph const& graph, char const* path, sgError& out_error);
    [[nodiscard]] SG_API sgGraph* sgLoadGraph(sgAllocator& alloc, char const* path, sgError& out_error);
} // namespace surge
