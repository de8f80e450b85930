// surge

#pragma once

#include "surge/export.hh"
#include "surge/types.hh"

#include <cstdint>

namespace surge {
    enum class sgErrorCode : uint8_t
    {
        None,

        // construction
        DuplicateVertex,
        UnknownVertex,
        DuplicateAttribute,
        Malformed,
        IdsExhausted, // no vertex identifiers left below the invalid id

        // merge
        NameCollision,

        // dataization
        AttributeNotFound,
        CyclicDataization,
        NativeTypeMismatch,
        UnknownNative,
        NativeFailure,
        DepthExceeded,

        // persistence
        ReadFailed,
        WriteFailed,
        CorruptImage,
    };

    enum class sgErrorCategory : uint8_t
    {
        None,
        Assembly,
        Merge,
        Dataization,
        IO,
    };

    /// Describes why an operation failed. The name is copied in (truncated
    /// to fit) so an error stays valid after its source text is gone.
    struct sgError final
    {
        static constexpr uint32_t nameCapacity = 64;

        sgErrorCode code = sgErrorCode::None;
        sgVertexId vertex = sgInvalidVertexId;
        uint32_t line = 0; // 1-based source line for assembly errors, 0 otherwise
        char name[nameCapacity] = {};

        explicit operator bool() const noexcept { return code != sgErrorCode::None; }
    };

    [[nodiscard]] SG_API sgError sgMakeError(sgErrorCode code, sgVertexId vertex = sgInvalidVertexId, sgName name = {},
        uint32_t line = 0) noexcept;

    [[nodiscard]] SG_API sgErrorCategory sgErrorCategoryOf(sgErrorCode code) noexcept;

    [[nodiscard]] SG_API char const* sgErrorCodeName(sgErrorCode code) noexcept;
    [[nodiscard]] SG_API char const* sgErrorCategoryName(sgErrorCategory category) noexcept;
} // namespace surge
