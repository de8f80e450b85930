// surge

#include "surge/errors.hh"

#include "utility.hh"

#include <cstring>

namespace surge {
    sgError sgMakeError(sgErrorCode code, sgVertexId vertex, sgName name, uint32_t line) noexcept
    {
        sgError error;
        error.code = code;
        error.vertex = vertex;
        error.line = line;

        uint32_t length = sgNameLen(name);
        if (length >= sgError::nameCapacity)
        {
            length = sgError::nameCapacity - 1;

            // do not split a UTF-8 sequence
            while (length != 0 && (static_cast<uint8_t>(name.name[length]) & 0xc0u) == 0x80u)
                --length;
        }
        if (length != 0)
            std::memcpy(error.name, name.name, length);
        error.name[length] = '\0';

        return error;
    }

    sgErrorCategory sgErrorCategoryOf(sgErrorCode code) noexcept
    {
        switch (code)
        {
        case sgErrorCode::DuplicateVertex:
        case sgErrorCode::UnknownVertex:
        case sgErrorCode::DuplicateAttribute:
        case sgErrorCode::Malformed:
        case sgErrorCode::IdsExhausted: return sgErrorCategory::Assembly;
        case sgErrorCode::NameCollision: return sgErrorCategory::Merge;
        case sgErrorCode::AttributeNotFound:
        case sgErrorCode::CyclicDataization:
        case sgErrorCode::NativeTypeMismatch:
        case sgErrorCode::UnknownNative:
        case sgErrorCode::NativeFailure:
        case sgErrorCode::DepthExceeded: return sgErrorCategory::Dataization;
        case sgErrorCode::ReadFailed:
        case sgErrorCode::WriteFailed:
        case sgErrorCode::CorruptImage: return sgErrorCategory::IO;
        case sgErrorCode::None: break;
        }
        return sgErrorCategory::None;
    }

    char const* sgErrorCodeName(sgErrorCode code) noexcept
    {
        switch (code)
        {
        case sgErrorCode::None: return "None";
        case sgErrorCode::DuplicateVertex: return "DuplicateVertex";
        case sgErrorCode::UnknownVertex: return "UnknownVertex";
        case sgErrorCode::DuplicateAttribute: return "DuplicateAttribute";
        case sgErrorCode::Malformed: return "Malformed";
        case sgErrorCode::IdsExhausted: return "IdsExhausted";
        case sgErrorCode::NameCollision: return "NameCollision";
        case sgErrorCode::AttributeNotFound: return "AttributeNotFound";
        case sgErrorCode::CyclicDataization: return "CyclicDataization";
        case sgErrorCode::NativeTypeMismatch: return "NativeTypeMismatch";
        case sgErrorCode::UnknownNative: return "UnknownNative";
        case sgErrorCode::NativeFailure: return "NativeFailure";
        case sgErrorCode::DepthExceeded: return "DepthExceeded";
        case sgErrorCode::ReadFailed: return "ReadFailed";
        case sgErrorCode::WriteFailed: return "WriteFailed";
        case sgErrorCode::CorruptImage: return "CorruptImage";
        }
        return "Unknown";
    }

    char const* sgErrorCategoryName(sgErrorCategory category) noexcept
    {
        switch (category)
        {
        case sgErrorCategory::None: return "None";
        case sgErrorCategory::Assembly: return "AssemblyError";
        case sgErrorCategory::Merge: return "MergeError";
        case sgErrorCategory::Dataization: return "DataizationError";
        case sgErrorCategory::IO: return "IOError";
        }
        return "Unknown";
    }
} // namespace surge
