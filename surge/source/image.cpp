// surge

#include "surge/image.hh"

#include "surge/alloc.hh"
#include "surge/graph.hh"

#include "array.hh"
#include "fnv.hh"
#include "graph_internal.hh"
#include "image_internal.hh"
#include "utility.hh"

#include <bit>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <new>

namespace surge {
    static_assert(std::endian::native == std::endian::little, "images are stored little-endian");
    static_assert(sizeof(sgImageHeader) % alignof(sgImageHeader) == 0);

    static bool isInRange(uint32_t offset, uint32_t count, uint32_t range) noexcept
    {
        return offset <= range && count <= range - offset;
    }

#define SG_VALIDATE(x) \
    if (!(x))          \
    {                  \
        return false;  \
    }

    bool sgValidateImage(uint8_t const* bytes, uint32_t size) noexcept
    {
        // ensure the byte range is valid and at least large enough for the header
        SG_VALIDATE(bytes != nullptr);
        SG_VALIDATE(size >= sizeof(sgImageHeader));
        SG_VALIDATE(reinterpret_cast<uintptr_t>(bytes) % alignof(sgImageHeader) == 0);

        sgImageHeader const& header = *std::launder(reinterpret_cast<sgImageHeader const*>(bytes));

        SG_VALIDATE(header.magic == sgImageMagic);
        SG_VALIDATE(header.version == sgImageVersion);
        SG_VALIDATE(header.reserved == 0);

        // ensure the block is big enough for the header's declared size
        SG_VALIDATE(header.size >= sizeof(sgImageHeader));
        SG_VALIDATE(size >= header.size);

        SG_VALIDATE(sgHashImage(&header) == header.hash);

        // ensure embedded arrays are enclosed in the block
        uintptr_t const block = reinterpret_cast<uintptr_t>(bytes);
        SG_VALIDATE(header.vertices.validate(block, header.size));
        SG_VALIDATE(header.edges.validate(block, header.size));
        SG_VALIDATE(header.blob.validate(block, header.size));

        // validate payload and name ranges
        for (sgImageVertex const& vertex : header.vertices)
        {
            SG_VALIDATE((vertex.flags & ~uint32_t{sgImageVertexHasPayload}) == 0);
            SG_VALIDATE(sgVertexId{vertex.id}.valid());
            if (vertex.flags & sgImageVertexHasPayload)
                SG_VALIDATE(isInRange(vertex.payloadOffset, vertex.payloadSize, header.blob.count));
        }

        for (sgImageEdge const& edge : header.edges)
        {
            SG_VALIDATE(edge.nameLength != 0);
            SG_VALIDATE(isInRange(edge.nameOffset, edge.nameLength, header.blob.count));
        }

        return true;
    }

#undef SG_VALIDATE

    uint64_t sgHashImage(sgImageHeader const* header) noexcept
    {
        if (header == nullptr || header->size < sizeof(sgImageHeader))
            return 0;

        // hash a copy of the header with the hash field cleared, then
        // continue over everything that follows it
        sgImageHeader headerCopy = *header;
        headerCopy.hash = 0u;

        uint8_t const* const bytes = reinterpret_cast<uint8_t const*>(header);

        uint64_t hash = sgHashFnv1a64(reinterpret_cast<uint8_t const*>(&headerCopy), sizeof(headerCopy));
        hash = sgHashFnv1a64(bytes + sizeof(sgImageHeader), header->size - sizeof(sgImageHeader), hash);
        return hash;
    }

    sgImage* sgBuildImage(sgAllocator& alloc, sgGraph const& graph)
    {
        sgGraphStore const& store = sgStoreOf(graph);
        std::lock_guard<std::mutex> lock(store.writeLock());

        uint32_t const vertexCount = store.vertexCount();
        uint32_t const edgeCount = store.edgeCount();

        uint32_t blobSize = 0;
        for (uint32_t index = 0; index != vertexCount; ++index)
            blobSize += store.vertexRecord(sgVertexIndex{index}).payload.size();
        for (uint32_t index = 0; index != edgeCount; ++index)
            blobSize += store.edgeRecord(sgEdgeIndex{index}).name.size();

        uint32_t size = sizeof(sgImageHeader);
        uint32_t const verticesOffset = decltype(sgImageHeader::vertices)::allocate(size, vertexCount);
        uint32_t const edgesOffset = decltype(sgImageHeader::edges)::allocate(size, edgeCount);
        uint32_t const blobOffset = decltype(sgImageHeader::blob)::allocate(size, blobSize);
        size = sgAlign(size, alignof(sgImageHeader));

        uint8_t* const bytes = static_cast<uint8_t*>(alloc.allocate(size, alignof(sgImageHeader)));
        std::memset(bytes, 0, size);

        uintptr_t const block = reinterpret_cast<uintptr_t>(bytes);
        sgImageHeader* const header = new (bytes) sgImageHeader;
        header->size = size;
        header->vertices.assign(block, verticesOffset, vertexCount);
        header->edges.assign(block, edgesOffset, edgeCount);
        header->blob.assign(block, blobOffset, blobSize);

        uint8_t* const blob = header->blob.data();
        uint32_t blobCursor = 0;

        for (uint32_t index = 0; index != vertexCount; ++index)
        {
            sgVertexRecord const& record = store.vertexRecord(sgVertexIndex{index});
            sgImageVertex& out = header->vertices[index];
            out.id = record.id.value();
            if (record.hasPayload)
            {
                out.flags = sgImageVertexHasPayload;
                out.payloadOffset = blobCursor;
                out.payloadSize = record.payload.size();
                if (out.payloadSize != 0)
                    std::memcpy(blob + blobCursor, record.payload.data(), out.payloadSize);
                blobCursor += out.payloadSize;
            }
        }

        for (uint32_t index = 0; index != edgeCount; ++index)
        {
            sgEdgeRecord const& record = store.edgeRecord(sgEdgeIndex{index});
            sgImageEdge& out = header->edges[index];
            out.from = record.from.value();
            out.to = record.to.value();
            out.nameOffset = blobCursor;
            out.nameLength = record.name.size();
            std::memcpy(blob + blobCursor, record.name.data(), out.nameLength);
            blobCursor += out.nameLength;
        }

        SG_ASSERT(blobCursor == blobSize);

        header->hash = sgHashImage(header);

        return sgNew<sgImage>(alloc, alloc, bytes, size);
    }

    void sgDestroyImage(sgImage* image)
    {
        if (image == nullptr)
            return;

        sgAllocator& alloc = image->allocator;
        alloc.free(image->bytes, image->size, alignof(sgImageHeader));
        sgDelete(alloc, image);
    }

    uint8_t const* sgImageBytes(sgImage const* image) noexcept { return image != nullptr ? image->bytes : nullptr; }

    uint32_t sgImageSize(sgImage const* image) noexcept { return image != nullptr ? image->size : 0; }

    static sgGraph* loadValidated(sgAllocator& alloc, sgImageHeader const& header, sgError& out_error)
    {
        sgGraph* const graph = sgCreateGraph(alloc);
        sgGraphStore& store = sgStoreOf(*graph);

        uint8_t const* const blob = header.blob.data();

        // any construction failure means the image describes an impossible graph
        auto corrupt = [&](sgVertexId vertex) -> sgGraph* {
            sgDestroyGraph(graph);
            out_error = sgMakeError(sgErrorCode::CorruptImage, vertex);
            return nullptr;
        };

        sgError error;
        for (sgImageVertex const& vertex : header.vertices)
        {
            sgVertexId const id{vertex.id};
            if (id != sgRootVertexId && !store.add(id, error))
                return corrupt(id);

            if ((vertex.flags & sgImageVertexHasPayload) != 0 &&
                !store.put(id, sgBytes{.data = blob != nullptr ? blob + vertex.payloadOffset : nullptr, .size = vertex.payloadSize}, error))
                return corrupt(id);
        }

        for (sgImageEdge const& edge : header.edges)
        {
            char const* const name = reinterpret_cast<char const*>(blob + edge.nameOffset);
            if (!store.bind(sgVertexId{edge.from}, sgVertexId{edge.to}, sgName{name, name + edge.nameLength}, error))
                return corrupt(sgVertexId{edge.from});
        }

        return graph;
    }

    sgGraph* sgLoadImage(sgAllocator& alloc, uint8_t const* bytes, uint32_t size, sgError& out_error)
    {
        if (bytes == nullptr || size < sizeof(sgImageHeader))
        {
            out_error = sgMakeError(sgErrorCode::CorruptImage);
            return nullptr;
        }

        // the relative arrays need the block at its natural alignment
        uint8_t* const aligned = static_cast<uint8_t*>(alloc.allocate(size, alignof(sgImageHeader)));
        std::memcpy(aligned, bytes, size);

        sgGraph* graph = nullptr;
        if (sgValidateImage(aligned, size))
            graph = loadValidated(alloc, *std::launder(reinterpret_cast<sgImageHeader const*>(aligned)), out_error);
        else
            out_error = sgMakeError(sgErrorCode::CorruptImage);

        alloc.free(aligned, size, alignof(sgImageHeader));
        return graph;
    }

    bool sgSaveGraph(sgAllocator& alloc, sgGraph const& graph, char const* path, sgError& out_error)
    {
        SG_GUARD_OR(path != nullptr, false);

        sgImage* const image = sgBuildImage(alloc, graph);

        bool written = false;
        if (std::FILE* const file = std::fopen(path, "wb"))
        {
            written = std::fwrite(image->bytes, 1, image->size, file) == image->size;
            written = std::fclose(file) == 0 && written;
        }

        sgDestroyImage(image);

        if (!written)
            out_error = sgMakeError(sgErrorCode::WriteFailed, sgInvalidVertexId, sgName{path});
        return written;
    }

    sgGraph* sgLoadGraph(sgAllocator& alloc, char const* path, sgError& out_error)
    {
        SG_GUARD_OR(path != nullptr, nullptr);

        std::FILE* const file = std::fopen(path, "rb");
        if (file == nullptr)
        {
            out_error = sgMakeError(sgErrorCode::ReadFailed, sgInvalidVertexId, sgName{path});
            return nullptr;
        }

        sgArray<uint8_t> contents(alloc);
        uint8_t chunk[4096];
        for (;;)
        {
            size_t const read = std::fread(chunk, 1, sizeof(chunk), file);
            contents.append(chunk, static_cast<uint32_t>(read));
            if (read != sizeof(chunk))
                break;
        }

        bool failed = std::ferror(file) != 0;
        failed = std::fclose(file) != 0 || failed;

        if (failed)
        {
            out_error = sgMakeError(sgErrorCode::ReadFailed, sgInvalidVertexId, sgName{path});
            return nullptr;
        }

        return sgLoadImage(alloc, contents.data(), contents.size(), out_error);
    }
} // namespace surge
