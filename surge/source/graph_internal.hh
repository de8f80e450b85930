// surge

#pragma once

#include "surge/alloc.hh"
#include "surge/graph.hh"

#include "array.hh"
#include "index.hh"
#include "string.hh"

#include <mutex>

namespace surge {
    SG_DEFINE_INDEX(sgVertexIndex);
    SG_DEFINE_INDEX(sgEdgeIndex);

    enum class sgEvalStatus : uint8_t
    {
        Unvisited,
        InProgress,
        Cached,
        Failed,
    };

    struct sgVertexRecord
    {
        sgVertexRecord(sgAllocator& alloc, sgVertexId vertexId) noexcept : id(vertexId), payload(alloc), cache(alloc) {}

        sgVertexId id;
        sgEdgeIndex firstEdge = sgInvalidIndex;
        sgEdgeIndex lastEdge = sgInvalidIndex;
        sgArray<uint8_t> payload;
        bool hasPayload = false;

        // dataization memo, never persisted
        sgEvalStatus status = sgEvalStatus::Unvisited;
        bool resolving = false;
        sgArray<uint8_t> cache;
        sgVertexId resolved = sgInvalidVertexId;
        sgError failure;
    };

    struct sgEdgeRecord
    {
        sgEdgeRecord(sgVertexId fromId, sgVertexId toId, sgString&& edgeName, uint64_t hash) noexcept
            : from(fromId), to(toId), name(static_cast<sgString&&>(edgeName)), nameHash(hash)
        {
        }

        sgVertexId from;
        sgVertexId to;
        sgString name;
        uint64_t nameHash = 0;
        sgEdgeIndex next = sgInvalidIndex;
    };

    /// The only sgGraph implementation. Merger, image writer and dataizer work
    /// on it directly.
    class sgGraphStore final : public sgGraph
    {
    public:
        explicit sgGraphStore(sgAllocator& alloc);

        bool add(sgVertexId vertex, sgError& out_error) override;
        bool bind(sgVertexId from, sgVertexId to, sgName name, sgError& out_error) override;
        bool put(sgVertexId vertex, sgBytes data, sgError& out_error) override;

        bool contains(sgVertexId vertex) const noexcept override { return findIndex(vertex).valid(); }
        bool attr(sgVertexId from, sgName name, sgVertexId& out_to) const noexcept override;
        bool data(sgVertexId vertex, sgBytes& out_data) const noexcept override;

        sgVertexId nextVertexId() const noexcept override { return nextVertexId_; }

        uint32_t vertexCount() const noexcept override { return vertices_.size(); }
        sgVertexId vertexAt(uint32_t index) const noexcept override;
        uint32_t edgeCount() const noexcept override { return edges_.size(); }
        sgEdgeId firstEdge(sgVertexId from) const noexcept override;
        sgEdgeId nextEdge(sgEdgeId edge) const noexcept override;
        sgEdge edge(sgEdgeId edge) const noexcept override;

        void setLogger(sgLogger* logger) noexcept override { logger_ = logger; }

        // adds a vertex under nextVertexId(); fails with IdsExhausted once none are left
        [[nodiscard]] bool addFresh(sgVertexId& out_vertex, sgError& out_error);

        [[nodiscard]] sgVertexRecord* find(sgVertexId vertex) noexcept;
        [[nodiscard]] sgVertexRecord const* find(sgVertexId vertex) const noexcept;
        [[nodiscard]] sgEdgeIndex findEdge(sgVertexId from, sgName name) const noexcept;

        // position of a vertex in insertion order, usable as a dense table key
        [[nodiscard]] sgVertexIndex indexOf(sgVertexId vertex) const noexcept { return findIndex(vertex); }
        sgVertexRecord const& vertexRecord(sgVertexIndex index) const noexcept { return vertices_[index]; }

        sgEdgeRecord const& edgeRecord(sgEdgeIndex index) const noexcept { return edges_[index]; }

        sgAllocator& allocator() const noexcept { return allocator_; }
        sgLogger* logger() const noexcept { return logger_; }

        // held by merge, image building and dataization for their whole duration;
        // merge also holds the incoming store's lock while reading it
        std::mutex& writeLock() const noexcept { return writeLock_; }

    private:
        struct IdSlot
        {
            sgVertexId id;
            sgVertexIndex index;
        };

        sgVertexIndex findIndex(sgVertexId vertex) const noexcept;
        uint32_t lowerBound(sgVertexId vertex) const noexcept;

        sgAllocator& allocator_;
        sgArray<sgVertexRecord, sgVertexIndex> vertices_;
        sgArray<sgEdgeRecord, sgEdgeIndex> edges_;
        sgArray<IdSlot> sorted_;
        sgVertexId nextVertexId_ = sgVertexId{0};
        sgLogger* logger_ = nullptr;
        mutable std::mutex writeLock_;
    };

    inline sgGraphStore& sgStoreOf(sgGraph& graph) noexcept { return static_cast<sgGraphStore&>(graph); }
    inline sgGraphStore const& sgStoreOf(sgGraph const& graph) noexcept { return static_cast<sgGraphStore const&>(graph); }
} // namespace surge
