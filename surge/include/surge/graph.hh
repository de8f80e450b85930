// surge

#pragma once

#include "surge/errors.hh"
#include "surge/export.hh"
#include "surge/types.hh"

#include <cstdint>

namespace surge {
    class sgAllocator;
    class sgLogger;

    struct sgEdge final
    {
        sgVertexId from = sgInvalidVertexId;
        sgVertexId to = sgInvalidVertexId;
        sgName name;
    };

    /// The attributed graph: vertices, uniquely named outgoing edges and
    /// optional byte payloads. Nothing is ever removed. Vertex 0 is the root
    /// namespace and exists from creation.
    ///
    /// Graphs are only obtained from sgCreateGraph; other components rely on
    /// the concrete type behind this interface.
    class sgGraph
    {
    public:
        // construction; on failure out_error describes the offending input
        [[nodiscard]] virtual bool add(sgVertexId vertex, sgError& out_error) = 0;
        [[nodiscard]] virtual bool bind(sgVertexId from, sgVertexId to, sgName name, sgError& out_error) = 0;
        [[nodiscard]] virtual bool put(sgVertexId vertex, sgBytes data, sgError& out_error) = 0;

        // pure lookups
        [[nodiscard]] virtual bool contains(sgVertexId vertex) const noexcept = 0;
        [[nodiscard]] virtual bool attr(sgVertexId from, sgName name, sgVertexId& out_to) const noexcept = 0;
        [[nodiscard]] virtual bool data(sgVertexId vertex, sgBytes& out_data) const noexcept = 0;

        // smallest identifier above every vertex ever added
        [[nodiscard]] virtual sgVertexId nextVertexId() const noexcept = 0;

        // enumeration, vertices in insertion order and edges in bind order
        [[nodiscard]] virtual uint32_t vertexCount() const noexcept = 0;
        [[nodiscard]] virtual sgVertexId vertexAt(uint32_t index) const noexcept = 0;
        [[nodiscard]] virtual uint32_t edgeCount() const noexcept = 0;
        [[nodiscard]] virtual sgEdgeId firstEdge(sgVertexId from) const noexcept = 0;
        [[nodiscard]] virtual sgEdgeId nextEdge(sgEdgeId edge) const noexcept = 0;
        [[nodiscard]] virtual sgEdge edge(sgEdgeId edge) const noexcept = 0;

        virtual void setLogger(sgLogger* logger) noexcept = 0;

    protected:
        ~sgGraph() = default;
    };

    [[nodiscard]] SG_API sgGraph* sgCreateGraph(sgAllocator& alloc);
    SG_API void sgDestroyGraph(sgGraph* graph);
} // namespace surge
