// surge

#include "surge/merge.hh"

#include "surge/graph.hh"
#include "surge/log.hh"

#include "array.hh"
#include "graph_internal.hh"
#include "utility.hh"

#include <mutex>

namespace surge {
    static constexpr char const logTag[] = "merge";

    bool sgMerge(sgGraph& base, sgGraph const& incoming, sgError& out_error)
    {
        SG_GUARD_OR(&base != &incoming, false);

        sgGraphStore& target = sgStoreOf(base);
        sgGraphStore const& source = sgStoreOf(incoming);

        std::scoped_lock lock(target.writeLock(), source.writeLock());

        // root-level names are the public symbol table; reject before writing anything
        for (sgEdgeId edge = source.firstEdge(sgRootVertexId); edge.valid(); edge = source.nextEdge(edge))
        {
            sgName const name = source.edge(edge).name;
            if (target.findEdge(sgRootVertexId, name).valid())
            {
                out_error = sgMakeError(sgErrorCode::NameCollision, sgRootVertexId, name);
                SG_LOG_WARN(target.logger(), logTag, "name collision on '{}'", fmt::string_view(name.name, sgNameLen(name)));
                return false;
            }
        }

        // incoming vertex index -> identifier in base
        uint32_t const vertexCount = source.vertexCount();
        sgArray<sgVertexId, sgVertexIndex> renumbered(target.allocator());
        renumbered.reserve(vertexCount);

        uint32_t next = target.nextVertexId().value();
        if (vertexCount - 1 > sgVertexId::invalid_value - next)
        {
            out_error = sgMakeError(sgErrorCode::IdsExhausted, target.nextVertexId());
            SG_LOG_WARN(target.logger(), logTag, "{} vertices do not fit above ν{}", vertexCount - 1, next);
            return false;
        }

        for (uint32_t index = 0; index != vertexCount; ++index)
        {
            sgVertexRecord const& record = source.vertexRecord(sgVertexIndex{index});
            if (record.id == sgRootVertexId)
            {
                renumbered.pushBack(sgRootVertexId);
                continue;
            }

            sgVertexId const vertex{next++};
            if (!target.add(vertex, out_error))
                return false;
            if (record.hasPayload &&
                !target.put(vertex, sgBytes{.data = record.payload.data(), .size = record.payload.size()}, out_error))
                return false;

            renumbered.pushBack(vertex);
        }

        uint32_t const edgeCount = source.edgeCount();
        for (uint32_t index = 0; index != edgeCount; ++index)
        {
            sgEdgeRecord const& edge = source.edgeRecord(sgEdgeIndex{index});
            sgVertexId const from = renumbered[source.indexOf(edge.from)];
            sgVertexId const to = renumbered[source.indexOf(edge.to)];

            if (!target.bind(from, to, edge.name.name(), out_error))
                return false;
        }

        SG_LOG_INFO(target.logger(), logTag, "merged {} vertices and {} edges", vertexCount - 1, edgeCount);
        return true;
    }
} // namespace surge
