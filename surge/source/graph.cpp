// surge

#include "surge/graph.hh"
#include "surge/log.hh"

#include "fnv.hh"
#include "graph_internal.hh"
#include "utility.hh"

namespace surge {
    static constexpr char const logTag[] = "graph";

    static uint64_t hashName(sgName name) noexcept { return sgHashFnv1a64(name.name, name.name + sgNameLen(name)); }

    sgGraphStore::sgGraphStore(sgAllocator& alloc) : allocator_(alloc), vertices_(alloc), edges_(alloc), sorted_(alloc)
    {
        sgError ignored;
        [[maybe_unused]] bool const added = add(sgRootVertexId, ignored);
        SG_ASSERT(added);
    }

    bool sgGraphStore::add(sgVertexId vertex, sgError& out_error)
    {
        if (!vertex.valid())
        {
            out_error = sgMakeError(sgErrorCode::IdsExhausted, vertex);
            return false;
        }

        uint32_t const position = lowerBound(vertex);
        if (position != sorted_.size() && sorted_[position].id == vertex)
        {
            out_error = sgMakeError(sgErrorCode::DuplicateVertex, vertex);
            return false;
        }

        sgVertexIndex const index{vertices_.size()};
        vertices_.emplaceBack(allocator_, vertex);
        sorted_.insertAt(position, IdSlot{.id = vertex, .index = index});

        if (vertex.value() >= nextVertexId_.value())
            nextVertexId_ = sgVertexId{vertex.value() + 1};

        SG_LOG_TRACE(logger_, logTag, "add ν{}", vertex.value());
        return true;
    }

    bool sgGraphStore::addFresh(sgVertexId& out_vertex, sgError& out_error)
    {
        if (!add(nextVertexId_, out_error))
            return false;

        out_vertex = sgVertexId{nextVertexId_.value() - 1};
        return true;
    }

    bool sgGraphStore::bind(sgVertexId from, sgVertexId to, sgName name, sgError& out_error)
    {
        SG_GUARD_OR(name.name != nullptr, false);

        sgVertexIndex const fromIndex = findIndex(from);
        if (!fromIndex.valid())
        {
            out_error = sgMakeError(sgErrorCode::UnknownVertex, from, name);
            return false;
        }
        if (!findIndex(to).valid())
        {
            out_error = sgMakeError(sgErrorCode::UnknownVertex, to, name);
            return false;
        }
        if (sgIsNameEmpty(name))
        {
            out_error = sgMakeError(sgErrorCode::Malformed, from, name);
            return false;
        }
        if (findEdge(from, name).valid())
        {
            out_error = sgMakeError(sgErrorCode::DuplicateAttribute, from, name);
            return false;
        }

        sgEdgeIndex const index{edges_.size()};
        edges_.emplaceBack(from, to, sgString(allocator_, name), hashName(name));

        sgVertexRecord& record = vertices_[fromIndex];
        if (record.lastEdge.valid())
            edges_[record.lastEdge].next = index;
        else
            record.firstEdge = index;
        record.lastEdge = index;

        SG_LOG_TRACE(logger_, logTag, "bind ν{} -{}-> ν{}", from.value(), fmt::string_view(name.name, sgNameLen(name)), to.value());
        return true;
    }

    bool sgGraphStore::put(sgVertexId vertex, sgBytes data, sgError& out_error)
    {
        SG_GUARD_OR(data.data != nullptr || data.size == 0, false);

        sgVertexRecord* const record = find(vertex);
        if (record == nullptr)
        {
            out_error = sgMakeError(sgErrorCode::UnknownVertex, vertex);
            return false;
        }

        record->payload.assign(data.data, data.size);
        record->hasPayload = true;

        SG_LOG_TRACE(logger_, logTag, "put ν{} ({} bytes)", vertex.value(), data.size);
        return true;
    }

    bool sgGraphStore::attr(sgVertexId from, sgName name, sgVertexId& out_to) const noexcept
    {
        sgEdgeIndex const index = findEdge(from, name);
        if (!index.valid())
            return false;

        out_to = edges_[index].to;
        return true;
    }

    bool sgGraphStore::data(sgVertexId vertex, sgBytes& out_data) const noexcept
    {
        sgVertexRecord const* const record = find(vertex);
        if (record == nullptr || !record->hasPayload)
            return false;

        out_data = sgBytes{.data = record->payload.data(), .size = record->payload.size()};
        return true;
    }

    sgVertexId sgGraphStore::vertexAt(uint32_t index) const noexcept
    {
        SG_GUARD_OR(index < vertices_.size(), sgInvalidVertexId);
        return vertices_[sgVertexIndex{index}].id;
    }

    sgEdgeId sgGraphStore::firstEdge(sgVertexId from) const noexcept
    {
        sgVertexRecord const* const record = find(from);
        if (record == nullptr || !record->firstEdge.valid())
            return sgInvalidEdgeId;
        return sgEdgeId{record->firstEdge.value()};
    }

    sgEdgeId sgGraphStore::nextEdge(sgEdgeId edge) const noexcept
    {
        SG_GUARD_OR(edge.value() < edges_.size(), sgInvalidEdgeId);

        sgEdgeIndex const next = edges_[sgEdgeIndex{edge.value()}].next;
        return next.valid() ? sgEdgeId{next.value()} : sgInvalidEdgeId;
    }

    sgEdge sgGraphStore::edge(sgEdgeId edge) const noexcept
    {
        SG_GUARD_OR(edge.value() < edges_.size(), sgEdge{});

        sgEdgeRecord const& record = edges_[sgEdgeIndex{edge.value()}];
        return sgEdge{.from = record.from, .to = record.to, .name = record.name.name()};
    }

    sgVertexRecord* sgGraphStore::find(sgVertexId vertex) noexcept
    {
        sgVertexIndex const index = findIndex(vertex);
        return index.valid() ? &vertices_[index] : nullptr;
    }

    sgVertexRecord const* sgGraphStore::find(sgVertexId vertex) const noexcept
    {
        sgVertexIndex const index = findIndex(vertex);
        return index.valid() ? &vertices_[index] : nullptr;
    }

    sgEdgeIndex sgGraphStore::findEdge(sgVertexId from, sgName name) const noexcept
    {
        sgVertexRecord const* const record = find(from);
        if (record == nullptr)
            return sgInvalidIndex;

        uint32_t const length = sgNameLen(name);
        uint64_t const hash = hashName(name);
        for (sgEdgeIndex index = record->firstEdge; index.valid(); index = edges_[index].next)
        {
            sgEdgeRecord const& edge = edges_[index];
            if (edge.nameHash == hash && edge.name.equals(name.name, length))
                return index;
        }
        return sgInvalidIndex;
    }

    sgVertexIndex sgGraphStore::findIndex(sgVertexId vertex) const noexcept
    {
        uint32_t const position = lowerBound(vertex);
        if (position == sorted_.size() || sorted_[position].id != vertex)
            return sgInvalidIndex;
        return sorted_[position].index;
    }

    uint32_t sgGraphStore::lowerBound(sgVertexId vertex) const noexcept
    {
        // identifiers mostly arrive in increasing order
        if (sorted_.empty() || sorted_.back().id < vertex)
            return sorted_.size();

        uint32_t first = 0;
        uint32_t count = sorted_.size();
        while (count != 0)
        {
            uint32_t const step = count / 2;
            if (sorted_[first + step].id < vertex)
            {
                first += step + 1;
                count -= step + 1;
            }
            else
            {
                count = step;
            }
        }
        return first;
    }

    sgGraph* sgCreateGraph(sgAllocator& alloc)
    {
        return sgNew<sgGraphStore>(alloc, alloc);
    }

    void sgDestroyGraph(sgGraph* graph)
    {
        if (graph == nullptr)
            return;

        sgGraphStore* const store = &sgStoreOf(*graph);
        sgDelete(store->allocator(), store);
    }
} // namespace surge
