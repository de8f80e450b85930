// surge

#include "surge/inspect.hh"

#include "surge/graph.hh"

#include "array.hh"
#include "graph_internal.hh"
#include "utility.hh"

#include <fmt/format.h>

#include <iterator>

namespace surge {
    namespace {
        fmt::string_view view(sgName name) noexcept { return fmt::string_view(name.name, sgNameLen(name)); }

        void appendBytes(fmt::memory_buffer& out, sgBytes bytes)
        {
            if (bytes.size == 0)
            {
                fmt::format_to(std::back_inserter(out), "--");
                return;
            }

            for (uint32_t index = 0; index != bytes.size; ++index)
            {
                if (index != 0)
                    out.push_back('-');
                fmt::format_to(std::back_inserter(out), "{:02X}", bytes.data[index]);
            }
        }

        void appendPayload(fmt::memory_buffer& out, sgGraphStore const& store, sgVertexId vertex)
        {
            sgBytes payload;
            if (!store.data(vertex, payload))
                return;

            fmt::format_to(std::back_inserter(out), " Δ➞ ");
            appendBytes(out, payload);
        }

        // dot double-quoted strings only need quotes and backslashes escaped
        void appendEscaped(fmt::memory_buffer& out, fmt::string_view text)
        {
            for (char const ch : text)
            {
                if (ch == '"' || ch == '\\')
                    out.push_back('\\');
                out.push_back(ch);
            }
        }

        bool isBackEdge(sgName name) noexcept { return sgNameEquals(name, sgAttr::rho) || sgNameEquals(name, sgAttr::pi); }
    } // namespace

    std::string sgFormatBytes(sgBytes bytes)
    {
        fmt::memory_buffer out;
        appendBytes(out, bytes);
        return fmt::to_string(out);
    }

    std::string sgInspect(sgGraph const& graph, sgVertexId vertex)
    {
        sgGraphStore const& store = sgStoreOf(graph);
        if (!store.contains(vertex))
            return {};

        fmt::memory_buffer out;
        fmt::format_to(std::back_inserter(out), "ν{}", vertex.value());
        appendPayload(out, store, vertex);
        out.push_back('\n');

        sgArray<uint8_t, sgVertexIndex> expanded(store.allocator());
        expanded.resize(store.vertexCount());
        expanded[store.indexOf(vertex)] = 1;

        struct Frame
        {
            sgEdgeId edge;
            uint32_t depth;
        };

        sgArray<Frame> stack(store.allocator());
        stack.pushBack(Frame{store.firstEdge(vertex), 1});

        while (!stack.empty())
        {
            Frame& top = stack.back();
            if (!top.edge.valid())
            {
                stack.popBack();
                continue;
            }

            sgEdge const edge = store.edge(top.edge);
            uint32_t const depth = top.depth;
            top.edge = store.nextEdge(top.edge);

            fmt::format_to(std::back_inserter(out), "{:{}}.{} ➞ ν{}", "", depth * 2, view(edge.name), edge.to.value());
            appendPayload(out, store, edge.to);
            out.push_back('\n');

            if (isBackEdge(edge.name))
                continue;

            sgVertexIndex const index = store.indexOf(edge.to);
            if (expanded[index] != 0)
                continue;

            expanded[index] = 1;
            stack.pushBack(Frame{store.firstEdge(edge.to), depth + 1});
        }

        return fmt::to_string(out);
    }

    std::string sgRenderDot(sgGraph const& graph)
    {
        sgGraphStore const& store = sgStoreOf(graph);

        fmt::memory_buffer out;
        fmt::format_to(std::back_inserter(out), "digraph sodg {{\n");

        uint32_t const vertexCount = store.vertexCount();
        for (uint32_t index = 0; index != vertexCount; ++index)
        {
            sgVertexId const vertex = store.vertexAt(index);
            fmt::format_to(std::back_inserter(out), "  v{} [label=\"ν{}", vertex.value(), vertex.value());

            sgBytes payload;
            if (store.data(vertex, payload))
            {
                fmt::format_to(std::back_inserter(out), "\\nΔ ");
                appendBytes(out, payload);
            }
            fmt::format_to(std::back_inserter(out), "\"];\n");
        }

        uint32_t const edgeCount = store.edgeCount();
        for (uint32_t index = 0; index != edgeCount; ++index)
        {
            sgEdgeRecord const& edge = store.edgeRecord(sgEdgeIndex{index});
            fmt::format_to(std::back_inserter(out), "  v{} -> v{} [label=\"", edge.from.value(), edge.to.value());
            appendEscaped(out, view(edge.name.name()));
            fmt::format_to(std::back_inserter(out), "\"];\n");
        }

        fmt::format_to(std::back_inserter(out), "}}\n");
        return fmt::to_string(out);
    }
} // namespace surge
