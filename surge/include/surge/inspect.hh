// surge

#pragma once

#include "surge/export.hh"
#include "surge/types.hh"

#include <string>

namespace surge {
    class sgGraph;

    /// Uppercase hex octets joined by '-', e.g. 00-2A; "--" for no bytes.
    [[nodiscard]] SG_API std::string sgFormatBytes(sgBytes bytes);

    /// Attribute tree below a vertex, one `.name ➞ νN` line per edge. ρ and π
    /// edges are listed but not followed, and a vertex is expanded only once.
    [[nodiscard]] SG_API std::string sgInspect(sgGraph const& graph, sgVertexId vertex = sgRootVertexId);

    /// The whole graph as a graphviz digraph.
    [[nodiscard]] SG_API std::string sgRenderDot(sgGraph const& graph);
} // namespace surge
