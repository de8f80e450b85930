// surge

#pragma once

#include "surge/errors.hh"
#include "surge/export.hh"
#include "surge/types.hh"

#include <cstdint>

namespace surge {
    class sgAllocator;
    class sgDataizeHost;
    class sgGraph;
    class sgLogger;

    struct sgDataizeConfig final
    {
        // nested dataize/resolve frames before DepthExceeded
        uint32_t maxDepth = 1024;
        // longest π chain or ρ walk followed by one lookup
        uint32_t maxChain = 256;
    };

    /// Reduces vertices of one graph to bytes. Results and failures are
    /// memoized on the vertices themselves for the life of the graph, and
    /// evaluation may add vertices and edges (copies bound to their context).
    /// Calls serialize on the graph's write lock.
    class sgDataizer
    {
    public:
        virtual void setConfig(sgDataizeConfig const& config) noexcept = 0;
        virtual void setLogger(sgLogger* logger) noexcept = 0;

        // out_bytes stays valid until the next call on this dataizer
        [[nodiscard]] virtual bool dataize(sgVertexId vertex, sgBytes& out_bytes) = 0;

        // walks a dotted locator from the root (foo.bar, Φ.foo.bar), then dataizes
        [[nodiscard]] virtual bool dataizeLocator(char const* locator, char const* locatorEnd, sgBytes& out_bytes) = 0;

        // the object vertex a locator denotes, without dataizing it
        [[nodiscard]] virtual bool locate(char const* locator, char const* locatorEnd, sgVertexId& out_vertex) = 0;

        // errors of the most recent call
        [[nodiscard]] virtual uint32_t getErrorCount() const noexcept = 0;
        [[nodiscard]] virtual sgError getError(uint32_t index) const noexcept = 0;

    protected:
        ~sgDataizer() = default;
    };

    [[nodiscard]] SG_API sgDataizer* sgCreateDataizer(sgAllocator& alloc, sgDataizeHost& host, sgGraph& graph);
    SG_API void sgDestroyDataizer(sgDataizer* dataizer);
} // namespace surge
