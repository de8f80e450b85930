// surge

#pragma once

#include "surge/errors.hh"
#include "surge/export.hh"
#include "surge/types.hh"

#include <cstdint>

namespace surge {
    class sgAllocator;
    class sgGraph;
    class sgLogger;

    /// Applies SODG construction text to a graph:
    ///
    ///     ADD($ν1);                    # $-aliases get fresh ids per unit
    ///     BIND(ν0, $ν1, foo);
    ///     PUT($ν1, 00-00-00-00-00-00-00-2A);
    ///
    /// Instructions apply strictly in order; assembly stops at the first
    /// failing instruction. The graph then holds everything applied before
    /// it and should be discarded by the caller.
    class sgAssembler
    {
    public:
        // forgets aliases, errors and counters; keeps root and logger
        virtual void reset() = 0;

        // literal ν0 in the source refers to this vertex; sgRootVertexId by default
        virtual void setRoot(sgVertexId root) noexcept = 0;

        virtual void setLogger(sgLogger* logger) noexcept = 0;

        // each call is one unit; aliases do not carry over between calls
        [[nodiscard]] virtual bool assemble(sgGraph& graph, char const* source, char const* sourceEnd = nullptr) = 0;

        // instructions applied by the most recent assemble()
        [[nodiscard]] virtual uint32_t instructionCount() const noexcept = 0;

        // identifier an alias was given in the most recent assemble(); false if unknown
        [[nodiscard]] virtual bool lookupAlias(char const* alias, sgVertexId& out_vertex) const noexcept = 0;

        [[nodiscard]] virtual uint32_t getErrorCount() const noexcept = 0;
        [[nodiscard]] virtual sgError getError(uint32_t index) const noexcept = 0;

    protected:
        ~sgAssembler() = default;
    };

    [[nodiscard]] SG_API sgAssembler* sgCreateAssembler(sgAllocator& alloc);
    SG_API void sgDestroyAssembler(sgAssembler* assembler);
} // namespace surge
