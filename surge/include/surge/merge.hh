// surge

#pragma once

#include "surge/errors.hh"
#include "surge/export.hh"

namespace surge {
    class sgGraph;

    /// Folds incoming into base. Every non-root vertex of incoming is
    /// renumbered above base.nextVertexId() and root-level names are merged.
    /// A root name bound in both graphs fails with NameCollision and leaves
    /// base untouched. Merges into one base serialize on its write lock.
    [[nodiscard]] SG_API bool sgMerge(sgGraph& base, sgGraph const& incoming, sgError& out_error);
} // namespace surge
