// surge

#pragma once

#include "surge/key.hh"

#include <cstdint>

namespace surge {
    class sgNativeContext;

    // graph identifiers
    SG_DEFINE_KEY(sgVertexId, uint32_t);
    SG_DEFINE_KEY(sgEdgeId, uint32_t);

    // the root namespace; exists in every graph
    static constexpr sgVertexId sgRootVertexId{0};

    // invalid ids
    static constexpr sgVertexId sgInvalidVertexId{sgVertexId::invalid_value};
    static constexpr sgEdgeId sgInvalidEdgeId{sgEdgeId::invalid_value};

    // system attribute names, UTF-8 encoded
    namespace sgAttr {
        static constexpr char rho[] = "ρ";
        static constexpr char lambda[] = "λ";
        static constexpr char delta[] = "Δ";
        static constexpr char pi[] = "π";
        static constexpr char xi[] = "ξ";
        static constexpr char beta[] = "β";
        static constexpr char epsilon[] = "ε";
        static constexpr char phi[] = "φ";
        static constexpr char alpha[] = "α"; // followed by a decimal index
    } // namespace sgAttr

    struct sgName
    {
        char const* name = nullptr;
        char const* nameEnd = nullptr;
    };

    struct sgBytes
    {
        uint8_t const* data = nullptr;
        uint32_t size = 0;
    };

    enum class sgNativeKind : uint8_t
    {
        // receives the dataized receiver (ρ) ahead of the positional arguments
        Method,
        // receives only the positional arguments
        Function,
    };

    using sgNativeFunction = bool (*)(sgNativeContext& context, void* userData);
} // namespace surge
