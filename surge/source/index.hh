// surge

#pragma once

#include "surge/key.hh"

#include <cstdint>

namespace surge {
    // converts to any index type as its invalid value
    static constexpr struct sgInvalidIndexTag
    {
    } sgInvalidIndex;

    /// Dense position in one of a component's private tables. Unlike public
    /// keys an index defaults to invalid, so link fields start unlinked.
    template <typename DerivedT>
    class sgIndex : public sgKey<DerivedT, uint32_t>
    {
    public:
        constexpr explicit sgIndex(uint32_t value) noexcept : sgKey<DerivedT, uint32_t>(value) {}
        constexpr sgIndex() noexcept : sgKey<DerivedT, uint32_t>(sgKey<DerivedT, uint32_t>::invalid_value) {}
        constexpr sgIndex(sgInvalidIndexTag) noexcept : sgIndex() {}

        constexpr explicit operator uint32_t() const noexcept { return this->value(); }
    };
} // namespace surge

// clang-format off
#define SG_DEFINE_INDEX(name) \
    class name final : public ::surge::sgIndex<class name> { public: using sgIndex::sgIndex; }
// clang-format on
