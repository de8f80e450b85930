// surge

#pragma once

#include <compare>
#include <cstdint>

namespace surge {
    /// Strongly typed identifier; two keys of different tags never compare.
    /// The all-ones value is reserved as the tag's invalid key.
    template <typename TagT, typename UnderlyingT>
    class sgKey
    {
    public:
        using underlying_type = UnderlyingT;

        static constexpr UnderlyingT invalid_value = static_cast<UnderlyingT>(~UnderlyingT{0});

        constexpr explicit sgKey(UnderlyingT value) noexcept : value_(value) {}

        constexpr UnderlyingT value() const noexcept { return value_; }
        constexpr bool valid() const noexcept { return value_ != invalid_value; }

        constexpr std::strong_ordering operator<=>(sgKey const&) const noexcept = default;
        constexpr bool operator==(sgKey const&) const noexcept = default;

    private:
        UnderlyingT value_;
    };
} // namespace surge

// clang-format off
#define SG_DEFINE_KEY(name, base) \
    class name final : public ::surge::sgKey<class name, base> { public: using sgKey::sgKey; }
// clang-format on
