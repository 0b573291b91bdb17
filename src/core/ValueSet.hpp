//
// Created by Malik T on 14/08/2025.
//

#ifndef BOMBBUSTER_VALUESET_HPP
#define BOMBBUSTER_VALUESET_HPP

#include <bit>
#include <cstdint>
#include <iterator>
#include "Types.hpp"

namespace bomb::core
{
    // Set of value ranks packed in a single word. Bit i set <=> rank i possible.
    class ValueSet
    {
    public:
        class Iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = ValueIdxT;
            using difference_type = std::ptrdiff_t;

            Iterator() = default;
            explicit Iterator(uint64_t bits) : bits_(bits) {}

            auto operator*() const -> ValueIdxT { return static_cast<ValueIdxT>(std::countr_zero(bits_)); }
            auto operator++() -> Iterator&
            {
                bits_ &= bits_ - 1;
                return *this;
            }
            auto operator++(int) -> Iterator
            {
                Iterator tmp = *this;
                ++*this;
                return tmp;
            }
            auto operator==(Iterator const&) const -> bool = default;

        private:
            uint64_t bits_{0};
        };

        constexpr ValueSet() = default;
        constexpr explicit ValueSet(uint64_t bits) : bits_(bits) {}

        static constexpr auto Single(ValueIdxT v) -> ValueSet { return ValueSet{uint64_t{1} << v}; }

        // ranks [0, n)
        static constexpr auto FirstN(size_t n) -> ValueSet
        {
            return ValueSet{n >= 64 ? ~uint64_t{0} : (uint64_t{1} << n) - 1};
        }

        // ranks [0, v]
        static constexpr auto UpTo(ValueIdxT v) -> ValueSet { return FirstN(static_cast<size_t>(v) + 1); }

        // ranks [v, 63]
        static constexpr auto From(ValueIdxT v) -> ValueSet { return ValueSet{~uint64_t{0} << v}; }

        [[nodiscard]] constexpr auto Bits() const -> uint64_t { return bits_; }
        [[nodiscard]] constexpr auto Contains(ValueIdxT v) const -> bool { return (bits_ >> v) & 1U; }
        [[nodiscard]] constexpr auto Size() const -> size_t { return static_cast<size_t>(std::popcount(bits_)); }
        [[nodiscard]] constexpr auto Empty() const -> bool { return bits_ == 0; }
        [[nodiscard]] constexpr auto IsSingle() const -> bool { return std::has_single_bit(bits_); }
        // undefined on an empty set
        [[nodiscard]] constexpr auto Min() const -> ValueIdxT { return static_cast<ValueIdxT>(std::countr_zero(bits_)); }
        [[nodiscard]] constexpr auto Max() const -> ValueIdxT { return static_cast<ValueIdxT>(63 - std::countl_zero(bits_)); }

        constexpr auto Insert(ValueIdxT v) -> void { bits_ |= uint64_t{1} << v; }
        constexpr auto Erase(ValueIdxT v) -> void { bits_ &= ~(uint64_t{1} << v); }

        [[nodiscard]] constexpr auto Intersects(ValueSet o) const -> bool { return (bits_ & o.bits_) != 0; }
        [[nodiscard]] constexpr auto IsSubsetOf(ValueSet o) const -> bool { return (bits_ & ~o.bits_) == 0; }

        constexpr auto operator&(ValueSet o) const -> ValueSet { return ValueSet{bits_ & o.bits_}; }
        constexpr auto operator|(ValueSet o) const -> ValueSet { return ValueSet{bits_ | o.bits_}; }
        constexpr auto operator&=(ValueSet o) -> ValueSet&
        {
            bits_ &= o.bits_;
            return *this;
        }
        constexpr auto operator|=(ValueSet o) -> ValueSet&
        {
            bits_ |= o.bits_;
            return *this;
        }
        constexpr auto operator==(ValueSet const&) const -> bool = default;

        [[nodiscard]] auto begin() const -> Iterator { return Iterator{bits_}; }
        [[nodiscard]] auto end() const -> Iterator { return Iterator{}; }

    private:
        uint64_t bits_{0};
    };

    using Hand = std::vector<ValueSet>;
    using BeliefGrid = std::vector<Hand>;
}

#endif //BOMBBUSTER_VALUESET_HPP
