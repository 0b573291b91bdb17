//
// Created by Malik T on 02/10/2025.
//

#ifndef BOMBBUSTER_DOMAIN_HPP
#define BOMBBUSTER_DOMAIN_HPP

#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "ValueSet.hpp"

namespace bomb::core
{
    // Sorted value domain derived from a Config. Everything inside the engine
    // works on value ranks; WireValue only appears at the boundaries.
    class ValueDomain
    {
    public:
        explicit ValueDomain(Config const& cfg);

        auto Size() const noexcept -> size_t { return values_.size(); }
        auto NPlayers() const noexcept -> PlyrIdxT { return n_players_; }
        auto HandSize() const noexcept -> SlotIdxT { return hand_size_; }
        auto TotalWires() const noexcept -> size_t { return total_; }

        auto ValueAt(ValueIdxT v) const -> WireValue { return values_.at(v); }
        auto Copies(ValueIdxT v) const -> uint8_t { return deck_.at(v); }
        auto IndexOf(WireValue value) const -> std::optional<ValueIdxT>;

        auto FullSet() const noexcept -> ValueSet { return ValueSet::FirstN(values_.size()); }
        // copies per rank
        auto Deck() const noexcept -> std::vector<uint8_t> const& { return deck_; }
        auto Values() const noexcept -> std::vector<WireValue> const& { return values_; }

        auto Format(ValueIdxT v) const -> std::string;
        auto Format(ValueSet s) const -> std::string;

    private:
        std::vector<WireValue> values_;
        std::vector<uint8_t> deck_;
        size_t total_{};
        PlyrIdxT n_players_{};
        SlotIdxT hand_size_{};
    };
}

#endif //BOMBBUSTER_DOMAIN_HPP
