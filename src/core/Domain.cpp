//
// Created by Malik T on 02/10/2025.
//

#include "Domain.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <ranges>
#include "Exception.hpp"

namespace bomb::core
{
    namespace
    {
        constexpr WireValue ValueEpsilon = 1e-9;
    }

    ValueDomain::ValueDomain(Config const& cfg)
    {
        using error::Code;
        if (cfg.n_players < 2)
            BMB_THROW(Code::Config, std::format("need at least 2 players, got {}", cfg.n_players));
        if (cfg.distribution.empty())
            BMB_THROW(Code::Config, "empty wire distribution");
        if (cfg.distribution.size() > constants::MaxValues)
            BMB_THROW(Code::Config, std::format("at most {} distinct values supported, got {}",
                                                constants::MaxValues, cfg.distribution.size()));

        std::vector<WireCount> dist = cfg.distribution;
        std::ranges::sort(dist, {}, &WireCount::value);
        for (size_t i{}; i < dist.size(); ++i)
        {
            if (dist[i].copies == 0)
                BMB_THROW(Code::Config, std::format("value {} has zero copies", dist[i].value));
            if (i > 0 && std::abs(dist[i].value - dist[i - 1].value) < ValueEpsilon)
                BMB_THROW(Code::Config, std::format("value {} listed twice", dist[i].value));
            values_.push_back(dist[i].value);
            deck_.push_back(dist[i].copies);
        }

        total_ = std::accumulate(deck_.begin(), deck_.end(), size_t{0});
        if (total_ % cfg.n_players != 0)
            BMB_THROW(Code::Config, std::format("{} wires cannot be split evenly between {} players",
                                                total_, cfg.n_players));
        size_t const hand = total_ / cfg.n_players;
        if (hand == 0 || hand > constants::MaxHandSize)
            BMB_THROW(Code::Config, std::format("hand size {} out of range [1, {}]", hand, constants::MaxHandSize));
        if (cfg.n_players > 255)
            BMB_THROW(Code::Config, "too many players");

        n_players_ = static_cast<PlyrIdxT>(cfg.n_players);
        hand_size_ = static_cast<SlotIdxT>(hand);
    }

    auto ValueDomain::IndexOf(WireValue value) const -> std::optional<ValueIdxT>
    {
        auto const it = std::ranges::lower_bound(values_, value - ValueEpsilon);
        if (it == values_.end() || std::abs(*it - value) >= ValueEpsilon)
            return std::nullopt;
        return static_cast<ValueIdxT>(std::distance(values_.begin(), it));
    }

    auto ValueDomain::Format(ValueIdxT v) const -> std::string
    {
        return std::format("{}", values_.at(v));
    }

    auto ValueDomain::Format(ValueSet s) const -> std::string
    {
        std::string body;
        bool first = true;
        for (ValueIdxT v : s)
        {
            body += (first ? "" : ",");
            body += Format(v);
            first = false;
        }
        return std::format("{{{}}}", body);
    }
}
