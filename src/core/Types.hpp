//
// Created by Malik T on 14/08/2025.
//

#ifndef BOMBBUSTER_TYPES_HPP
#define BOMBBUSTER_TYPES_HPP

#define BMB_ENABLE_TEST_HOOKS true

#include <chrono>
#include <compare>
#include <cstdint>
#include <vector>

namespace bomb::core::constants
{
    // ValueSet is a 64 bit mask indexed by value rank
    inline constexpr size_t MaxValues = 64;
    inline constexpr size_t MaxHandSize = 64;
}
namespace bomb::core
{
    using PlyrIdxT = uint8_t;
    using SlotIdxT = uint8_t;
    using ValueIdxT = uint8_t;
    using WireValue = double;

    struct SlotRef
    {
        PlyrIdxT player{};
        SlotIdxT slot{};

        auto operator<=>(SlotRef const&) const = default;
    };

    struct WireCount
    {
        WireValue value{};
        uint8_t copies{};
    };

    inline auto DefaultDistribution() -> std::vector<WireCount>
    {
        std::vector<WireCount> d;
        for (int v = 1; v <= 12; ++v)
            d.push_back({static_cast<WireValue>(v), 4});
        d.push_back({6.5, 1});
        d.push_back({1.1, 1});
        d.push_back({3.1, 1});
        d.push_back({5.1, 1});
        d.push_back({2.1, 1});
        d.push_back({99.0, 2});
        return d;
    }

    struct Config
    {
        std::vector<WireCount> distribution{DefaultDistribution()};
        uint32_t n_players{5};
        // informal play with physical cards, owner possession is not checked
        bool     playing_irl{false};
        bool     use_global_solver{true};
        std::chrono::milliseconds solver_timeout{std::chrono::seconds(5ULL)};
        // 0 = std::thread::hardware_concurrency()
        uint32_t worker_threads{0};
        uint32_t max_filter_iterations{100};
        uint8_t  subset_filter_max_size{4};
        uint8_t  max_uncertainty{3};
        uint64_t double_chance_max_hands{1'000'000};
        bool     verbose{false};
    };
}

#endif //BOMBBUSTER_TYPES_HPP
