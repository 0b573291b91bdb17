//
// Created by Malik T on 26/09/2025.
//

#ifndef BOMBBUSTER_SIGNATURES_HPP
#define BOMBBUSTER_SIGNATURES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>
#include "State.hpp"
#include "Types.hpp"
#include "ValueSet.hpp"

namespace bomb::core
{
    // Copies consumed per value rank. Used for the deck and for (partial) hands.
    using ResourceVec = std::vector<uint8_t>;

    struct ResourceVecHash
    {
        auto operator()(ResourceVec const& r) const noexcept -> size_t
        {
            // FNV-1a
            uint64_t h = 1469598103934665603ULL;
            for (uint8_t const c : r)
            {
                h ^= c;
                h *= 1099511628211ULL;
            }
            return static_cast<size_t>(h);
        }
    };

    using SignatureSet = std::unordered_set<ResourceVec, ResourceVecHash>;
    using Deadline = std::chrono::steady_clock::time_point;

    // Value copy of everything signature generation reads for one player.
    struct SignatureJob
    {
        PlyrIdxT player{};
        Hand beliefs;
        ResourceVec deck;
        ResourceVec min_counts;
        SlotConstraints constraints;

        // exact byte image of the inputs
        auto CacheKey() const -> std::string;
    };

    // Every sorted hand consistent with the job, as count vectors.
    // Throws TimeoutError once the deadline has passed.
    auto GenerateSignatures(SignatureJob const& job, Deadline deadline) -> SignatureSet;

    // Sorted hand described by a count vector.
    auto ExpandSignature(ResourceVec const& sig) -> std::vector<ValueIdxT>;
}

#endif //BOMBBUSTER_SIGNATURES_HPP
