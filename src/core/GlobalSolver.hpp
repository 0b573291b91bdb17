//
// Created by Malik T on 26/09/2025.
//

#ifndef BOMBBUSTER_GLOBALSOLVER_HPP
#define BOMBBUSTER_GLOBALSOLVER_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Signatures.hpp"
#include "TaskPool.hpp"
#include "Types.hpp"
#include "ValueSet.hpp"

namespace bomb::core
{
    class BeliefState;

    enum class SolveStatus : uint8_t
    {
        Solved,
        Contradiction
    };

    struct SolveOutcome
    {
        SolveStatus status{SolveStatus::Solved};
        // projected candidate sets, already intersected with the input grid
        BeliefGrid grid;
        // [player] signatures that extend to the full deck
        std::vector<std::vector<ResourceVec>> valid_signatures;
        std::string detail;
    };

    // Signature sets keyed by the exact inputs that produced them.
    class SignatureCache
    {
    public:
        auto Find(std::string const& key) const -> std::shared_ptr<SignatureSet const>;
        auto Store(std::string key, std::shared_ptr<SignatureSet const> sigs) -> void;
        auto Size() const -> size_t;
        auto Hits() const noexcept -> uint64_t { return hits_.load(); }

    private:
        mutable std::mutex m_;
        std::unordered_map<std::string, std::shared_ptr<SignatureSet const>> map_;
        mutable std::atomic<uint64_t> hits_{0};
    };

    // Exact multiset consistency over all hands:
    // per-player signatures, forward/backward reachable sums, projection.
    class GlobalSolver
    {
    public:
        explicit GlobalSolver(std::shared_ptr<TaskPool> pool = nullptr);

        // Throws TimeoutError when the state's solver_timeout runs out.
        auto Solve(BeliefState const& state) -> SolveOutcome;

        static auto MakeJob(BeliefState const& state, PlyrIdxT p) -> SignatureJob;

        auto Cache() const noexcept -> SignatureCache const& { return *cache_; }
        auto Pool() const noexcept -> std::shared_ptr<TaskPool> const& { return pool_; }

    private:
        auto CollectSignatures(BeliefState const& state, Deadline deadline)
            -> std::vector<std::shared_ptr<SignatureSet const>>;

        std::shared_ptr<TaskPool> pool_;
        std::shared_ptr<SignatureCache> cache_;
    };
}

#endif //BOMBBUSTER_GLOBALSOLVER_HPP
