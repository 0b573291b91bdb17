//
// Created by Malik T on 03/10/2025.
//

#ifndef BOMBBUSTER_ENTROPYSUGGESTER_HPP
#define BOMBBUSTER_ENTROPYSUGGESTER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>
#include "BeliefState.hpp"
#include "TaskPool.hpp"
#include "Types.hpp"

namespace bomb::core
{
    struct CallCandidate
    {
        PlyrIdxT target{};
        SlotIdxT slot{};
        ValueIdxT value{};
        uint8_t n_possible{};
    };

    struct CandidateScore
    {
        CallCandidate call;
        double p_success{};
        double h_success{};
        double h_failure{};
        double expected_entropy{};
        double info_gain{};
    };

    struct Suggestion
    {
        std::optional<CallCandidate> best;
        double current_entropy{};
        double expected_entropy{};
        double information_gain{};
        size_t analyzed{};
        std::chrono::milliseconds elapsed{};
        // descending info gain, ties in evaluation order
        std::vector<CandidateScore> details;
    };

    struct SuggestOptions
    {
        uint8_t max_uncertainty{3};
        bool parallel{true};
        // (done, total, message)
        std::function<void(size_t, size_t, std::string_view)> progress;
    };

    // Picks the call whose outcomes shrink total entropy the most in expectation.
    // Every candidate is simulated on its own clone of the state.
    class EntropySuggester
    {
    public:
        explicit EntropySuggester(std::shared_ptr<TaskPool> pool = nullptr);

        auto SuggestBestCall(BeliefState const& state, SuggestOptions const& opts) const -> Suggestion;

        // Targets ascending, then slots, then values.
        static auto Candidates(BeliefState const& state, uint8_t max_uncertainty) -> std::vector<CallCandidate>;
        static auto Evaluate(BeliefState const& state, CallCandidate const& call, double current_entropy) -> CandidateScore;

    private:
        std::shared_ptr<TaskPool> pool_;
    };
}

#endif //BOMBBUSTER_ENTROPYSUGGESTER_HPP
