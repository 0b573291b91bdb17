//
// Created by Malik T on 03/10/2025.
//
#include "EntropySuggester.hpp"

#include <algorithm>
#include <format>
#include <future>
#include "Statistics.hpp"

namespace bomb::core
{
    EntropySuggester::EntropySuggester(std::shared_ptr<TaskPool> pool) : pool_(std::move(pool)) {}

    auto EntropySuggester::Candidates(BeliefState const& state, uint8_t max_uncertainty) -> std::vector<CallCandidate>
    {
        std::vector<CallCandidate> out;
        ValueSet const playable = stats::PlayableValues(state);
        if (playable.Empty()) return out;

        for (PlyrIdxT t{}; t < state.PlayerCount(); ++t)
        {
            if (t == state.Owner()) continue;
            for (SlotIdxT s{}; s < state.HandSize(); ++s)
            {
                if (state.IsRevealed(t, s)) continue;
                ValueSet const cand = state.Candidates(t, s);
                if (cand.Size() > max_uncertainty) continue;
                for (ValueIdxT const v : cand & playable)
                    out.push_back({t, s, v, static_cast<uint8_t>(cand.Size())});
            }
        }
        return out;
    }

    auto EntropySuggester::Evaluate(BeliefState const& state, CallCandidate const& call, double current_entropy)
        -> CandidateScore
    {
        CandidateScore sc{.call = call};
        sc.p_success = 1.0 / static_cast<double>(call.n_possible);
        SlotRef const at{call.target, call.slot};

        BeliefState success = state;
        success.AssumeValue(at, call.value);
        success.ApplyFilters();
        sc.h_success = stats::SystemEntropy(success);

        if (sc.p_success < 1.0)
        {
            BeliefState failure = state;
            failure.AssumeNotValue(at, call.value);
            failure.ApplyFilters();
            sc.h_failure = stats::SystemEntropy(failure);
        }

        sc.expected_entropy = sc.p_success * sc.h_success + (1.0 - sc.p_success) * sc.h_failure;
        sc.info_gain = current_entropy - sc.expected_entropy;
        return sc;
    }

    auto EntropySuggester::SuggestBestCall(BeliefState const& state, SuggestOptions const& opts) const -> Suggestion
    {
        auto const start = std::chrono::steady_clock::now();
        Suggestion out;
        out.current_entropy = stats::SystemEntropy(state);

        std::vector<CallCandidate> const cands = Candidates(state, opts.max_uncertainty);
        size_t const total = cands.size();
        auto const report = [&](size_t done, std::string_view msg)
        {
            if (opts.progress) opts.progress(done, total, msg);
        };

        out.details.reserve(total);
        bool const fan_out = opts.parallel && pool_ && !pool_->InWorker() && total > 1;
        if (fan_out)
        {
            std::vector<std::future<CandidateScore>> futs;
            futs.reserve(total);
            for (CallCandidate const& c : cands)
            {
                futs.push_back(pool_->Submit([&state, c, h = out.current_entropy]()
                {
                    return Evaluate(state, c, h);
                }));
            }
            // every task borrows `state`, so all of them finish before any get() may throw
            for (size_t i{}; i < futs.size(); ++i)
            {
                futs[i].wait();
                report(i + 1, "evaluated");
            }
            for (std::future<CandidateScore>& f : futs)
                out.details.push_back(f.get());
        }
        else
        {
            for (size_t i{}; i < total; ++i)
            {
                out.details.push_back(Evaluate(state, cands[i], out.current_entropy));
                report(i + 1, "evaluated");
            }
        }
        report(total, "analysis complete");

        std::ranges::stable_sort(out.details, std::ranges::greater{}, &CandidateScore::info_gain);
        out.analyzed = out.details.size();
        if (!out.details.empty())
        {
            out.best = out.details.front().call;
            out.expected_entropy = out.details.front().expected_entropy;
            out.information_gain = out.details.front().info_gain;
        }
        out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        return out;
    }
}
