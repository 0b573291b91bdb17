//
// Created by Malik T on 26/09/2025.
//
#include "GlobalSolver.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <utility>
#include "BeliefState.hpp"
#include "Exception.hpp"
#include "Log.hpp"

namespace bomb::core
{
    auto SignatureCache::Find(std::string const& key) const -> std::shared_ptr<SignatureSet const>
    {
        std::lock_guard<std::mutex> lock(m_);
        auto const it = map_.find(key);
        if (it == map_.end()) return nullptr;
        ++hits_;
        return it->second;
    }

    auto SignatureCache::Store(std::string key, std::shared_ptr<SignatureSet const> sigs) -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        map_.try_emplace(std::move(key), std::move(sigs));
    }

    auto SignatureCache::Size() const -> size_t
    {
        std::lock_guard<std::mutex> lock(m_);
        return map_.size();
    }

    static auto CheckDeadline(Deadline deadline, char const* phase) -> void
    {
        if (std::chrono::steady_clock::now() > deadline)
            BMB_THROW(error::Code::Timeout, std::format("global solver deadline exceeded during {}", phase));
    }

    // a + b, or false if any coordinate passes the cap
    static auto AddCapped(ResourceVec const& a, ResourceVec const& b, ResourceVec const& cap, ResourceVec& out) -> bool
    {
        out.resize(a.size());
        for (size_t i{}; i < a.size(); ++i)
        {
            unsigned const s = static_cast<unsigned>(a[i]) + b[i];
            if (s > cap[i]) return false;
            out[i] = static_cast<uint8_t>(s);
        }
        return true;
    }

    // a - b, or false if it goes negative
    static auto Subtract(ResourceVec const& a, ResourceVec const& b, ResourceVec& out) -> bool
    {
        out.resize(a.size());
        for (size_t i{}; i < a.size(); ++i)
        {
            if (b[i] > a[i]) return false;
            out[i] = static_cast<uint8_t>(a[i] - b[i]);
        }
        return true;
    }

    GlobalSolver::GlobalSolver(std::shared_ptr<TaskPool> pool) :
        pool_(std::move(pool)),
        cache_(std::make_shared<SignatureCache>())
    {
    }

    auto GlobalSolver::MakeJob(BeliefState const& state, PlyrIdxT p) -> SignatureJob
    {
        SignatureJob job{};
        job.player = p;
        job.beliefs = state.Grid()[p];
        job.deck = state.Domain().Deck();
        job.min_counts.assign(job.deck.size(), 0);
        for (ValueSet const s : job.beliefs)
            if (s.IsSingle()) ++job.min_counts[s.Min()];
        for (ValueTracker const& t : state.Trackers())
            if (t.IsCalled(p)) ++job.min_counts[t.Value()];
        job.constraints = state.Constraints().ForPlayer(p);
        return job;
    }

    auto GlobalSolver::CollectSignatures(BeliefState const& state, Deadline deadline)
        -> std::vector<std::shared_ptr<SignatureSet const>>
    {
        PlyrIdxT const n = state.PlayerCount();
        std::vector<std::shared_ptr<SignatureSet const>> sets(n);

        struct Pending
        {
            PlyrIdxT player;
            std::string key;
            std::future<SignatureSet> fut;
        };
        std::vector<Pending> pending;

        // nested solves from inside a worker run inline so the pool cannot starve
        bool const inline_mode = !pool_ || pool_->InWorker();

        for (PlyrIdxT p{}; p < n; ++p)
        {
            SignatureJob job = MakeJob(state, p);
            std::string key = job.CacheKey();
            if (auto hit = cache_->Find(key))
            {
                sets[p] = std::move(hit);
                continue;
            }
            if (inline_mode)
            {
                sets[p] = std::make_shared<SignatureSet const>(GenerateSignatures(job, deadline));
                cache_->Store(std::move(key), sets[p]);
                continue;
            }
            pending.push_back({p, std::move(key), pool_->Submit([job = std::move(job), deadline]()
            {
                return GenerateSignatures(job, deadline);
            })});
        }

        for (Pending& job : pending)
        {
            if (job.fut.wait_until(deadline) != std::future_status::ready)
                BMB_THROW(error::Code::Timeout,
                          std::format("signature worker for P{} missed the deadline", static_cast<int>(job.player)));
            // rethrows whatever the worker threw
            sets[job.player] = std::make_shared<SignatureSet const>(job.fut.get());
            cache_->Store(std::move(job.key), sets[job.player]);
        }
        return sets;
    }

    auto GlobalSolver::Solve(BeliefState const& state) -> SolveOutcome
    {
        Deadline const deadline = std::chrono::steady_clock::now() + state.Cfg().solver_timeout;
        PlyrIdxT const n = state.PlayerCount();
        SlotIdxT const W = state.HandSize();
        ResourceVec const& deck = state.Domain().Deck();
        ResourceVec const zero(deck.size(), 0);

        SolveOutcome out{};

        // Phase 1: candidate hands per player
        std::vector<std::shared_ptr<SignatureSet const>> const sigs = CollectSignatures(state, deadline);
        for (PlyrIdxT p{}; p < n; ++p)
        {
            if (sigs[p]->empty())
            {
                out.status = SolveStatus::Contradiction;
                out.detail = std::format("P{} has no hand consistent with its candidates", static_cast<int>(p));
                return out;
            }
        }

        // Phase 2: sums reachable by players [0, i)
        ResourceVec tmp;
        std::vector<SignatureSet> alpha(n + 1);
        alpha[0].insert(zero);
        for (PlyrIdxT i{}; i < n; ++i)
        {
            for (ResourceVec const& a : alpha[i])
            {
                for (ResourceVec const& s : *sigs[i])
                    if (AddCapped(a, s, deck, tmp)) alpha[i + 1].insert(tmp);
            }
            CheckDeadline(deadline, "forward pass");
        }
        if (!alpha[n].contains(deck))
        {
            out.status = SolveStatus::Contradiction;
            out.detail = "no combination of hands adds up to the deck";
            return out;
        }

        // Phase 3: sums reachable by players [i, n)
        std::vector<SignatureSet> beta(n + 1);
        beta[n].insert(zero);
        for (PlyrIdxT i = n; i-- > 0;)
        {
            for (ResourceVec const& b : beta[i + 1])
            {
                for (ResourceVec const& s : *sigs[i])
                    if (AddCapped(b, s, deck, tmp)) beta[i].insert(tmp);
            }
            CheckDeadline(deadline, "backward pass");
        }

        // Phase 4: keep signatures whose remainder splits across the other players
        out.grid = state.Grid();
        out.valid_signatures.resize(n);
        ResourceVec rem;
        ResourceVec rest;
        for (PlyrIdxT p{}; p < n; ++p)
        {
            SignatureSet const& before = alpha[p];
            SignatureSet const& after = beta[p + 1];
            bool const scan_before = before.size() <= after.size();
            SignatureSet const& scan = scan_before ? before : after;
            SignatureSet const& other_side = scan_before ? after : before;

            Hand domains(W, ValueSet{});
            for (ResourceVec const& s : *sigs[p])
            {
                if (!Subtract(deck, s, rem)) continue;
                bool const valid = std::ranges::any_of(scan, [&](ResourceVec const& part)
                {
                    return Subtract(rem, part, rest) && other_side.contains(rest);
                });
                if (!valid) continue;

                out.valid_signatures[p].push_back(s);
                std::vector<ValueIdxT> const hand = ExpandSignature(s);
                for (SlotIdxT slot{}; slot < W; ++slot)
                    domains[slot].Insert(hand[slot]);
            }
            CheckDeadline(deadline, "projection");

            for (SlotIdxT slot{}; slot < W; ++slot)
            {
                ValueSet const next = out.grid[p][slot] & domains[slot];
                if (next.Empty())
                {
                    out.status = SolveStatus::Contradiction;
                    out.detail = std::format("P{}[{}] has no globally consistent value",
                                             static_cast<int>(p), static_cast<int>(slot));
                    return out;
                }
                out.grid[p][slot] = next;
            }
        }

        log::Info(state.Cfg().verbose, "global solver: {} cached signature sets, {} cache hits",
                  cache_->Size(), cache_->Hits());
        return out;
    }
}
