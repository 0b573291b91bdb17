//
// Created by Malik T on 26/09/2025.
//

#include "Signatures.hpp"

#include <algorithm>
#include <format>
#include "Exception.hpp"

namespace bomb::core
{
    namespace
    {
        constexpr uint64_t DeadlineCheckMask = 1023;

        class SignatureBuilder
        {
        public:
            SignatureBuilder(SignatureJob const& job, Deadline deadline) :
                job_(job),
                deadline_(deadline),
                hand_(job.beliefs.size()),
                counts_(job.deck.size(), 0),
                adjacent_(job.beliefs.size(), -1)
            {
                for (AdjacentConstraint const& c : job.constraints.adjacent)
                {
                    if (c.low + 1u < adjacent_.size())
                        adjacent_[c.low + 1] = c.is_equal ? 1 : 0;
                }
            }

            auto Run() -> SignatureSet
            {
                Recurse(0, 0);
                return std::move(out_);
            }

        private:
            auto Tick() -> void
            {
                if ((++nodes_ & DeadlineCheckMask) == 0 && std::chrono::steady_clock::now() > deadline_)
                    BMB_THROW(error::Code::Timeout,
                              std::format("signature generation for P{} exceeded its deadline after {} nodes",
                                          static_cast<int>(job_.player), nodes_));
            }

            // min_counts can still be met by the remaining slots
            auto Feasible(size_t pos, ValueIdxT min_v) const -> bool
            {
                size_t needed{};
                for (size_t v{}; v < counts_.size(); ++v)
                {
                    if (counts_[v] >= job_.min_counts[v]) continue;
                    // sorted: ranks below min_v can no longer be added
                    if (v < min_v) return false;
                    needed += job_.min_counts[v] - counts_[v];
                }
                return needed <= hand_.size() - pos;
            }

            auto CopyCountsAllow(size_t pos, ValueIdxT v) const -> bool
            {
                for (CopyCountConstraint const& c : job_.constraints.copy_counts)
                {
                    if (c.slot < pos)
                    {
                        ValueIdxT const u = hand_[c.slot];
                        if (counts_[u] + (u == v ? 1 : 0) > c.count) return false;
                        // u is closed once a larger rank is placed
                        if (v > u && counts_[u] != c.count) return false;
                    }
                    else if (c.slot == pos)
                    {
                        if (counts_[v] + 1 > c.count) return false;
                    }
                }
                return true;
            }

            auto LeafOk() const -> bool
            {
                for (size_t v{}; v < counts_.size(); ++v)
                    if (counts_[v] < job_.min_counts[v]) return false;
                return std::ranges::all_of(job_.constraints.copy_counts, [this](CopyCountConstraint const& c)
                {
                    return counts_[hand_[c.slot]] == c.count;
                });
            }

            auto Recurse(size_t pos, ValueIdxT min_v) -> void
            {
                Tick();
                if (pos == hand_.size())
                {
                    if (LeafOk()) out_.insert(counts_);
                    return;
                }
                if (!Feasible(pos, min_v)) return;

                for (ValueIdxT const v : job_.beliefs[pos] & ValueSet::From(min_v))
                {
                    if (v >= counts_.size()) break;
                    if (counts_[v] >= job_.deck[v]) continue;
                    if (pos > 0 && adjacent_[pos] != -1 && ((hand_[pos - 1] == v) != (adjacent_[pos] == 1))) continue;
                    if (!CopyCountsAllow(pos, v)) continue;

                    hand_[pos] = v;
                    ++counts_[v];
                    Recurse(pos + 1, v);
                    --counts_[v];
                }
            }

            SignatureJob const& job_;
            Deadline deadline_;
            std::vector<ValueIdxT> hand_;
            ResourceVec counts_;
            // relation between slot i-1 and i: -1 none, 0 different, 1 equal
            std::vector<int8_t> adjacent_;
            SignatureSet out_;
            uint64_t nodes_{0};
        };
    }

    auto SignatureJob::CacheKey() const -> std::string
    {
        std::string key;
        key.reserve(8 + beliefs.size() * 8 + deck.size() * 2
                    + constraints.copy_counts.size() * 3 + constraints.adjacent.size() * 3);
        key.push_back(static_cast<char>(player));
        key.push_back(static_cast<char>(beliefs.size()));
        for (ValueSet const s : beliefs)
        {
            uint64_t const b = s.Bits();
            for (int i{}; i < 8; ++i) key.push_back(static_cast<char>((b >> (8 * i)) & 0xFF));
        }
        key.append(deck.begin(), deck.end());
        key.append(min_counts.begin(), min_counts.end());
        key.push_back('|');
        for (CopyCountConstraint const& c : constraints.copy_counts)
        {
            key.push_back(static_cast<char>(c.slot));
            key.push_back(static_cast<char>(c.count));
        }
        key.push_back('|');
        for (AdjacentConstraint const& c : constraints.adjacent)
        {
            key.push_back(static_cast<char>(c.low));
            key.push_back(static_cast<char>(c.is_equal));
        }
        return key;
    }

    auto GenerateSignatures(SignatureJob const& job, Deadline deadline) -> SignatureSet
    {
        BMB_ASSERT(job.deck.size() == job.min_counts.size(), "deck and min_counts differ in length");
        for (CopyCountConstraint const& c : job.constraints.copy_counts)
            BMB_ASSERT(c.slot < job.beliefs.size(), "copy-count constraint outside the hand");
        SignatureBuilder builder(job, deadline);
        return builder.Run();
    }

    auto ExpandSignature(ResourceVec const& sig) -> std::vector<ValueIdxT>
    {
        std::vector<ValueIdxT> hand;
        for (size_t v{}; v < sig.size(); ++v)
            hand.insert(hand.end(), sig[v], static_cast<ValueIdxT>(v));
        return hand;
    }
}
