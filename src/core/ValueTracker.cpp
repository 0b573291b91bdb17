//
// Created by Malik T on 03/10/2025.
//

#include "ValueTracker.hpp"

#include <algorithm>
#include <ranges>
#include "Log.hpp"

namespace bomb::core
{
    ValueTracker::ValueTracker(ValueIdxT value, uint8_t total):
        value_(value), total_(total) {}

    auto ValueTracker::Uncertain() const noexcept -> int
    {
        return static_cast<int>(total_) - static_cast<int>(revealed_.size())
             - static_cast<int>(certain_.size()) - static_cast<int>(called_.size());
    }

    auto ValueTracker::IsRevealed(SlotRef at) const -> bool
    {
        return std::ranges::find(revealed_, at) != revealed_.end();
    }

    auto ValueTracker::IsCertain(SlotRef at) const -> bool
    {
        return std::ranges::find(certain_, at) != certain_.end();
    }

    auto ValueTracker::IsCalled(PlyrIdxT player) const -> bool
    {
        return std::ranges::find(called_, player) != called_.end();
    }

    auto ValueTracker::HasCertainFor(PlyrIdxT player) const -> bool
    {
        return std::ranges::any_of(certain_, [player](SlotRef const& r) { return r.player == player; });
    }

    auto ValueTracker::HasPinnedFor(PlyrIdxT player) const -> bool
    {
        return HasCertainFor(player)
            || std::ranges::any_of(revealed_, [player](SlotRef const& r) { return r.player == player; });
    }

    auto ValueTracker::PinnedFor(PlyrIdxT player) const -> std::vector<SlotIdxT>
    {
        std::vector<SlotIdxT> out;
        for (SlotRef const& r : revealed_)
            if (r.player == player) out.push_back(r.slot);
        for (SlotRef const& r : certain_)
            if (r.player == player) out.push_back(r.slot);
        return out;
    }

    auto ValueTracker::AddRevealed(SlotRef at) -> bool
    {
        if (IsRevealed(at))
        {
            log::Warn("value rank {}: P{}[{}] already revealed", value_,
                      static_cast<int>(at.player), static_cast<int>(at.slot));
            return true;
        }

        if (auto const it = std::ranges::find(certain_, at); it != certain_.end())
        {
            certain_.erase(it);
            revealed_.push_back(at);
            return true;
        }

        if (auto const it = std::ranges::find(called_, at.player); it != called_.end())
        {
            called_.erase(it);
            revealed_.push_back(at);
            return true;
        }

        if (Uncertain() < 1) return false;
        revealed_.push_back(at);
        return true;
    }

    auto ValueTracker::AddCertain(SlotRef at) -> bool
    {
        if (IsTracked(at)) return true;

        if (auto const it = std::ranges::find(called_, at.player); it != called_.end())
        {
            called_.erase(it);
            certain_.push_back(at);
            return true;
        }

        if (Uncertain() < 1) return false;
        certain_.push_back(at);
        return true;
    }

    auto ValueTracker::AddCalled(PlyrIdxT player) -> bool
    {
        // a pinned slot may already be the copy the record demonstrated
        if (HasPinnedFor(player) || IsCalled(player)) return true;
        if (Uncertain() < 1) return false;
        called_.push_back(player);
        return true;
    }

    auto ValueTracker::Replace(std::vector<SlotRef> revealed,
                               std::vector<SlotRef> certain,
                               std::vector<PlyrIdxT> called) -> bool
    {
        if (revealed.size() + certain.size() + called.size() > total_) return false;

        std::vector<SlotRef> all = revealed;
        all.insert(all.end(), certain.begin(), certain.end());
        std::ranges::sort(all);
        if (std::ranges::adjacent_find(all) != all.end()) return false;

        std::vector<PlyrIdxT> callers = called;
        std::ranges::sort(callers);
        if (std::ranges::adjacent_find(callers) != callers.end()) return false;

        revealed_ = std::move(revealed);
        certain_ = std::move(certain);
        called_ = std::move(called);
        return true;
    }
}
