//
// Created by Malik T on 19/08/2025.
//

#include "codec.hpp"

#include <array>
#include <format>
#include <istream>
#include <ostream>
#include <type_traits>
#include <utility>

#include "../core/Exception.hpp"
#include "bombbuster_actions_generated.h"

namespace fb = bomb::gen::net;

namespace
{
    inline auto Unexpected(std::string msg) -> std::unexpected<bomb::core::net::ParseError>
    {
        return std::unexpected(bomb::core::net::ParseError{std::move(msg)});
    }
} // anonymous

namespace bomb::core::net
{
    // ---------- Builders ----------

    static auto BuildUnion(flatbuffers::FlatBufferBuilder& fbb, ActionRecord const& record)
        -> std::pair<fb::Action, flatbuffers::Offset<void>>
    {
        return std::visit([&]<typename T0>(T0 const& r) -> std::pair<fb::Action, flatbuffers::Offset<void>>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, CallRecord>)
            {
                auto const a = fb::CreateAction_Call(fbb, r.caller, r.target, r.position, r.value, r.success,
                                                     r.caller_position.has_value(), r.caller_position.value_or(0));
                return {fb::Action::Action_Call, a.Union()};
            }
            else if constexpr (std::is_same_v<T, DoubleRevealRecord>)
            {
                auto const a = fb::CreateAction_DoubleReveal(fbb, r.player, r.value, r.position1, r.position2);
                return {fb::Action::Action_DoubleReveal, a.Union()};
            }
            else if constexpr (std::is_same_v<T, SignalRecord>)
            {
                auto const a = fb::CreateAction_Signal(fbb, r.player, r.value, r.position);
                return {fb::Action::Action_Signal, a.Union()};
            }
            else if constexpr (std::is_same_v<T, NotPresentRecord>)
            {
                auto const a = fb::CreateAction_NotPresent(fbb, r.player, r.value,
                                                           r.position.has_value(), r.position.value_or(0));
                return {fb::Action::Action_NotPresent, a.Union()};
            }
            else if constexpr (std::is_same_v<T, SwapRecord>)
            {
                auto const a = fb::CreateAction_Swap(fbb, r.player1, r.player2,
                                                     r.init_pos1, r.init_pos2, r.final_pos1, r.final_pos2,
                                                     r.received_value1.has_value(), r.received_value1.value_or(0.0),
                                                     r.received_value2.has_value(), r.received_value2.value_or(0.0));
                return {fb::Action::Action_Swap, a.Union()};
            }
            else if constexpr (std::is_same_v<T, HasValueRecord>)
            {
                auto const a = fb::CreateAction_HasValue(fbb, r.player, r.value);
                return {fb::Action::Action_HasValue, a.Union()};
            }
            else if constexpr (std::is_same_v<T, CopyCountSignalRecord>)
            {
                auto const a = fb::CreateAction_CopyCountSignal(fbb, r.player, r.position, r.copy_count);
                return {fb::Action::Action_CopyCountSignal, a.Union()};
            }
            else
            {
                static_assert(std::is_same_v<T, AdjacentSignalRecord>);
                auto const a = fb::CreateAction_AdjacentSignal(fbb, r.player, r.position1, r.position2, r.is_equal);
                return {fb::Action::Action_AdjacentSignal, a.Union()};
            }
        }, record);
    }

    auto EncodeAction(ActionRecord const& record,
                      std::uint64_t msg_id,
                      std::uint32_t turn)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const [kind, body] = BuildUnion(fbb, record);
        auto const msg = fb::CreateActionMsg(fbb, msg_id, turn, kind, body);
        fbb.Finish(msg);
        return fbb.Release();
    }

    // ---------- Decode ----------

    template <typename Opt>
    static auto OptionalIf(bool has, Opt value) -> std::optional<Opt>
    {
        return has ? std::optional<Opt>{value} : std::nullopt;
    }

    auto DecodeAction(std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return Unexpected("buffer too small");

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyActionMsgBuffer(verifier))
            return Unexpected("buffer failed verification");

        auto const* msg = fb::GetActionMsg(data);
        DecodedAction out{};
        out.msg_id = msg->msg_id();
        out.turn = msg->turn();

        switch (msg->action_type())
        {
        case fb::Action::Action_Call:
        {
            auto const* a = msg->action_as_Action_Call();
            out.record = CallRecord{a->caller(), a->target(), a->position(), a->value(), a->success(),
                                    OptionalIf<SlotIdxT>(a->has_caller_position(), a->caller_position())};
            return out;
        }
        case fb::Action::Action_DoubleReveal:
        {
            auto const* a = msg->action_as_Action_DoubleReveal();
            out.record = DoubleRevealRecord{a->player(), a->value(), a->position1(), a->position2()};
            return out;
        }
        case fb::Action::Action_Signal:
        {
            auto const* a = msg->action_as_Action_Signal();
            out.record = SignalRecord{a->player(), a->value(), a->position()};
            return out;
        }
        case fb::Action::Action_NotPresent:
        {
            auto const* a = msg->action_as_Action_NotPresent();
            out.record = NotPresentRecord{a->player(), a->value(),
                                          OptionalIf<SlotIdxT>(a->has_position(), a->position())};
            return out;
        }
        case fb::Action::Action_Swap:
        {
            auto const* a = msg->action_as_Action_Swap();
            out.record = SwapRecord{a->player1(), a->player2(),
                                    a->init_pos1(), a->init_pos2(), a->final_pos1(), a->final_pos2(),
                                    OptionalIf<WireValue>(a->has_received_value1(), a->received_value1()),
                                    OptionalIf<WireValue>(a->has_received_value2(), a->received_value2())};
            return out;
        }
        case fb::Action::Action_HasValue:
        {
            auto const* a = msg->action_as_Action_HasValue();
            out.record = HasValueRecord{a->player(), a->value()};
            return out;
        }
        case fb::Action::Action_CopyCountSignal:
        {
            auto const* a = msg->action_as_Action_CopyCountSignal();
            out.record = CopyCountSignalRecord{a->player(), a->position(), a->copy_count()};
            return out;
        }
        case fb::Action::Action_AdjacentSignal:
        {
            auto const* a = msg->action_as_Action_AdjacentSignal();
            out.record = AdjacentSignalRecord{a->player(), a->position1(), a->position2(), a->is_equal()};
            return out;
        }
        case fb::Action::NONE:
            break;
        }
        return Unexpected(std::format("unknown action type {}", static_cast<int>(msg->action_type())));
    }

    // ---------- Framing ----------

    auto WriteFrame(std::ostream& os, std::span<std::uint8_t const> payload) -> void
    {
        auto const n = static_cast<std::uint32_t>(payload.size());
        std::array<char, 4> const prefix{static_cast<char>(n & 0xFFU), static_cast<char>((n >> 8) & 0xFFU),
                                         static_cast<char>((n >> 16) & 0xFFU), static_cast<char>((n >> 24) & 0xFFU)};
        os.write(prefix.data(), prefix.size());
        os.write(reinterpret_cast<char const*>(payload.data()), static_cast<std::streamsize>(payload.size()));
        if (!os)
            BMB_THROW(error::Code::Serialization, std::format("failed writing a {} byte frame", n));
    }

    auto ReadFrames(std::istream& is) -> std::expected<std::vector<Frame>, ParseError>
    {
        std::vector<Frame> out;
        for (;;)
        {
            std::array<unsigned char, 4> prefix{};
            is.read(reinterpret_cast<char*>(prefix.data()), prefix.size());
            if (is.gcount() == 0) break;
            if (is.gcount() != 4)
                return Unexpected(std::format("truncated length prefix after {} frames", out.size()));

            std::uint32_t const n = prefix[0] | (prefix[1] << 8) | (prefix[2] << 16)
                | (static_cast<std::uint32_t>(prefix[3]) << 24);
            Frame f(n);
            is.read(reinterpret_cast<char*>(f.data()), n);
            if (static_cast<std::uint32_t>(is.gcount()) != n)
                return Unexpected(std::format("frame {} truncated: {} of {} bytes", out.size(), is.gcount(), n));
            out.push_back(std::move(f));
        }
        return out;
    }
} // namespace bomb::core::net
