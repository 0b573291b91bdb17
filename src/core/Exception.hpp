//
// Created by Malik T on 14/08/2025.
//

#ifndef BOMBBUSTER_EXCEPTION_HPP
#define BOMBBUSTER_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace bomb::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Config, // invalid configuration or value domain
        State, // engine misuse (not an invalid record)
        Timeout, // global solver deadline exceeded
        Persistence, // file system failure on save/load
        Serialization, // JSON / FlatBuffers decoding errors
        Assertion // internal assertion failed
    };

    inline auto describe_code(Code c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "unknown error";
        case Code::Config: return "configuration error";
        case Code::State: return "engine misuse";
        case Code::Timeout: return "global solver timeout";
        case Code::Persistence: return "belief store I/O error";
        case Code::Serialization: return "decoding error";
        case Code::Assertion: return "internal assertion";
        }
        return "unknown error";
    }

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct TimeoutError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct PersistenceError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::Config: throw ConfigError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::Timeout: throw TimeoutError(std::move(msg), c);
        case Code::Persistence: throw PersistenceError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define BMB_THROW(code_enum, msg) ::bomb::core::error::fail((code_enum), (msg))
#define BMB_ASSERT(cond, msg) do { if(!(cond)) ::bomb::core::error::fail(::bomb::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by record type.
    enum class ActionViolationCode : std::uint16_t
    {
        // Any record
        PlayerOutOfRange,
        PositionOutOfRange,
        UnknownValue,

        // Call
        Call_SelfTarget,
        Call_TargetRevealed,
        Call_CallerLacksValue,
        Call_CallerPositionMismatch,
        Call_OutcomeContradictsOwnHand,

        // DoubleReveal
        DoubleReveal_SamePosition,
        DoubleReveal_OwnHandMismatch,

        // Signal / NotPresent / HasValue
        Signal_OwnHandMismatch,
        NotPresent_OwnHandMismatch,
        HasValue_OwnHandMismatch,

        // Swap
        Swap_SamePlayer,
        Swap_FinalPositionOutOfRange,
        Swap_RevealedWire,
        Swap_MissingReceivedValue,
        Swap_OwnHandMismatch,

        // CopyCountSignal
        CopyCount_OutOfRange,
        CopyCount_OwnHandMismatch,

        // AdjacentSignal
        Adjacent_NotAdjacent,
        Adjacent_OwnHandMismatch
    };

    // Compact, optional context carried with the violation.
    struct ActionViolation
    {
        ActionViolationCode code{};
        std::optional<PlyrIdxT> player{};
        std::optional<PlyrIdxT> target{};
        std::optional<SlotIdxT> position{};
        std::optional<WireValue> value{};
        std::optional<std::uint8_t> count{};

        auto with_player(PlyrIdxT p) -> ActionViolation&
        {
            player = p;
            return *this;
        }

        auto with_target(PlyrIdxT p) -> ActionViolation&
        {
            target = p;
            return *this;
        }

        auto with_position(SlotIdxT s) -> ActionViolation&
        {
            position = s;
            return *this;
        }

        auto with_value(WireValue v) -> ActionViolation&
        {
            value = v;
            return *this;
        }

        auto with_count(std::uint8_t c) -> ActionViolation&
        {
            count = c;
            return *this;
        }
    };

    inline auto to_string(ActionViolationCode c) -> std::string_view
    {
        using E = ActionViolationCode;
        switch (c)
        {
        case E::PlayerOutOfRange: return "Player id out of range";
        case E::PositionOutOfRange: return "Position out of range";
        case E::UnknownValue: return "Value not in the configured domain";

        case E::Call_SelfTarget: return "Call: caller cannot target themselves";
        case E::Call_TargetRevealed: return "Call: target position already revealed";
        case E::Call_CallerLacksValue: return "Call: caller does not hold an unrevealed copy of the value";
        case E::Call_CallerPositionMismatch: return "Call: caller position does not hold the value";
        case E::Call_OutcomeContradictsOwnHand: return "Call: outcome contradicts own hand";

        case E::DoubleReveal_SamePosition: return "DoubleReveal: positions must differ";
        case E::DoubleReveal_OwnHandMismatch: return "DoubleReveal: positions do not hold the value";

        case E::Signal_OwnHandMismatch: return "Signal: position does not hold the value";
        case E::NotPresent_OwnHandMismatch: return "NotPresent: own hand holds the value";
        case E::HasValue_OwnHandMismatch: return "HasValue: own hand does not hold the value";

        case E::Swap_SamePlayer: return "Swap: players must differ";
        case E::Swap_FinalPositionOutOfRange: return "Swap: final position out of range";
        case E::Swap_RevealedWire: return "Swap: cannot exchange a revealed wire";
        case E::Swap_MissingReceivedValue: return "Swap: received value required for own hand";
        case E::Swap_OwnHandMismatch: return "Swap: received value breaks own hand order";

        case E::CopyCount_OutOfRange: return "CopyCount: copy_count out of range";
        case E::CopyCount_OwnHandMismatch: return "CopyCount: copy_count does not match own hand";

        case E::Adjacent_NotAdjacent: return "Adjacent: positions must be adjacent";
        case E::Adjacent_OwnHandMismatch: return "Adjacent: relation does not match own hand";
        }
        return "Unknown";
    }

    inline auto describe(ActionViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.player) s += std::format(" | player=P{}", static_cast<int>(*v.player));
        if (v.target) s += std::format(" | target=P{}", static_cast<int>(*v.target));
        if (v.position) s += std::format(" | pos={}", static_cast<int>(*v.position));
        if (v.value) s += std::format(" | value={}", *v.value);
        if (v.count) s += std::format(" | count={}", static_cast<int>(*v.count));
        return s;
    }

    using ValidateResult = std::expected<void, ActionViolation>;
}

#endif //BOMBBUSTER_EXCEPTION_HPP
