//
// Created by Malik T on 19/08/2025.
//

#ifndef BOMBBUSTER_CODEC_HPP
#define BOMBBUSTER_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <span>
#include <string>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Actions.hpp"

namespace bomb::core::net
{
    struct ParseError
    {
        std::string message;
    };

    struct DecodedAction
    {
        std::uint64_t msg_id{};
        std::uint32_t turn{};
        ActionRecord record{};
    };

    using Frame = std::vector<std::byte>;

    // --- Outbound (orchestrator → engine) ---
    auto EncodeAction(ActionRecord const& record,
                      std::uint64_t msg_id,
                      std::uint32_t turn)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (verified ActionMsg → ActionRecord) ---
    auto DecodeAction(std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>;

    // u32 little-endian length prefix, then the buffer. Throws SerializationError on a bad stream.
    auto WriteFrame(std::ostream& os, std::span<std::uint8_t const> payload) -> void;
    auto ReadFrames(std::istream& is) -> std::expected<std::vector<Frame>, ParseError>;
} // namespace bomb::core::net


#endif //BOMBBUSTER_CODEC_HPP
