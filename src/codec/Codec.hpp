#ifndef SCOREKEEP_CODEC_HPP
#define SCOREKEEP_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/AtBat.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/scorekeep_generated.h"

namespace scorekeep::core::codec
{
    // Decoding external bytes never throws; it reports here.
    struct ParseError
    {
        std::string message;
    };

    auto ToFbResult(ResultKind k) noexcept -> scorekeep::gen::ResultKind;
    auto ToFbHalf(Half h) noexcept -> scorekeep::gen::Half;
    auto ToFbStatus(GameStatus s) noexcept -> scorekeep::gen::GameStatus;
    auto ToFbCompletion(CompletionReason r) noexcept -> scorekeep::gen::CompletionReason;
    auto ToFbAggressiveness(Aggressiveness a) noexcept -> scorekeep::gen::Aggressiveness;

    auto FromFbResult(scorekeep::gen::ResultKind k) noexcept -> ResultKind;
    auto FromFbHalf(scorekeep::gen::Half h) noexcept -> Half;
    auto FromFbStatus(scorekeep::gen::GameStatus s) noexcept -> GameStatus;
    auto FromFbCompletion(scorekeep::gen::CompletionReason r) noexcept -> CompletionReason;
    auto FromFbAggressiveness(scorekeep::gen::Aggressiveness a) noexcept -> Aggressiveness;

    // --- Outbound (core -> persistence) ---
    // Throws SerializationError for a record with no id.
    auto EncodeAtBat(AtBat const& ab) -> flatbuffers::DetachedBuffer;
    auto EncodeSnapshot(GameSnapshot const& s) -> flatbuffers::DetachedBuffer;

    // --- Inbound (persistence -> core) ---
    auto DecodeAtBat(std::span<std::byte const> bytes) -> std::expected<AtBat, ParseError>;
    auto DecodeSnapshot(std::span<std::byte const> bytes) -> std::expected<GameSnapshot, ParseError>;
}

#endif //SCOREKEEP_CODEC_HPP
