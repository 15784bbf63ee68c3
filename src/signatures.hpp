/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_SIGNATURES_HPP
#define ART_SIGNATURES_HPP
#include <array>
#include <cstddef>
#include <cstdint>

// NOTE: All signatures target the recorded game format with log version 5
// (header "VER 9.4"). Alternates for other revisions go next to the
// existing constants and are selected by the locators, not by the rewrite
// code.

// Header payload, lobby settings. Two consecutive separators are followed by
//   f32 speed;
//   u32 treaty_length;
//   u32 population_limit;
//   u32 n_players;
constexpr std::array<uint8_t, 4U> LOBBY_SEPARATOR{0xA3, 0x5F, 0x02, 0x00};
constexpr size_t LOBBY_SKIP_BEFORE_PLAYER_COUNT = 4U + 4U + 4U;

// Header payload, per-player init record:
//   60 0A | u8 name_length (!= 0) | 00 | name | 02 00 00 00 | u32 profile_id
constexpr std::array<uint8_t, 2U> PLAYER_RECORD_PREFIX{0x60, 0x0A};
constexpr std::array<uint8_t, 4U> PLAYER_RECORD_SEPARATOR{0x02, 0x00, 0x00,
                                                          0x00};
constexpr size_t PLAYER_PROFILE_ID_SIZE = 4U;
// Lobby settings never extend past this payload offset.
constexpr size_t PLAYER_RECORD_WINDOW_END = 0x330U;

// Operations, chat record:
//   8 bytes | 04 00 00 00 FF FF FF FF | u16 length | 00 00 | payload
constexpr std::array<uint8_t, 8U> CHAT_SENTINEL{0x04, 0x00, 0x00, 0x00,
                                                0xFF, 0xFF, 0xFF, 0xFF};
constexpr size_t CHAT_LEAD_SIZE = 8U;
constexpr size_t CHAT_LENGTH_FIELD_SIZE = 4U;

// Operations, post-game leaderboard block:
//   06 00 00 00 | gap | u32 n_players | n_players * rating record
constexpr std::array<uint8_t, 4U> POSTGAME_OPERATION_TAG{0x06, 0x00, 0x00,
                                                         0x00};
constexpr size_t RATING_RECORD_SIZE = 12U;
constexpr size_t RATING_FIELD_OFFSET = 8U;
constexpr uint8_t RATING_MAX_PLAYER_ID = 7U;

// Observed bounds of the leaderboard block; not guaranteed by the format.
struct RatingLimits
{
	size_t tail_window = 255U;
	size_t min_gap = 22U;
	size_t max_gap = 255U;
};

#endif // ART_SIGNATURES_HPP
