/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_RATINGS_HPP
#define ART_RATINGS_HPP
#include <cstdint>
#include <optional>
#include <vector>

#include "events.hpp"
#include "failure.hpp"
#include "signatures.hpp"

constexpr uint32_t DEFAULT_PLACEHOLDER_RATING = 1000U;

struct RatingEntry
{
	uint32_t player_id;
	uint32_t unknown;
	uint32_t rating;
};

// Offset of the first rating record of the post-game leaderboard.
auto find_rating_block(std::vector<uint8_t> const& ops, uint32_t player_count,
                       RatingLimits const& limits = {}) noexcept
	-> std::optional<size_t>;

auto read_ratings(std::vector<uint8_t> const& ops, size_t block_pos,
                  uint32_t player_count) noexcept -> std::vector<RatingEntry>;

struct PatchRatingsResult
{
	bool success{};
	size_t block_pos{};
	std::vector<RatingEntry> entries; // As written.
	Failure failure{};
};

// Overwrites the rating of every leaderboard record with `rating`. Player ids
// and the field next to them are left untouched. The buffer never changes
// size.
auto patch_ratings(std::vector<uint8_t>& ops, uint32_t player_count,
                   uint32_t rating, IEventSink& events,
                   RatingLimits const& limits = {}) noexcept
	-> PatchRatingsResult;

#endif // ART_RATINGS_HPP
