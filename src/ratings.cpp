/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "ratings.hpp"

#include <cstring> // std::memcpy
#include <string>
#include <utility> // std::move

#include "patch.hpp"
#include "search.hpp"

namespace
{

#include "read.inl"

// Start of a rating record: u32 player id in 0..7.
auto is_record_start(std::vector<uint8_t> const& ops, size_t pos) noexcept
	-> bool
{
	return ops[pos] <= RATING_MAX_PLAYER_ID && ops[pos + 1U] == 0U &&
	       ops[pos + 2U] == 0U && ops[pos + 3U] == 0U;
}

} // namespace

auto find_rating_block(std::vector<uint8_t> const& ops, uint32_t player_count,
                       RatingLimits const& limits) noexcept
	-> std::optional<size_t>
{
	auto const records_size = size_t{player_count} * RATING_RECORD_SIZE;
	if(player_count == 0U || records_size > ops.size())
		return std::nullopt;
	auto const last_block_pos = ops.size() - records_size;
	auto const window_begin =
		ops.size() > limits.tail_window ? ops.size() - limits.tail_window : 0U;
	auto from = window_begin;
	while(auto const tag = find_bytes(ops, from, POSTGAME_OPERATION_TAG))
	{
		from = *tag + 1U;
		for(auto gap = limits.min_gap; gap <= limits.max_gap; ++gap)
		{
			auto const count_pos = *tag + POSTGAME_OPERATION_TAG.size() + gap;
			auto const block_pos = count_pos + sizeof(uint32_t);
			if(block_pos > last_block_pos)
				break;
			if(read_at<uint32_t>(ops, count_pos) == player_count &&
			   is_record_start(ops, block_pos))
				return block_pos;
		}
	}
	return std::nullopt;
}

auto read_ratings(std::vector<uint8_t> const& ops, size_t block_pos,
                  uint32_t player_count) noexcept -> std::vector<RatingEntry>
{
	std::vector<RatingEntry> entries;
	entries.reserve(player_count);
	for(uint32_t i = 0U; i < player_count; ++i)
	{
		auto const pos = block_pos + i * RATING_RECORD_SIZE;
		if(pos + RATING_RECORD_SIZE > ops.size())
			break;
		entries.push_back({read_at<uint32_t>(ops, pos),
		                   read_at<uint32_t>(ops, pos + 4U),
		                   read_at<uint32_t>(ops, pos + RATING_FIELD_OFFSET)});
	}
	return entries;
}

auto patch_ratings(std::vector<uint8_t>& ops, uint32_t player_count,
                   uint32_t rating, IEventSink& events,
                   RatingLimits const& limits) noexcept -> PatchRatingsResult
{
	PatchRatingsResult r{};
	auto const block_pos = find_rating_block(ops, player_count, limits);
	if(!block_pos)
	{
		r.failure = {FailureKind::NOT_FOUND,
		             "Failed to find the rating block"};
		return r;
	}
	std::vector<uint8_t> value;
	append(value, rating);
	std::vector<Patch> patches;
	patches.reserve(player_count);
	for(uint32_t i = 0U; i < player_count; ++i)
	{
		auto const pos = *block_pos + i * RATING_RECORD_SIZE;
		patches.push_back({pos + RATING_FIELD_OFFSET, value.size(), value});
		events.info("Set rating for player " +
		            std::to_string(read_at<uint32_t>(ops, pos)));
	}
	if(!apply_patches(ops, std::move(patches)))
	{
		r.failure = {FailureKind::SIZE_MISMATCH,
		             "Rating block runs past the end of the operations"};
		return r;
	}
	r.block_pos = *block_pos;
	r.entries = read_ratings(ops, *block_pos, player_count);
	r.success = true;
	return r;
}
