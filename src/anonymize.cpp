/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "anonymize.hpp"

#include <utility> // std::move

auto anonymize(RecFile& rec, AnonymizeOptions const& options,
               IEventSink& events) noexcept -> AnonymizeResult
{
	AnonymizeResult r{};
	auto const count = get_player_count(rec.header.payload);
	if(!count.success)
	{
		r.failure = count.failure;
		return r;
	}
	r.player_count = count.count;
	events.info("Player count: " + std::to_string(count.count));
	// Header pass. The payload is recompressed when the file is written.
	{
		auto players =
			anonymize_players(rec.header.payload, r.player_count, events);
		r.players = std::move(players.players);
		if(!players.success)
		{
			r.failure = std::move(players.failure);
			return r;
		}
	}
	// Operations passes.
	{
		auto chat = rewrite_chat(rec.operations, options.chat, events);
		r.chat = chat.stats;
		r.chat_skipped = std::move(chat.skipped);
		if(!chat.success)
		{
			r.failure = std::move(chat.failure);
			return r;
		}
	}
	{
		auto ratings = patch_ratings(rec.operations, r.player_count,
		                             options.rating, events,
		                             options.rating_limits);
		if(!ratings.success)
		{
			r.failure = std::move(ratings.failure);
			return r;
		}
		r.rating_block_pos = ratings.block_pos;
		r.ratings = std::move(ratings.entries);
	}
	r.success = true;
	return r;
}
