/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_ANONYMIZE_HPP
#define ART_ANONYMIZE_HPP
#include <cstdint>
#include <vector>

#include "chat.hpp"
#include "events.hpp"
#include "failure.hpp"
#include "players.hpp"
#include "ratings.hpp"
#include "rec_file.hpp"
#include "signatures.hpp"

struct AnonymizeOptions
{
	ChatPolicy chat{};
	uint32_t rating{DEFAULT_PLACEHOLDER_RATING};
	RatingLimits rating_limits{};
};

struct AnonymizeResult
{
	bool success{};
	uint32_t player_count{};
	std::vector<PlayerOutcome> players;
	ChatStats chat{};
	std::vector<ChatRecordFailure> chat_skipped;
	size_t rating_block_pos{};
	std::vector<RatingEntry> ratings;
	Failure failure{};
};

// Runs the player, chat and rating rewrites on `rec`, in that order. The
// first fatal failure stops the pass; whatever was already rewritten stays
// rewritten, so `rec` must not be written out after a failure.
auto anonymize(RecFile& rec, AnonymizeOptions const& options,
               IEventSink& events) noexcept -> AnonymizeResult;

#endif // ART_ANONYMIZE_HPP
