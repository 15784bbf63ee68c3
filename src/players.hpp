/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_PLAYERS_HPP
#define ART_PLAYERS_HPP
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "events.hpp"
#include "failure.hpp"
#include "signatures.hpp"

struct PlayerCountResult
{
	bool success{};
	uint32_t count{};
	Failure failure{};
};

auto get_player_count(std::vector<uint8_t> const& payload) noexcept
	-> PlayerCountResult;

// Player init record in the lobby settings of the header payload.
struct PlayerRecord
{
	size_t pos; // Offset of the name length byte.
	std::string name;
	uint32_t profile_id;
	size_t end; // One past the profile id.
};

// First record starting at or after `from` that ends at or before `window_end`.
auto find_player_record(std::vector<uint8_t> const& payload, size_t from,
                        size_t window_end = PLAYER_RECORD_WINDOW_END) noexcept
	-> std::optional<PlayerRecord>;

// Read-only scan for up to `count` consecutive player records.
auto list_players(std::vector<uint8_t> const& payload, uint32_t count) noexcept
	-> std::vector<PlayerRecord>;

auto anonymous_name(uint32_t number) noexcept -> std::string;

struct PlayerOutcome
{
	std::string replacement;
	bool attributes_rewritten;
};

struct AnonymizePlayersResult
{
	bool success{};
	std::vector<PlayerOutcome> players;
	Failure failure{};
};

// Renames the i-th player to "player i+1" and clears its profile id, both in
// the lobby settings and in the attributes copy of the name. Fails as soon as
// a player record cannot be located; a missing attributes copy only warns.
auto anonymize_players(std::vector<uint8_t>& payload, uint32_t count,
                       IEventSink& events) noexcept -> AnonymizePlayersResult;

#endif // ART_PLAYERS_HPP
