/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "players.hpp"

#include <algorithm>
#include <array>
#include <cstring> // std::memcpy
#include <utility> // std::move

#include "patch.hpp"
#include "search.hpp"
#include "signatures.hpp"

namespace
{

#include "read.inl"

auto double_separator() noexcept -> std::array<uint8_t, 8U>
{
	std::array<uint8_t, 8U> sig{};
	std::copy(LOBBY_SEPARATOR.begin(), LOBBY_SEPARATOR.end(), sig.begin());
	std::copy(LOBBY_SEPARATOR.begin(), LOBBY_SEPARATOR.end(),
	          sig.begin() + LOBBY_SEPARATOR.size());
	return sig;
}

// u16 length followed by the name bytes, as used for player names.
auto length_prefixed(std::string const& name, size_t length) noexcept
	-> std::vector<uint8_t>
{
	std::vector<uint8_t> out;
	out.reserve(sizeof(uint16_t) + name.size() + 1U);
	append(out, static_cast<uint16_t>(length));
	out.insert(out.end(), name.begin(), name.end());
	return out;
}

// Attributes copy: the length counts the terminating NUL.
auto attribute_string(std::string const& name) noexcept
	-> std::vector<uint8_t>
{
	auto out = length_prefixed(name, name.size() + 1U);
	out.push_back(0U);
	return out;
}

} // namespace

auto get_player_count(std::vector<uint8_t> const& payload) noexcept
	-> PlayerCountResult
{
	PlayerCountResult r{};
	auto const sig = double_separator();
	auto const pos = find_bytes(payload, 0U, sig);
	if(!pos)
	{
		r.failure = {FailureKind::NOT_FOUND, "Failed to get player count"};
		return r;
	}
	auto const count_pos = *pos + sig.size() + LOBBY_SKIP_BEFORE_PLAYER_COUNT;
	if(count_pos + sizeof(uint32_t) > payload.size())
	{
		r.failure = {FailureKind::NOT_FOUND,
		             "Lobby settings end before the player count"};
		return r;
	}
	r.count = read_at<uint32_t>(payload, count_pos);
	r.success = true;
	return r;
}

auto find_player_record(std::vector<uint8_t> const& payload, size_t from,
                        size_t window_end) noexcept
	-> std::optional<PlayerRecord>
{
	window_end = std::min(window_end, payload.size());
	while(auto const prefix =
	          find_bytes(payload, from, window_end, PLAYER_RECORD_PREFIX))
	{
		from = *prefix + 1U;
		auto const pos = *prefix + PLAYER_RECORD_PREFIX.size();
		if(pos + 2U > window_end)
			break;
		auto const length = size_t{payload[pos]};
		if(length == 0U || payload[pos + 1U] != 0U)
			continue;
		auto const name_pos = pos + 2U;
		auto const separator_pos = name_pos + length;
		auto const end = separator_pos + PLAYER_RECORD_SEPARATOR.size() +
		                 PLAYER_PROFILE_ID_SIZE;
		if(end > window_end)
			continue;
		if(!matches_at(payload, separator_pos, PLAYER_RECORD_SEPARATOR))
			continue;
		PlayerRecord record{};
		record.pos = pos;
		record.name.assign(reinterpret_cast<char const*>(&payload[name_pos]),
		                   length);
		record.profile_id = read_at<uint32_t>(
			payload, separator_pos + PLAYER_RECORD_SEPARATOR.size());
		record.end = end;
		return record;
	}
	return std::nullopt;
}

auto list_players(std::vector<uint8_t> const& payload, uint32_t count) noexcept
	-> std::vector<PlayerRecord>
{
	std::vector<PlayerRecord> records;
	size_t offset = 0U;
	for(uint32_t i = 0U; i < count; ++i)
	{
		auto record = find_player_record(payload, offset);
		if(!record)
			break;
		offset = record->end;
		records.emplace_back(std::move(*record));
	}
	return records;
}

auto anonymous_name(uint32_t number) noexcept -> std::string
{
	return "player " + std::to_string(number);
}

auto anonymize_players(std::vector<uint8_t>& payload, uint32_t count,
                       IEventSink& events) noexcept -> AnonymizePlayersResult
{
	AnonymizePlayersResult r{};
	size_t offset = 0U;
	// Follows the records as earlier renames shift them.
	size_t window_end = PLAYER_RECORD_WINDOW_END;
	for(uint32_t i = 0U; i < count; ++i)
	{
		auto const number = i + 1U;
		auto const record = find_player_record(payload, offset, window_end);
		if(!record)
		{
			events.warning("Did not find player " + std::to_string(number) +
			               " in lobby settings");
			r.failure = {FailureKind::NOT_FOUND,
			             "Could not anonymize player " + std::to_string(number)};
			return r;
		}
		auto const replacement = anonymous_name(number);
		events.info("Found player: " + record->name + " (" + replacement + ")");
		auto const old_length = record->name.size();
		auto const new_length = replacement.size();
		// The u8 length and its padding byte become a u16 length.
		if(!apply_patch(payload, {record->pos, sizeof(uint16_t) + old_length,
		                          length_prefixed(replacement, new_length)}))
		{
			r.failure = {FailureKind::SIZE_MISMATCH,
			             "Player record out of bounds"};
			return r;
		}
		window_end = window_end - old_length + new_length;
		auto const profile_pos = record->pos + sizeof(uint16_t) + new_length +
		                         PLAYER_RECORD_SEPARATOR.size();
		write_at<uint32_t>(payload, profile_pos, 0U);
		auto const player_end = profile_pos + PLAYER_PROFILE_ID_SIZE;
		auto const original = attribute_string(record->name);
		auto const attr = find_bytes(payload, player_end, original);
		auto const rewritten =
			attr && apply_patch(payload, {*attr, original.size(),
		                                  attribute_string(replacement)});
		if(!rewritten)
			events.warning("Did not find attributes string for player " +
			               std::to_string(number));
		r.players.push_back({replacement, rewritten});
		offset = player_end;
	}
	r.success = true;
	return r;
}
