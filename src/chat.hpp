/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_CHAT_HPP
#define ART_CHAT_HPP
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "events.hpp"
#include "failure.hpp"

struct ChatPolicy
{
	bool keep_system{};
	bool keep_player{};
};

// Chat operation inside the operations stream. The payload is a JSON-like
// text carrying a `"player":N` field and a `messageAGP` display string.
struct ChatRecord
{
	size_t start; // 8 bytes before the sentinel.
	size_t payload_pos;
	size_t payload_size;

	constexpr auto end() const noexcept -> size_t
	{
		return payload_pos + payload_size;
	}
};

// Next chat record whose sentinel lies at or after `from + 8`.
auto find_chat_record(std::vector<uint8_t> const& ops, size_t from) noexcept
	-> std::optional<ChatRecord>;

auto extract_player_id(std::string_view payload) noexcept
	-> std::optional<uint32_t>;

// System messages reference the player through a `<player_id,N,0` token in
// their `messageAGP` value.
auto is_system_message(std::string_view payload) noexcept -> bool;

// "@#NN[<icon>]NAME: text" -> "@#NN[<icon>]player ID: text", looked up in
// the `messageAGP` value only. Returns nullopt if the payload carries no
// display name.
auto rewrite_player_message(std::string_view payload, uint32_t id) noexcept
	-> std::optional<std::string>;

// "<player_id,N,0,NAME>" -> "<player_id,N,0,player ID>". Returns nullopt if
// the token carries no name.
auto rewrite_system_message(std::string_view payload, uint32_t id) noexcept
	-> std::optional<std::string>;

struct ChatStats
{
	uint32_t found{};
	uint32_t dropped{};
	uint32_t player_rewritten{};
	uint32_t system_rewritten{};
	uint32_t unnamed{};
	uint32_t undecodable{};
};

// Record left unedited, with the reason.
struct ChatRecordFailure
{
	size_t offset;
	Failure failure;
};

struct RewriteChatResult
{
	bool success{};
	ChatStats stats{};
	std::vector<ChatRecordFailure> skipped;
	Failure failure{};
};

// Drops or rewrites every chat record of `ops` according to `policy`.
// Fails on a payload without a player id; undecodable payloads are left as
// they are and listed in `skipped`.
auto rewrite_chat(std::vector<uint8_t>& ops, ChatPolicy policy,
                  IEventSink& events) noexcept -> RewriteChatResult;

#endif // ART_CHAT_HPP
