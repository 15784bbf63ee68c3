/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "chat.hpp"

#include <cstring> // std::memcpy
#include <limits> // std::numeric_limits
#include <utility> // std::move

#include "patch.hpp"
#include "search.hpp"
#include "signatures.hpp"
#include "strings.hpp"

namespace
{

#include "read.inl"

constexpr std::string_view PLAYER_ID_FIELD = "\"player\":";
constexpr std::string_view SYSTEM_TOKEN = "<player_id,";
constexpr std::string_view DISPLAY_FIELD = "\"messageAGP\":\"";
constexpr std::string_view NAME_MARKER = "@#";
constexpr std::string_view NAME_TERMINATOR = ": ";

constexpr auto is_digit(char c) noexcept -> bool
{
	return c >= '0' && c <= '9';
}

// Index one past the run of digits starting at `pos`.
constexpr auto skip_digits(std::string_view s, size_t pos) noexcept -> size_t
{
	while(pos < s.size() && is_digit(s[pos]))
		++pos;
	return pos;
}

// Start of the `messageAGP` value or npos. The typed text in `message` is
// never searched for names.
auto find_display_value(std::string_view payload) noexcept -> size_t
{
	auto const key = payload.find(DISPLAY_FIELD);
	if(key == std::string_view::npos)
		return std::string_view::npos;
	return key + DISPLAY_FIELD.size();
}

// Position right after `<player_id,N,0` in the display value or npos.
auto find_system_token(std::string_view payload) noexcept -> size_t
{
	auto const value = find_display_value(payload);
	if(value == std::string_view::npos)
		return std::string_view::npos;
	for(auto pos = payload.find(SYSTEM_TOKEN, value);
	    pos != std::string_view::npos;
	    pos = payload.find(SYSTEM_TOKEN, pos + 1U))
	{
		auto const digits = pos + SYSTEM_TOKEN.size();
		auto const after = skip_digits(payload, digits);
		if(after == digits || payload.substr(after, 2U) != ",0")
			continue;
		return after + 2U;
	}
	return std::string_view::npos;
}

auto payload_view(std::vector<uint8_t> const& ops, ChatRecord const& rec)
	noexcept -> std::string_view
{
	return {reinterpret_cast<char const*>(ops.data() + rec.payload_pos),
	        rec.payload_size};
}

auto offset_str(size_t offset) noexcept -> std::string
{
	return "offset " + std::to_string(offset);
}

} // namespace

auto find_chat_record(std::vector<uint8_t> const& ops, size_t from) noexcept
	-> std::optional<ChatRecord>
{
	auto const header_size = CHAT_SENTINEL.size() + CHAT_LENGTH_FIELD_SIZE;
	auto search_from = from + CHAT_LEAD_SIZE;
	while(auto const sentinel = find_bytes(ops, search_from, CHAT_SENTINEL))
	{
		search_from = *sentinel + 1U;
		if(ops.size() - *sentinel < header_size)
			break;
		auto const length_pos = *sentinel + CHAT_SENTINEL.size();
		if(ops[length_pos + 2U] != 0U || ops[length_pos + 3U] != 0U)
			continue;
		auto const length = size_t{read_at<uint16_t>(ops, length_pos)};
		auto const payload_pos = *sentinel + header_size;
		if(length > ops.size() - payload_pos)
			continue;
		return ChatRecord{*sentinel - CHAT_LEAD_SIZE, payload_pos, length};
	}
	return std::nullopt;
}

auto extract_player_id(std::string_view payload) noexcept
	-> std::optional<uint32_t>
{
	for(auto pos = payload.find(PLAYER_ID_FIELD); pos != std::string_view::npos;
	    pos = payload.find(PLAYER_ID_FIELD, pos + 1U))
	{
		auto digits = pos + PLAYER_ID_FIELD.size();
		while(digits < payload.size() && payload[digits] == ' ')
			++digits;
		auto const after = skip_digits(payload, digits);
		// Player numbers have at most two digits.
		if(after == digits || after - digits > 2U)
			continue;
		uint32_t id = 0U;
		for(auto i = digits; i != after; ++i)
			id = id * 10U + static_cast<uint32_t>(payload[i] - '0');
		return id;
	}
	return std::nullopt;
}

auto is_system_message(std::string_view payload) noexcept -> bool
{
	return find_system_token(payload) != std::string_view::npos;
}

auto rewrite_player_message(std::string_view payload, uint32_t id) noexcept
	-> std::optional<std::string>
{
	auto const value = find_display_value(payload);
	if(value == std::string_view::npos)
		return std::nullopt;
	auto name_pos = std::string_view::npos;
	for(auto pos = payload.find(NAME_MARKER, value);
	    pos != std::string_view::npos;
	    pos = payload.find(NAME_MARKER, pos + 1U))
	{
		auto const digits = pos + NAME_MARKER.size();
		if(skip_digits(payload, digits) - digits != 2U)
			continue;
		name_pos = digits + 2U;
		break;
	}
	if(name_pos == std::string_view::npos)
		return std::nullopt;
	// Optional platform icon tag, e.g. "<icon_steam>".
	if(name_pos < payload.size() && payload[name_pos] == '<')
	{
		auto const close = payload.find('>', name_pos);
		if(close != std::string_view::npos)
			name_pos = close + 1U;
	}
	auto const terminator = payload.find(NAME_TERMINATOR, name_pos);
	if(terminator == std::string_view::npos)
		return std::nullopt;
	std::string out{payload.substr(0U, name_pos)};
	out.append("player ").append(std::to_string(id)).append(NAME_TERMINATOR);
	out.append(payload.substr(terminator + NAME_TERMINATOR.size()));
	return out;
}

auto rewrite_system_message(std::string_view payload, uint32_t id) noexcept
	-> std::optional<std::string>
{
	auto const token_end = find_system_token(payload);
	if(token_end == std::string_view::npos || token_end >= payload.size() ||
	   payload[token_end] != ',')
		return std::nullopt;
	auto const name_pos = token_end + 1U;
	auto const close = payload.find('>', name_pos);
	if(close == std::string_view::npos)
		return std::nullopt;
	std::string out{payload.substr(0U, name_pos)};
	out.append("player ").append(std::to_string(id));
	out.append(payload.substr(close));
	return out;
}

auto rewrite_chat(std::vector<uint8_t>& ops, ChatPolicy policy,
                  IEventSink& events) noexcept -> RewriteChatResult
{
	RewriteChatResult r{};
	auto& stats = r.stats;
	auto const drop_all = !policy.keep_system && !policy.keep_player;
	size_t cursor = 0U;
	while(auto const rec = find_chat_record(ops, cursor))
	{
		++stats.found;
		auto drop = [&]()
		{
			ops.erase(ops.begin() + static_cast<std::ptrdiff_t>(rec->start),
			          ops.begin() + static_cast<std::ptrdiff_t>(rec->end()));
			++stats.dropped;
			// Content after the record moved to its start.
			cursor = rec->start;
		};
		if(drop_all)
		{
			drop();
			continue;
		}
		auto const payload = payload_view(ops, *rec);
		auto const id = extract_player_id(payload);
		if(!id)
		{
			r.failure = {FailureKind::NOT_FOUND,
			             "Chat message at " + offset_str(rec->start) +
			                 " has no player id"};
			return r;
		}
		auto const system = is_system_message(payload);
		if(system ? !policy.keep_system : !policy.keep_player)
		{
			drop();
			continue;
		}
		cursor = rec->start + 1U;
		if(!is_valid_utf8(payload))
		{
			++stats.undecodable;
			Failure f{FailureKind::ENCODING, "Chat message at " +
			                                     offset_str(rec->start) +
			                                     " is not valid UTF-8"};
			events.warning(f.reason + ", left unedited");
			r.skipped.push_back({rec->start, std::move(f)});
			continue;
		}
		auto const rewritten = system ? rewrite_system_message(payload, *id)
		                              : rewrite_player_message(payload, *id);
		if(!rewritten)
		{
			++stats.unnamed;
			continue;
		}
		if(rewritten->size() > std::numeric_limits<uint16_t>::max())
		{
			Failure f{FailureKind::SIZE_MISMATCH,
			          "Chat message at " + offset_str(rec->start) +
			              " does not fit its length field"};
			events.warning(f.reason + ", left unedited");
			r.skipped.push_back({rec->start, std::move(f)});
			continue;
		}
		Patch p{rec->payload_pos, rec->payload_size,
		        std::vector<uint8_t>(rewritten->begin(), rewritten->end())};
		write_at(ops, rec->start + CHAT_LEAD_SIZE + CHAT_SENTINEL.size(),
		         static_cast<uint16_t>(rewritten->size()));
		(void)apply_patch(ops, p); // NOTE: Range located by find_chat_record.
		if(system)
			++stats.system_rewritten;
		else
			++stats.player_rewritten;
		events.info("Rewrote " + std::string{system ? "system" : "player"} +
		            " chat message of player " + std::to_string(*id));
	}
	r.success = true;
	return r;
}
