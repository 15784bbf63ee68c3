/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_TESTS_FIXTURES_HPP
#define ART_TESTS_FIXTURES_HPP
#include <cstdint>
#include <cstdio>
#include <cstring> // std::memcpy
#include <string>
#include <string_view>
#include <utility> // std::move
#include <vector>

#include "deflate.hpp"
#include "events.hpp"
#include "header.hpp"
#include "signatures.hpp"

#define EXPECT(cond, msg)                              \
	do                                                 \
	{                                                  \
		if(!(cond))                                    \
		{                                              \
			std::fprintf(stderr, "FAIL: %s\n", msg);   \
			return 1;                                  \
		}                                              \
	} while(0)

using Bytes = std::vector<uint8_t>;

class RecordingEventSink final : public IEventSink
{
public:
	auto info(std::string_view msg) noexcept -> void override
	{
		infos.emplace_back(msg);
	}

	auto warning(std::string_view msg) noexcept -> void override
	{
		warnings.emplace_back(msg);
	}

	std::vector<std::string> infos;
	std::vector<std::string> warnings;
};

template<typename T>
inline auto put(Bytes& out, T value) -> void
{
	auto const pos = out.size();
	out.resize(pos + sizeof(T));
	std::memcpy(out.data() + pos, &value, sizeof(T));
}

template<typename T>
inline auto get(Bytes const& in, size_t pos) -> T
{
	T value{};
	std::memcpy(&value, in.data() + pos, sizeof(T));
	return value;
}

inline auto put_str(Bytes& out, std::string_view s) -> void
{
	out.insert(out.end(), s.begin(), s.end());
}

template<typename Sig>
inline auto put_sig(Bytes& out, Sig const& sig) -> void
{
	out.insert(out.end(), sig.begin(), sig.end());
}

inline auto fill(Bytes& out, size_t n, uint8_t byte) -> void
{
	out.insert(out.end(), n, byte);
}

inline auto concat(std::vector<Bytes> const& parts) -> Bytes
{
	Bytes out;
	for(auto const& p : parts)
		out.insert(out.end(), p.begin(), p.end());
	return out;
}

// Player as stored in the lobby settings (`name`) and attributes
// (`attribute_name`, empty to leave it out).
struct PlayerSpec
{
	std::string name;
	uint32_t profile_id;
	std::string attribute_name;
	bool wide_length; // u16 length instead of u8 + padding.
};

inline auto original_player(std::string name, uint32_t profile_id)
	-> PlayerSpec
{
	return {name, profile_id, name, false};
}

inline auto anonymized_player(uint32_t number) -> PlayerSpec
{
	auto name = "player " + std::to_string(number);
	return {name, 0U, name, true};
}

// Lobby settings with the double separator and the player count, then one
// init record per player, then the attributes copies of the names.
inline auto make_payload(std::vector<PlayerSpec> const& players,
                         uint32_t player_count) -> Bytes
{
	Bytes out;
	fill(out, 16U, 0x11U);
	put_sig(out, LOBBY_SEPARATOR);
	put_sig(out, LOBBY_SEPARATOR);
	put(out, 1.5F);       // speed
	put(out, uint32_t{0U}); // treaty length
	put(out, uint32_t{200U}); // population limit
	put(out, player_count);
	for(auto const& p : players)
	{
		fill(out, 6U, 0x11U);
		put_sig(out, PLAYER_RECORD_PREFIX);
		if(p.wide_length)
			put(out, static_cast<uint16_t>(p.name.size()));
		else
		{
			out.push_back(static_cast<uint8_t>(p.name.size()));
			out.push_back(0U);
		}
		put_str(out, p.name);
		put_sig(out, PLAYER_RECORD_SEPARATOR);
		put(out, p.profile_id);
	}
	fill(out, 64U, 0x11U);
	for(auto const& p : players)
	{
		if(p.attribute_name.empty())
			continue;
		fill(out, 4U, 0x22U);
		put(out, static_cast<uint16_t>(p.attribute_name.size() + 1U));
		put_str(out, p.attribute_name);
		out.push_back(0U);
	}
	fill(out, 8U, 0x22U);
	return out;
}

inline auto make_header(Bytes payload) -> Header
{
	Header h{};
	h.signature = "VER 9.4";
	h.checker = 13.34F;
	h.version_minor = 3U;
	h.version_major = 1U;
	h.game_version = 1000.0F;
	h.build = 101129U;
	h.timestamp = 1700000000;
	h.version = {101U, 129U};
	h.internal_version = {1000U, 14U};
	h.payload = std::move(payload);
	return h;
}

inline auto make_chat_record(std::string_view payload) -> Bytes
{
	Bytes out;
	fill(out, CHAT_LEAD_SIZE, 0x77U);
	put_sig(out, CHAT_SENTINEL);
	put(out, static_cast<uint16_t>(payload.size()));
	put(out, uint16_t{0U});
	put_str(out, payload);
	return out;
}

inline auto player_chat(uint32_t id, std::string_view display) -> std::string
{
	return "{\"player\":" + std::to_string(id) +
	       ",\"channel\":0,\"message\":\"gl hf\",\"messageAGP\":\"@#29" +
	       std::string{display} + ": gl hf\"}";
}

inline auto system_chat(uint32_t id, std::string_view name) -> std::string
{
	return "{\"player\":" + std::to_string(id) +
	       ",\"channel\":0,\"message\":\"\",\"messageAGP\":\"@#29<player_id," +
	       std::to_string(id) + ",0," + std::string{name} + "> resigned.\"}";
}

struct RatingSpec
{
	uint32_t player_id;
	uint32_t unknown;
	uint32_t rating;
};

inline auto make_rating_block(std::vector<RatingSpec> const& entries,
                              size_t gap = 24U) -> Bytes
{
	Bytes out;
	put_sig(out, POSTGAME_OPERATION_TAG);
	fill(out, gap, 0x33U);
	put(out, static_cast<uint32_t>(entries.size()));
	for(auto const& e : entries)
	{
		put(out, e.player_id);
		put(out, e.unknown);
		put(out, e.rating);
	}
	return out;
}

inline auto make_meta() -> Bytes
{
	Bytes out;
	put(out, uint32_t{500U}); // checksum interval
	put(out, uint32_t{1U});   // multiplayer + padding
	put(out, uint32_t{2U});   // recording player
	put(out, uint32_t{0U});   // reveal map + padding
	put(out, uint32_t{1U});   // sequence numbers
	put(out, uint32_t{0U});   // chapters
	put(out, uint32_t{0U});   // aok or de
	return out;
}

inline auto make_rec_bytes(Header const& header, Bytes const& ops) -> Bytes
{
	auto const raw = serialize_header(header);
	auto const compressed = deflate_raw(raw.data(), raw.size());
	Bytes out;
	put(out, static_cast<uint32_t>(compressed.data.size() + 8U));
	put(out, uint32_t{0xCAFEBABEU});
	out.insert(out.end(), compressed.data.begin(), compressed.data.end());
	put(out, uint32_t{5U});
	auto const meta = make_meta();
	out.insert(out.end(), meta.begin(), meta.end());
	out.insert(out.end(), ops.begin(), ops.end());
	return out;
}

#endif // ART_TESTS_FIXTURES_HPP
