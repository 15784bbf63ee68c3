/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "chat.hpp"
#include "fixtures.hpp"

namespace
{

auto filler(size_t n) -> Bytes
{
	Bytes out;
	fill(out, n, 0x55U);
	return out;
}

auto test_find_record() -> int
{
	auto const payload = player_chat(1U, "Alice");
	auto const ops = concat({filler(10U), make_chat_record(payload),
	                         filler(5U)});
	auto const rec = find_chat_record(ops, 0U);
	EXPECT(rec.has_value(), "found");
	EXPECT(rec->start == 10U, "record start");
	EXPECT(rec->payload_pos == 10U + 8U + 8U + 4U, "payload position");
	EXPECT(rec->payload_size == payload.size(), "payload size");
	EXPECT(rec->end() == ops.size() - 5U, "record end");
	EXPECT(!find_chat_record(ops, rec->start + 1U).has_value(),
	       "resume past start skips the record");
	return 0;
}

auto test_find_rejects_bad_length() -> int
{
	auto ops = concat({filler(8U), make_chat_record(player_chat(1U, "A"))});
	auto truncated = ops;
	truncated.resize(truncated.size() - 1U);
	EXPECT(!find_chat_record(truncated, 0U).has_value(),
	       "payload past the end");
	ops[8U + 8U + 8U + 2U] = 0x01U; // Upper length bytes must be zero.
	EXPECT(!find_chat_record(ops, 0U).has_value(), "nonzero padding");
	return 0;
}

auto test_payload_helpers() -> int
{
	EXPECT(extract_player_id(player_chat(3U, "X")) == 3U, "player id");
	EXPECT(extract_player_id("{\"player\": 4}") == 4U, "spaced player id");
	EXPECT(!extract_player_id("{\"channel\":1}").has_value(), "no player id");
	EXPECT(is_system_message(system_chat(2U, "Bob")), "system");
	EXPECT(!is_system_message(player_chat(2U, "Bob")), "player");
	EXPECT(!is_system_message("<player_id,x,0"), "token needs digits");
	EXPECT(rewrite_player_message(player_chat(1U, "Alice"), 1U) ==
	           player_chat(1U, "player 1"),
	       "player rewrite");
	EXPECT(rewrite_player_message("\"messageAGP\":\"@#29<icon_steam>Alice: hi\"",
	                              1U) ==
	           std::string{"\"messageAGP\":\"@#29<icon_steam>player 1: hi\""},
	       "icon tag kept");
	EXPECT(!rewrite_player_message("{\"player\":1,\"message\":\"hi\"}", 1U)
	            .has_value(),
	       "no display name");
	EXPECT(rewrite_system_message(system_chat(2U, "Bob"), 2U) ==
	           system_chat(2U, "player 2"),
	       "system rewrite");
	EXPECT(!rewrite_system_message("<player_id,2,0> resigned", 2U).has_value(),
	       "token without name");
	return 0;
}

auto test_typed_marker_ignored() -> int
{
	// The typed text looks like a display name; only messageAGP carries one.
	std::string const payload =
		"{\"player\":1,\"channel\":0,\"message\":\"@#12 see: here\","
		"\"messageAGP\":\"@#29Alice: @#12 see: here\"}";
	std::string const expected =
		"{\"player\":1,\"channel\":0,\"message\":\"@#12 see: here\","
		"\"messageAGP\":\"@#29player 1: @#12 see: here\"}";
	EXPECT(rewrite_player_message(payload, 1U) == expected, "display name");
	auto ops = concat({filler(4U), make_chat_record(payload)});
	NullEventSink events;
	auto const r = rewrite_chat(ops, {true, true}, events);
	EXPECT(r.success && r.stats.player_rewritten == 1U, "rewritten");
	EXPECT(ops == concat({filler(4U), make_chat_record(expected)}),
	       "typed text untouched");
	// A typed system token does not make a player message a system one.
	EXPECT(!is_system_message("{\"player\":1,\"message\":\"<player_id,1,0,x>\"}"),
	       "token only in the typed text");
	return 0;
}

auto test_drop_all() -> int
{
	auto const a = filler(16U);
	auto const b = filler(7U);
	auto const c = filler(30U);
	auto ops = concat({a, make_chat_record(player_chat(1U, "Alice")), b,
	                   make_chat_record(system_chat(2U, "Bob")), c});
	RecordingEventSink events;
	auto const r = rewrite_chat(ops, {false, false}, events);
	EXPECT(r.success, "drop all");
	EXPECT(r.stats.found == 2U && r.stats.dropped == 2U, "both dropped");
	EXPECT(ops == concat({a, b, c}), "only the records removed");
	return 0;
}

auto test_drop_all_adjacent() -> int
{
	// Records back to back; the second one starts where the first was.
	auto ops = concat({make_chat_record(player_chat(1U, "A")),
	                   make_chat_record(player_chat(2U, "B")),
	                   make_chat_record("{}"), filler(4U)});
	NullEventSink events;
	auto const r = rewrite_chat(ops, {false, false}, events);
	EXPECT(r.success && r.stats.dropped == 3U, "all dropped");
	EXPECT(ops == filler(4U), "tail kept");
	return 0;
}

auto test_keep_player_only() -> int
{
	auto const a = filler(16U);
	auto const b = filler(7U);
	auto ops = concat({a, make_chat_record(player_chat(1U, "Alice")), b,
	                   make_chat_record(system_chat(2U, "Bob")), a});
	RecordingEventSink events;
	auto const r = rewrite_chat(ops, {false, true}, events);
	EXPECT(r.success, "keep player");
	EXPECT(r.stats.player_rewritten == 1U, "player rewritten");
	EXPECT(r.stats.dropped == 1U, "system dropped");
	auto const rewritten = player_chat(1U, "player 1");
	EXPECT(ops == concat({a, make_chat_record(rewritten), b, a}),
	       "player name replaced, system removed");
	EXPECT(rewritten.find("\"player\":1,") != std::string::npos,
	       "player field untouched");
	return 0;
}

auto test_keep_system_only() -> int
{
	auto const a = filler(16U);
	auto ops = concat({a, make_chat_record(player_chat(1U, "Alice")), a,
	                   make_chat_record(system_chat(2U, "Bob")), a});
	NullEventSink events;
	auto const r = rewrite_chat(ops, {true, false}, events);
	EXPECT(r.success, "keep system");
	EXPECT(r.stats.system_rewritten == 1U && r.stats.dropped == 1U,
	       "counts");
	EXPECT(ops == concat({a, a, make_chat_record(system_chat(2U, "player 2")),
	                      a}),
	       "system name replaced, player removed");
	return 0;
}

auto test_keep_both_resizes() -> int
{
	auto const a = filler(3U);
	std::string const long_name(300U, 'x');
	auto ops = concat({a, make_chat_record(player_chat(1U, long_name)), a,
	                   make_chat_record(player_chat(2U, "Bo")), a,
	                   make_chat_record(system_chat(1U, long_name)), a});
	NullEventSink events;
	auto const r = rewrite_chat(ops, {true, true}, events);
	EXPECT(r.success, "keep both");
	EXPECT(r.stats.found == 3U, "found");
	EXPECT(r.stats.player_rewritten == 2U && r.stats.system_rewritten == 1U,
	       "counts");
	EXPECT(ops == concat({a, make_chat_record(player_chat(1U, "player 1")), a,
	                      make_chat_record(player_chat(2U, "player 2")), a,
	                      make_chat_record(system_chat(1U, "player 1")), a}),
	       "every record rewritten in place");
	auto again = ops;
	EXPECT(rewrite_chat(again, {true, true}, events).success, "second pass");
	EXPECT(again == ops, "second pass changes nothing");
	return 0;
}

auto test_missing_player_id() -> int
{
	std::string const payload = "{\"channel\":0,\"messageAGP\":\"@#29A: hi\"}";
	auto ops = concat({filler(4U), make_chat_record(payload)});
	auto const original = ops;
	NullEventSink events;
	auto r = rewrite_chat(ops, {true, true}, events);
	EXPECT(!r.success, "fails");
	EXPECT(r.failure.kind == FailureKind::NOT_FOUND, "kind");
	EXPECT(ops == original, "nothing changed");
	r = rewrite_chat(ops, {false, false}, events);
	EXPECT(r.success, "dropping needs no player id");
	return 0;
}

auto test_undecodable_left_alone() -> int
{
	auto const payload = player_chat(1U, "Al\xFF" "ce");
	auto ops = concat({filler(4U), make_chat_record(payload),
	                   make_chat_record(player_chat(2U, "Bob"))});
	RecordingEventSink events;
	auto const r = rewrite_chat(ops, {true, true}, events);
	EXPECT(r.success, "pass continues");
	EXPECT(r.stats.undecodable == 1U, "counted");
	EXPECT(r.skipped.size() == 1U, "listed");
	EXPECT(r.skipped[0].offset == 4U, "offset");
	EXPECT(r.skipped[0].failure.kind == FailureKind::ENCODING, "kind");
	EXPECT(events.warnings.size() == 1U, "warned");
	EXPECT(ops == concat({filler(4U), make_chat_record(payload),
	                      make_chat_record(player_chat(2U, "player 2"))}),
	       "undecodable kept, next one rewritten");
	return 0;
}

} // namespace

auto main() -> int
{
	if(test_find_record() != 0) return 1;
	if(test_find_rejects_bad_length() != 0) return 1;
	if(test_payload_helpers() != 0) return 1;
	if(test_typed_marker_ignored() != 0) return 1;
	if(test_drop_all() != 0) return 1;
	if(test_drop_all_adjacent() != 0) return 1;
	if(test_keep_player_only() != 0) return 1;
	if(test_keep_system_only() != 0) return 1;
	if(test_keep_both_resizes() != 0) return 1;
	if(test_missing_player_id() != 0) return 1;
	if(test_undecodable_left_alone() != 0) return 1;
	return 0;
}
