/*
 * Copyright (c) 2024, Dylam De La Torre <dyxel04@gmail.com>
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "report.hpp"

#include <google/protobuf/arena.h>
#include <google/protobuf/util/json_util.h>

#include "report.pb.h"

namespace
{

using PBArena = google::protobuf::Arena;

auto fill(Art::Proto::Report& report, RecFile const& rec,
          AnonymizeResult const& result) noexcept -> void
{
	report.set_success(result.success);
	if(!result.success)
	{
		report.set_failure_kind(
			std::string{failure_kind_name(result.failure.kind)});
		report.set_failure(result.failure.reason);
	}
	report.set_log_version(rec.log_version);
	report.set_header_length(rec.header_length);
	report.set_player_count(result.player_count);
	uint32_t number = 0U;
	for(auto const& p : result.players)
	{
		auto* player = report.add_players();
		player->set_number(++number);
		player->set_replacement(p.replacement);
		player->set_attributes_rewritten(p.attributes_rewritten);
	}
	auto* chat = report.mutable_chat();
	chat->set_found(result.chat.found);
	chat->set_dropped(result.chat.dropped);
	chat->set_player_rewritten(result.chat.player_rewritten);
	chat->set_system_rewritten(result.chat.system_rewritten);
	chat->set_unnamed(result.chat.unnamed);
	chat->set_undecodable(result.chat.undecodable);
	for(auto const& s : result.chat_skipped)
		chat->add_skipped_offsets(s.offset);
	report.set_rating_block_offset(result.rating_block_pos);
	for(auto const& e : result.ratings)
	{
		auto* rating = report.add_ratings();
		rating->set_player_id(e.player_id);
		rating->set_unknown(e.unknown);
		rating->set_rating(e.rating);
	}
}

} // namespace

auto report_json(RecFile const& rec, AnonymizeResult const& result) noexcept
	-> std::string
{
	PBArena arena;
	auto& report = *PBArena::Create<Art::Proto::Report>(&arena);
	fill(report, rec, result);
	std::string out;
	auto options = google::protobuf::util::JsonPrintOptions{};
	options.always_print_primitive_fields = true;
	options.preserve_proto_field_names = true;
	(void)google::protobuf::util::MessageToJsonString(report, &out, options);
	return out;
}
