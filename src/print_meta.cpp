/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "print_meta.hpp"

#include <iostream>

auto print_meta(RecFile const& rec) noexcept -> void
{
	auto const& h = rec.header;
	auto const m = decode_meta(rec.meta);
	std::cout << "Version: " << h.signature << " (" << h.version_major << '.'
			  << h.version_minor << ", game " << h.game_version << ", build "
			  << h.build << ")\n";
	std::cout << "Log version: " << rec.log_version << '\n';
	std::cout << "Checksum interval: " << m.checksum_interval << '\n';
	std::cout << "Multiplayer: " << std::boolalpha << m.multiplayer << '\n';
	std::cout << "Recording player: " << m.rec_owner << '\n';
	std::cout << "Reveal map: " << m.reveal_map << std::noboolalpha << '\n';
	std::cout << "Sequence numbers: " << m.use_sequence_numbers << '\n';
	std::cout << "Chapters: " << m.number_of_chapters << '\n';
	std::cout << "AoK or DE: " << m.aok_or_de << '\n';
}
