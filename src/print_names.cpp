/*
 * Copyright (c) 2022, Dylam De La Torre <dyxel04@gmail.com>
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "print_names.hpp"

#include <iostream>

#include "players.hpp"
#include "strings.hpp"

namespace
{

constexpr const char* ERROR_STR = "Invalid String";
constexpr auto SEP_STR = ", ";

} // namespace

auto print_names(std::vector<uint8_t> const& payload, uint32_t count) noexcept
	-> void
{
	auto const records = list_players(payload, count);
	auto* pad = "";
	for(auto const& r : records)
	{
		std::cout << pad << (is_valid_utf8(r.name) ? r.name.c_str() : ERROR_STR);
		pad = SEP_STR;
	}
	std::cout << '\n';
	if(records.size() != count)
		std::cout << "(" << records.size() << " of " << count
				  << " players found)\n";
}
