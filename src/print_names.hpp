/*
 * Copyright (c) 2022, Dylam De La Torre <dyxel04@gmail.com>
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_PRINT_NAMES_HPP
#define ART_PRINT_NAMES_HPP
#include <cstdint>
#include <vector>

auto print_names(std::vector<uint8_t> const& payload, uint32_t count) noexcept
	-> void;

#endif // ART_PRINT_NAMES_HPP
