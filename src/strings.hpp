/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_STRINGS_HPP
#define ART_STRINGS_HPP
#include <string_view>

auto is_valid_utf8(std::string_view text) noexcept -> bool;

#endif // ART_STRINGS_HPP
