/*
 * Copyright (c) 2024, Dylam De La Torre <dyxel04@gmail.com>
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_PRINT_DATE_HPP
#define ART_PRINT_DATE_HPP
#include <cstdint>

auto print_date(int32_t timestamp) noexcept -> void;

#endif // ART_PRINT_DATE_HPP
