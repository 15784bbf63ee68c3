/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_PRINT_META_HPP
#define ART_PRINT_META_HPP
#include "rec_file.hpp"

auto print_meta(RecFile const& rec) noexcept -> void;

#endif // ART_PRINT_META_HPP
