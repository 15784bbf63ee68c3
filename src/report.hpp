/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_REPORT_HPP
#define ART_REPORT_HPP
#include <string>

#include "anonymize.hpp"
#include "rec_file.hpp"

// JSON summary of a pass over `rec`.
auto report_json(RecFile const& rec, AnonymizeResult const& result) noexcept
	-> std::string;

#endif // ART_REPORT_HPP
