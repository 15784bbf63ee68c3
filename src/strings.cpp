/*
 * Copyright (c) 2022, Dylam De La Torre <dyxel04@gmail.com>
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "strings.hpp"

#include <codecvt>
#include <cstdint>
#include <locale>
#include <stdexcept> // std::range_error

namespace
{

#if defined(_MSC_VER) && _MSC_VER >= 1900 && _MSC_VER < 1920
using Wsc = std::wstring_convert<std::codecvt_utf8_utf16<int16_t>, int16_t>;
#else
using Wsc = std::wstring_convert<std::codecvt_utf8_utf16<char16_t>, char16_t>;
#endif // defined(_MSC_VER) && _MSC_VER >= 1900 && _MSC_VER < 1920

} // namespace

auto is_valid_utf8(std::string_view text) noexcept -> bool
{
	// Without error strings the converter throws on malformed input.
	try
	{
		Wsc wsc;
		(void)wsc.from_bytes(text.data(), text.data() + text.size());
	}
	catch(std::range_error const&)
	{
		return false;
	}
	return true;
}
