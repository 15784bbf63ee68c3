/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_SEARCH_HPP
#define ART_SEARCH_HPP
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Position of the first occurrence of `needle` fully contained in
// [from, to) of `haystack`.
inline auto find_bytes(std::vector<uint8_t> const& haystack, size_t from,
                       size_t to, uint8_t const* needle,
                       size_t needle_size) noexcept -> std::optional<size_t>
{
	to = std::min(to, haystack.size());
	if(from >= to || to - from < needle_size)
		return std::nullopt;
	auto const first = haystack.begin() + static_cast<std::ptrdiff_t>(from);
	auto const last = haystack.begin() + static_cast<std::ptrdiff_t>(to);
	auto const it = std::search(first, last, needle, needle + needle_size);
	if(it == last)
		return std::nullopt;
	return static_cast<size_t>(it - haystack.begin());
}

template<typename Needle>
auto find_bytes(std::vector<uint8_t> const& haystack, size_t from, size_t to,
                Needle const& needle) noexcept -> std::optional<size_t>
{
	return find_bytes(haystack, from, to,
	                  reinterpret_cast<uint8_t const*>(needle.data()),
	                  needle.size());
}

template<typename Needle>
auto find_bytes(std::vector<uint8_t> const& haystack, size_t from,
                Needle const& needle) noexcept -> std::optional<size_t>
{
	return find_bytes(haystack, from, haystack.size(), needle);
}

template<typename Needle>
auto matches_at(std::vector<uint8_t> const& haystack, size_t pos,
                Needle const& needle) noexcept -> bool
{
	if(pos > haystack.size() || haystack.size() - pos < needle.size())
		return false;
	auto const* p = reinterpret_cast<uint8_t const*>(needle.data());
	return std::equal(p, p + needle.size(),
	                  haystack.begin() + static_cast<std::ptrdiff_t>(pos));
}

#endif // ART_SEARCH_HPP
