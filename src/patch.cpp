/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "patch.hpp"

#include <algorithm>
#include <cstring> // std::memcpy

auto apply_patch(std::vector<uint8_t>& buffer, Patch const& p) noexcept
	-> bool
{
	if(p.pos > buffer.size() || p.removed > buffer.size() - p.pos)
		return false;
	auto const first = buffer.begin() + static_cast<std::ptrdiff_t>(p.pos);
	if(p.bytes.size() == p.removed)
	{
		if(!p.bytes.empty())
			std::memcpy(buffer.data() + p.pos, p.bytes.data(), p.removed);
		return true;
	}
	if(p.bytes.size() < p.removed)
	{
		auto const it = std::copy(p.bytes.begin(), p.bytes.end(), first);
		buffer.erase(it, first + static_cast<std::ptrdiff_t>(p.removed));
		return true;
	}
	std::copy(p.bytes.begin(), p.bytes.begin() + static_cast<std::ptrdiff_t>(p.removed),
	          first);
	buffer.insert(first + static_cast<std::ptrdiff_t>(p.removed),
	              p.bytes.begin() + static_cast<std::ptrdiff_t>(p.removed),
	              p.bytes.end());
	return true;
}

auto apply_patches(std::vector<uint8_t>& buffer,
                   std::vector<Patch> patches) noexcept -> bool
{
	std::sort(patches.begin(), patches.end(),
	          [](Patch const& a, Patch const& b) { return a.pos > b.pos; });
	for(size_t i = 1U; i < patches.size(); ++i)
		if(patches[i].pos + patches[i].removed > patches[i - 1U].pos)
			return false;
	if(!patches.empty() && (patches.front().pos > buffer.size() ||
	                        patches.front().removed >
	                            buffer.size() - patches.front().pos))
		return false;
	for(auto const& p : patches)
		(void)apply_patch(buffer, p); // NOTE: Bounds checked above.
	return true;
}
