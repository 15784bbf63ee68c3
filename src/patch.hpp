/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_PATCH_HPP
#define ART_PATCH_HPP
#include <cstddef>
#include <cstdint>
#include <vector>

// Substitutes `removed` bytes at `pos` with `bytes`.
struct Patch
{
	size_t pos;
	size_t removed;
	std::vector<uint8_t> bytes;
};

inline auto patch_delta(Patch const& p) noexcept -> std::ptrdiff_t
{
	return static_cast<std::ptrdiff_t>(p.bytes.size()) -
	       static_cast<std::ptrdiff_t>(p.removed);
}

// Everything after the patched range is shifted by `patch_delta`. Returns
// false and leaves the buffer untouched if the range is out of bounds.
auto apply_patch(std::vector<uint8_t>& buffer, Patch const& p) noexcept
	-> bool;

// Applies patches from the highest offset to the lowest so that the
// offsets of the remaining ones stay valid. Patches must not overlap.
auto apply_patches(std::vector<uint8_t>& buffer,
                   std::vector<Patch> patches) noexcept -> bool;

#endif // ART_PATCH_HPP
