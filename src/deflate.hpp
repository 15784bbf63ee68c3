/*
 * Copyright (c) 2022, Dylam De La Torre <dyxel04@gmail.com>
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_DEFLATE_HPP
#define ART_DEFLATE_HPP
#include <cstdint>
#include <vector>

#include "failure.hpp"

constexpr int DEFAULT_DEFLATE_LEVEL = 6;

struct CodecResult
{
	bool success{};
	std::vector<uint8_t> data;
	Failure failure{};
};

// Both directions work on headerless deflate streams: no zlib wrapper and no
// adler32 trailer, which is what the game writes into its record files.
auto inflate_raw(uint8_t const* src, size_t src_size) noexcept -> CodecResult;

auto deflate_raw(uint8_t const* src, size_t src_size,
                 int level = DEFAULT_DEFLATE_LEVEL) noexcept -> CodecResult;

#endif // ART_DEFLATE_HPP
