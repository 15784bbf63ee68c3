/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_HEADER_HPP
#define ART_HEADER_HPP
#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "failure.hpp"

// Decompressed header of a record file. Only the scalar prefix is decoded,
// everything after it (lobby settings, AI config, replay, map info and the
// per-player init records) is kept as an opaque payload that the locators
// in players.hpp search by signature.
struct Header
{
	std::string signature; // Written back followed by a NUL.
	float checker;
	uint16_t version_minor;
	uint16_t version_major;
	float game_version;
	uint32_t build;
	int32_t timestamp;
	std::array<uint16_t, 2U> version;
	std::array<uint16_t, 2U> internal_version;
	std::vector<uint8_t> payload;
};

constexpr size_t HEADER_SCALARS_SIZE =
	sizeof(float) + sizeof(uint16_t) * 2U + sizeof(float) + sizeof(uint32_t) +
	sizeof(int32_t) + sizeof(uint16_t) * 4U;

auto operator==(Header const& lhs, Header const& rhs) noexcept -> bool;
auto operator!=(Header const& lhs, Header const& rhs) noexcept -> bool;

struct ParseHeaderResult
{
	bool success{};
	Header header{};
	Failure failure{};
};

auto parse_header(uint8_t const* data, size_t size, bool compressed) noexcept
	-> ParseHeaderResult;

// Signature, NUL, scalars and payload, uncompressed.
auto serialize_header(Header const& header) noexcept -> std::vector<uint8_t>;

struct PackHeaderResult
{
	bool success{};
	std::vector<uint8_t> bytes;
	Failure failure{};
};

// Raw deflate of `serialize_header`.
auto pack_header(Header const& header) noexcept -> PackHeaderResult;

#endif // ART_HEADER_HPP
