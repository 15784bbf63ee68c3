/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_REC_FILE_HPP
#define ART_REC_FILE_HPP
#include <array>
#include <cstdint>
#include <vector>

#include "failure.hpp"
#include "header.hpp"

// Seven fields, booleans padded to 4 bytes.
constexpr size_t META_SIZE = 28U;

struct Meta
{
	uint32_t checksum_interval;
	bool multiplayer;
	uint32_t rec_owner;
	bool reveal_map;
	uint32_t use_sequence_numbers;
	uint32_t number_of_chapters;
	uint32_t aok_or_de;
};

// Record file envelope:
//   u32 header_length (compressed header size + 8)
//   u32 checksum
//   raw deflate header
//   u32 log_version
//   meta block
//   operations until the end of the file
struct RecFile
{
	uint32_t header_length;
	uint32_t checksum; // Copied through.
	Header header;
	uint32_t log_version;
	std::array<uint8_t, META_SIZE> meta; // Copied through.
	std::vector<uint8_t> operations;

	// Header block as read from disk and its decompressed form, used to
	// write unmodified headers back without recompressing them.
	std::vector<uint8_t> source_header;
	std::vector<uint8_t> source_header_raw;
};

auto decode_meta(std::array<uint8_t, META_SIZE> const& meta) noexcept -> Meta;

struct ParseRecResult
{
	bool success{};
	RecFile rec{};
	Failure failure{};
};

auto parse_rec(uint8_t const* data, size_t size) noexcept -> ParseRecResult;

struct WriteRecResult
{
	bool success{};
	std::vector<uint8_t> bytes;
	Failure failure{};
};

// Serializes `rec`, recomputing `rec.header_length` from the header block
// actually written.
auto write_rec(RecFile& rec) noexcept -> WriteRecResult;

#endif // ART_REC_FILE_HPP
