/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "rec_file.hpp"

#include <cstring> // std::memcpy
#include <string>
#include <utility> // std::move

#include "deflate.hpp"

namespace
{

#include "read.inl"

constexpr size_t ENVELOPE_PREFIX_SIZE = sizeof(uint32_t) * 2U;

auto size_mismatch(ParseRecResult& r, std::string reason) noexcept
	-> ParseRecResult&
{
	r.success = false;
	r.failure = {FailureKind::SIZE_MISMATCH, std::move(reason)};
	return r;
}

} // namespace

auto decode_meta(std::array<uint8_t, META_SIZE> const& meta) noexcept -> Meta
{
	auto const* ptr = meta.data();
	Meta m{};
	m.checksum_interval = read<uint32_t>(ptr);
	m.multiplayer = read<uint32_t>(ptr) & 0xFFU;
	m.rec_owner = read<uint32_t>(ptr);
	m.reveal_map = read<uint32_t>(ptr) & 0xFFU;
	m.use_sequence_numbers = read<uint32_t>(ptr);
	m.number_of_chapters = read<uint32_t>(ptr);
	m.aok_or_de = read<uint32_t>(ptr);
	return m;
}

auto parse_rec(uint8_t const* data, size_t size) noexcept -> ParseRecResult
{
	ParseRecResult r{};
	auto& rec = r.rec;
	decltype(data) const sentry = data + size;
	auto const* ptr = data;
	if(size < ENVELOPE_PREFIX_SIZE)
		return size_mismatch(r, "File too small");
	rec.header_length = read<uint32_t>(ptr);
	rec.checksum = read<uint32_t>(ptr);
	if(rec.header_length < ENVELOPE_PREFIX_SIZE)
		return size_mismatch(r, "Header length is smaller than the envelope");
	auto const header_size = size_t{rec.header_length} - ENVELOPE_PREFIX_SIZE;
	if(static_cast<size_t>(sentry - ptr) < header_size)
		return size_mismatch(r, "Header length exceeds the file size");
	rec.source_header.assign(ptr, ptr + header_size);
	ptr += header_size;
	auto inflated = inflate_raw(rec.source_header.data(), header_size);
	if(!inflated.success)
	{
		r.failure = std::move(inflated.failure);
		return r;
	}
	auto parsed = parse_header(inflated.data.data(), inflated.data.size(),
	                           false);
	if(!parsed.success)
	{
		r.failure = std::move(parsed.failure);
		return r;
	}
	rec.header = std::move(parsed.header);
	rec.source_header_raw = std::move(inflated.data);
	if(static_cast<size_t>(sentry - ptr) < sizeof(uint32_t) + META_SIZE)
		return size_mismatch(r, "File ends before the meta block");
	rec.log_version = read<uint32_t>(ptr);
	std::memcpy(rec.meta.data(), ptr, META_SIZE);
	ptr += META_SIZE;
	rec.operations.assign(ptr, sentry);
	r.success = true;
	return r;
}

auto write_rec(RecFile& rec) noexcept -> WriteRecResult
{
	WriteRecResult r{};
	auto raw = serialize_header(rec.header);
	if(raw != rec.source_header_raw || rec.source_header.empty())
	{
		auto packed = pack_header(rec.header);
		if(!packed.success)
		{
			r.failure = std::move(packed.failure);
			return r;
		}
		rec.source_header = std::move(packed.bytes);
		rec.source_header_raw = std::move(raw);
	}
	rec.header_length =
		static_cast<uint32_t>(rec.source_header.size() + ENVELOPE_PREFIX_SIZE);
	auto& out = r.bytes;
	out.reserve(rec.header_length + sizeof(uint32_t) + META_SIZE +
	            rec.operations.size());
	append(out, rec.header_length);
	append(out, rec.checksum);
	out.insert(out.end(), rec.source_header.begin(), rec.source_header.end());
	append(out, rec.log_version);
	out.insert(out.end(), rec.meta.begin(), rec.meta.end());
	out.insert(out.end(), rec.operations.begin(), rec.operations.end());
	r.success = true;
	return r;
}
