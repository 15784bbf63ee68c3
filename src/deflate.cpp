/*
 * Copyright (c) 2022, Dylam De La Torre <dyxel04@gmail.com>
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "deflate.hpp"

#include <limits> // std::numeric_limits
#include <string>
#include <utility> // std::move
#include <zlib.h>

namespace
{

constexpr size_t CHUNK_SIZE = 16U * 1024U;

auto fail_with(CodecResult& r, std::string reason) noexcept -> CodecResult&
{
	r.success = false;
	r.data.clear();
	r.failure = {FailureKind::COMPRESSION, std::move(reason)};
	return r;
}

auto describe(z_stream const& stream, char const* what) noexcept -> std::string
{
	std::string s{what};
	if(stream.msg != nullptr)
		s.append(": ").append(stream.msg);
	return s;
}

} // namespace

auto inflate_raw(uint8_t const* src, size_t src_size) noexcept -> CodecResult
{
	CodecResult r{};
	if(src_size > std::numeric_limits<uInt>::max())
		return fail_with(r, "Compressed block too large");
	z_stream stream{};
	stream.next_in = const_cast<Bytef*>(src);
	stream.avail_in = static_cast<uInt>(src_size);
	// Negative window bits select a raw stream (RFC 1951 only).
	if(inflateInit2(&stream, -MAX_WBITS) != Z_OK)
		return fail_with(r, "Unable to initialize inflate stream");
	struct End // Close the stream regardless of how we end decompression.
	{
		z_stream& s;
		~End() { inflateEnd(&s); }
	} _{stream};
	int step = Z_OK;
	while(step != Z_STREAM_END)
	{
		auto const produced = r.data.size();
		r.data.resize(produced + CHUNK_SIZE);
		stream.next_out = r.data.data() + produced;
		stream.avail_out = static_cast<uInt>(CHUNK_SIZE);
		step = inflate(&stream, Z_NO_FLUSH);
		r.data.resize(produced + (CHUNK_SIZE - stream.avail_out));
		if(step == Z_STREAM_END)
			break;
		if(step == Z_BUF_ERROR && stream.avail_in == 0U)
			return fail_with(r, "Compressed block is truncated");
		if(step != Z_OK)
			return fail_with(r, describe(stream, "Stream decoding failed"));
	}
	r.success = true;
	return r;
}

auto deflate_raw(uint8_t const* src, size_t src_size, int level) noexcept
	-> CodecResult
{
	CodecResult r{};
	if(src_size > std::numeric_limits<uInt>::max())
		return fail_with(r, "Uncompressed block too large");
	z_stream stream{};
	// Same output as compress2() with its 2 byte header and 4 byte checksum
	// cut off.
	if(deflateInit2(&stream, level, Z_DEFLATED, -MAX_WBITS, 8,
	                Z_DEFAULT_STRATEGY) != Z_OK)
		return fail_with(r, "Unable to initialize deflate stream");
	struct End
	{
		z_stream& s;
		~End() { deflateEnd(&s); }
	} _{stream};
	r.data.resize(deflateBound(&stream, static_cast<uLong>(src_size)));
	stream.next_in = const_cast<Bytef*>(src);
	stream.avail_in = static_cast<uInt>(src_size);
	stream.next_out = r.data.data();
	stream.avail_out = static_cast<uInt>(r.data.size());
	if(deflate(&stream, Z_FINISH) != Z_STREAM_END)
		return fail_with(r, describe(stream, "Stream encoding failed"));
	r.data.resize(stream.total_out);
	r.success = true;
	return r;
}
