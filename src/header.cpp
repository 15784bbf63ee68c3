/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "header.hpp"

#include <algorithm>
#include <cstring> // std::memcpy
#include <utility> // std::move

#include "deflate.hpp"

namespace
{

#include "read.inl"

auto unpack(uint8_t const* data, size_t size) noexcept -> ParseHeaderResult
{
	ParseHeaderResult r{};
	auto const* const sentry = data + size;
	auto const* const nul = std::find(data, sentry, uint8_t{0U});
	if(nul == sentry)
	{
		r.failure = {FailureKind::SIZE_MISMATCH,
		             "Header signature is not terminated"};
		return r;
	}
	if(static_cast<size_t>(sentry - (nul + 1)) < HEADER_SCALARS_SIZE)
	{
		r.failure = {FailureKind::SIZE_MISMATCH,
		             "Header is too short for its fixed fields"};
		return r;
	}
	auto& h = r.header;
	h.signature.assign(reinterpret_cast<char const*>(data),
	                   static_cast<size_t>(nul - data));
	auto const* ptr = nul + 1;
	h.checker = read<float>(ptr);
	h.version_minor = read<uint16_t>(ptr);
	h.version_major = read<uint16_t>(ptr);
	h.game_version = read<float>(ptr);
	h.build = read<uint32_t>(ptr);
	h.timestamp = read<int32_t>(ptr);
	h.version[0] = read<uint16_t>(ptr);
	h.version[1] = read<uint16_t>(ptr);
	h.internal_version[0] = read<uint16_t>(ptr);
	h.internal_version[1] = read<uint16_t>(ptr);
	h.payload.assign(ptr, sentry);
	r.success = true;
	return r;
}

} // namespace

auto operator==(Header const& lhs, Header const& rhs) noexcept -> bool
{
	return lhs.signature == rhs.signature && lhs.checker == rhs.checker &&
	       lhs.version_minor == rhs.version_minor &&
	       lhs.version_major == rhs.version_major &&
	       lhs.game_version == rhs.game_version && lhs.build == rhs.build &&
	       lhs.timestamp == rhs.timestamp && lhs.version == rhs.version &&
	       lhs.internal_version == rhs.internal_version &&
	       lhs.payload == rhs.payload;
}

auto operator!=(Header const& lhs, Header const& rhs) noexcept -> bool
{
	return !(lhs == rhs);
}

auto parse_header(uint8_t const* data, size_t size, bool compressed) noexcept
	-> ParseHeaderResult
{
	if(!compressed)
		return unpack(data, size);
	auto inflated = inflate_raw(data, size);
	if(!inflated.success)
	{
		ParseHeaderResult r{};
		r.failure = std::move(inflated.failure);
		return r;
	}
	return unpack(inflated.data.data(), inflated.data.size());
}

auto serialize_header(Header const& header) noexcept -> std::vector<uint8_t>
{
	std::vector<uint8_t> out;
	out.reserve(header.signature.size() + 1U + HEADER_SCALARS_SIZE +
	            header.payload.size());
	out.insert(out.end(), header.signature.begin(), header.signature.end());
	out.push_back(0U);
	append(out, header.checker);
	append(out, header.version_minor);
	append(out, header.version_major);
	append(out, header.game_version);
	append(out, header.build);
	append(out, header.timestamp);
	append(out, header.version[0]);
	append(out, header.version[1]);
	append(out, header.internal_version[0]);
	append(out, header.internal_version[1]);
	out.insert(out.end(), header.payload.begin(), header.payload.end());
	return out;
}

auto pack_header(Header const& header) noexcept -> PackHeaderResult
{
	PackHeaderResult r{};
	auto const raw = serialize_header(header);
	auto deflated = deflate_raw(raw.data(), raw.size());
	if(!deflated.success)
	{
		r.failure = std::move(deflated.failure);
		return r;
	}
	r.bytes = std::move(deflated.data);
	r.success = true;
	return r;
}
