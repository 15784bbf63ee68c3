/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_FAILURE_HPP
#define ART_FAILURE_HPP
#include <string>
#include <string_view>

enum class FailureKind
{
	NONE,
	NOT_FOUND,     // An expected byte signature is absent.
	ENCODING,      // Text payload is not valid UTF-8.
	SIZE_MISMATCH, // Fewer bytes than the fixed layout requires.
	COMPRESSION,   // zlib refused the stream.
	IO,
};

struct Failure
{
	FailureKind kind{FailureKind::NONE};
	std::string reason;
};

constexpr auto failure_kind_name(FailureKind kind) noexcept -> std::string_view
{
	switch(kind)
	{
	case FailureKind::NONE:
		return "none";
	case FailureKind::NOT_FOUND:
		return "not found";
	case FailureKind::ENCODING:
		return "encoding";
	case FailureKind::SIZE_MISMATCH:
		return "size mismatch";
	case FailureKind::COMPRESSION:
		return "compression";
	case FailureKind::IO:
		return "io";
	}
	return "unknown";
}

#endif // ART_FAILURE_HPP
