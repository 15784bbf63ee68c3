/*
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef ART_EVENTS_HPP
#define ART_EVENTS_HPP
#include <string_view>

// Receives the progress of an anonymization pass. Fatal conditions are not
// reported here, they are returned to the caller as a `Failure`.
class IEventSink
{
public:
	virtual ~IEventSink() = default;

	virtual auto info(std::string_view msg) noexcept -> void = 0;
	virtual auto warning(std::string_view msg) noexcept -> void = 0;
};

class NullEventSink final : public IEventSink
{
public:
	auto info(std::string_view /*msg*/) noexcept -> void override {}
	auto warning(std::string_view /*msg*/) noexcept -> void override {}
};

#endif // ART_EVENTS_HPP
