/*
 * Copyright (c) 2024, Dylam De La Torre <dyxel04@gmail.com>
 * Copyright (c) 2026, aoe-rec-tools contributors
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include <charconv> // std::from_chars
#include <cstdlib>
#include <fstream>
#include <google/protobuf/stubs/common.h>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error> // std::errc
#include <vector>

#include "anonymize.hpp"
#include "players.hpp"
#include "print_date.hpp"
#include "print_meta.hpp"
#include "print_names.hpp"
#include "rec_file.hpp"
#include "report.hpp"

namespace
{

constexpr auto IOS_IN = std::ios_base::binary | std::ios_base::in;
constexpr auto IOS_OUT =
	std::ios_base::binary | std::ios_base::out | std::ios_base::trunc;
constexpr auto DEFAULT_OUTPUT = "out.aoe2record";

auto print_usage(std::string_view exe) noexcept -> void
{
	std::cerr << "\nUsage: " << exe << " [--keep-system-chat]"
			  << " [--keep-player-chat]"
			  << " [--output FILE]"
			  << " [--rating N]"
			  << "\n       " << std::string(exe.length(), ' ')
			  << " [--report]"
			  << " [--quiet]"
			  << " [--names]"
			  << " [--date]"
			  << " [--meta]"
			  << " REC\n\n";
	std::cerr << "  --keep-system-chat\tKeep system chat messages (names "
				 "replaced).\n";
	std::cerr << "  --keep-player-chat\tKeep player chat messages (names "
				 "replaced). Might cause\n\t\t\tissues with certain "
				 "characters in some languages.\n";
	std::cerr << "  --output FILE\t\tOutput file name (default: "
			  << DEFAULT_OUTPUT << ").\n";
	std::cerr << "  --rating N\t\tRating written for every player (default: "
			  << DEFAULT_PLACEHOLDER_RATING << ").\n";
	std::cerr << "  --report\t\tPrint a JSON summary of the anonymization.\n";
	std::cerr << "  --quiet\t\tOnly print warnings and errors.\n";
	std::cerr << "  --names\t\tPrint the names of all players and exit.\n";
	std::cerr << "  --date\t\tPrint the date of the game and exit.\n";
	std::cerr << "  --meta\t\tPrint version and meta fields and exit.\n";
	std::cerr << "  REC\t\t\tRecorded game to anonymize (required).\n";
}

class CerrEventSink final : public IEventSink
{
public:
	CerrEventSink(std::string_view exe, bool quiet) noexcept
		: exe_(exe)
		, quiet_(quiet)
	{}

	auto info(std::string_view msg) noexcept -> void override
	{
		if(!quiet_)
			std::cerr << exe_ << ": " << msg << ".\n";
	}

	auto warning(std::string_view msg) noexcept -> void override
	{
		std::cerr << exe_ << ": Warning: " << msg << ".\n";
	}

private:
	std::string_view exe_;
	bool quiet_;
};

auto read_file(std::string_view exe, std::string_view fn) noexcept
	-> std::vector<uint8_t>
{
	std::ifstream f(std::string{fn}, IOS_IN);
	if(!f.is_open())
	{
		std::cerr << exe << ": Could not open file '" << fn << "'.\n";
		return {};
	}
	std::vector<uint8_t> buffer{std::istreambuf_iterator<char>(f),
	                            std::istreambuf_iterator<char>()};
	if(f.bad())
	{
		std::cerr << exe << ": Read error\n";
		return {};
	}
	return buffer;
}

auto write_file(std::string_view exe, std::string_view fn,
                std::vector<uint8_t> const& buffer) noexcept -> bool
{
	std::ofstream f(std::string{fn}, IOS_OUT);
	if(!f.is_open())
	{
		std::cerr << exe << ": Could not open file '" << fn
				  << "' for writing.\n";
		return false;
	}
	f.write(reinterpret_cast<char const*>(buffer.data()),
	        static_cast<std::streamsize>(buffer.size()));
	if(!f)
	{
		std::cerr << exe << ": Write error\n";
		return false;
	}
	return true;
}

auto print_failure(std::string_view exe, Failure const& failure) noexcept
	-> void
{
	std::cerr << exe << ": Error: " << failure.reason << ".\n";
}

} // namespace

auto main(int argc, char* argv[]) -> int
{
	GOOGLE_PROTOBUF_VERIFY_VERSION;
	struct End
	{
		~End() { google::protobuf::ShutdownProtobufLibrary(); }
	} _;
	auto const exe = std::string_view{argv[0]};
	if(argc >= 2 && std::string_view{argv[1]} == "--help")
	{
		print_usage(exe);
		return EXIT_SUCCESS;
	}
	if(argc < 2)
	{
		std::cerr << exe << ": No input file.\n";
		print_usage(exe);
		return EXIT_FAILURE;
	}
	auto const fn = std::string_view{argv[argc - 1]};
	AnonymizeOptions options{};
	std::string_view output = DEFAULT_OUTPUT;
	bool print_report_opt = false;
	bool quiet_opt = false;
	bool print_names_opt = false;
	bool print_date_opt = false;
	bool print_meta_opt = false;
	for(int a = 1; a < argc - 1; a++)
	{
		auto const arg = std::string_view{argv[a]};
		if(arg == "--keep-system-chat")
		{
			options.chat.keep_system = true;
			continue;
		}
		if(arg == "--keep-player-chat")
		{
			options.chat.keep_player = true;
			continue;
		}
		if(arg == "--output" && a + 1 < argc - 1)
		{
			output = argv[++a];
			continue;
		}
		if(arg == "--rating" && a + 1 < argc - 1)
		{
			auto const value = std::string_view{argv[++a]};
			auto const* const last = value.data() + value.size();
			auto [ptr, ec] =
				std::from_chars(value.data(), last, options.rating);
			if(ec != std::errc{} || ptr != last)
			{
				std::cerr << exe << ": Invalid rating '" << value << "'.\n";
				return EXIT_FAILURE;
			}
			continue;
		}
		if(arg == "--report")
		{
			print_report_opt = true;
			continue;
		}
		if(arg == "--quiet")
		{
			quiet_opt = true;
			continue;
		}
		if(arg == "--names")
		{
			print_names_opt = true;
			continue;
		}
		if(arg == "--date")
		{
			print_date_opt = true;
			continue;
		}
		if(arg == "--meta")
		{
			print_meta_opt = true;
			continue;
		}
		std::cerr << "Unrecognized option '" << arg << "'.\n";
		print_usage(exe);
		return EXIT_FAILURE;
	}
	auto const buffer = read_file(exe, fn);
	if(buffer.empty())
	{
		std::cerr << exe << ": File is empty or unreadable.\n";
		return EXIT_FAILURE;
	}
	auto parsed = parse_rec(buffer.data(), buffer.size());
	if(!parsed.success)
	{
		print_failure(exe, parsed.failure);
		return EXIT_FAILURE;
	}
	auto& rec = parsed.rec;
	if(print_names_opt || print_date_opt || print_meta_opt)
	{
		if(print_meta_opt)
			print_meta(rec);
		if(print_date_opt)
			print_date(rec.header.timestamp);
		if(print_names_opt)
		{
			auto const count = get_player_count(rec.header.payload);
			if(!count.success)
			{
				print_failure(exe, count.failure);
				return EXIT_FAILURE;
			}
			print_names(rec.header.payload, count.count);
		}
		return EXIT_SUCCESS;
	}
	CerrEventSink events{exe, quiet_opt};
	auto const result = anonymize(rec, options, events);
	if(!result.success)
	{
		if(print_report_opt)
			std::cout << report_json(rec, result) << '\n';
		print_failure(exe, result.failure);
		return EXIT_FAILURE;
	}
	auto written = write_rec(rec);
	if(!written.success)
	{
		print_failure(exe, written.failure);
		return EXIT_FAILURE;
	}
	// NOTE: After write_rec so that the header length is the one written.
	if(print_report_opt)
		std::cout << report_json(rec, result) << '\n';
	if(!write_file(exe, output, written.bytes))
		return EXIT_FAILURE;
	events.info("Wrote '" + std::string{output} + "'");
	return EXIT_SUCCESS;
}
