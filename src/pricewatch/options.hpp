#pragma once

#include <iostream>
#include <string>

namespace pricewatch
{
	struct cli_options
	{
		std::string url;
		std::string file;
		double target;
		long timeout;
		std::string agent;
		std::string charset;
		bool save;
		std::string history;
		bool json;
		bool silent;
		std::string config;
	};

	/*
	 * Fills opt from the command line and, with --config, from an ini-style
	 * file whose values only apply where the command line is silent.
	 * Returns EXIT_SUCCESS when opt is ready to run, otherwise EXIT_FAILURE
	 * after writing help to out or the reason to err.
	 */
	int read_options(cli_options& opt, int argc, const char* const* argv, std::ostream& out = std::cout, std::ostream& err = std::cerr);
}
