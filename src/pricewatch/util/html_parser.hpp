#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <DOM/Document.hpp>

namespace pricewatch
{
	class html_parser
	{
	public:
		typedef Arabica::DOM::Document<std::string> dom_t;

		/* Elements nested deeper are not built; their text goes to the ancestor at this depth. */
		static const size_t max_depth = 512;

		html_parser() = delete;

		/* A null document when nothing could be built from the input. */
		static dom_t parse(const std::string& src);
		static dom_t parse(std::istream& is);
	};
}
