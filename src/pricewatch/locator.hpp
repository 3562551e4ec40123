#pragma once

#include <string>
#include <boost/optional.hpp>

#include <pricewatch/document.hpp>
#include <pricewatch/location_rule.hpp>

namespace pricewatch
{
	struct raw_text_match
	{
		size_t rank;
		std::string text;
	};

	/*
	 * Tries the rules in order and returns the normalized text of the first
	 * rule whose element has non-empty text. Later rules are not consulted
	 * once one succeeds. boost::none when no rule yields text.
	 */
	boost::optional<raw_text_match> locate(const document& doc, const rule_set& rules);
}
